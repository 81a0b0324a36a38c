#ifndef GRADIENTBUILDER_H
#define GRADIENTBUILDER_H

#include <QGradient>
#include <QJsonValue>
#include <QMap>
#include <QRectF>
#include <QStringList>
#include <optional>

#include "layers/Layer.h"

class QPainter;

struct GradientValidation {
    bool valid = true;
    QStringList errors;
};

/**
 * @brief Turns declarative GradientSpec records into QGradient brushes.
 *
 * Gradients are anchored to a bounds rectangle in canvas units and scaled
 * into device units. Colour stops are sorted by offset and clamped to
 * [0, 1] on a private copy; the layer's spec is never modified.
 */
class GradientBuilder
{
public:
    GradientBuilder() = delete;

    /**
     * @brief True when the layer carries a usable gradient: a linear or
     * radial type with at least two colour stops.
     */
    static bool hasGradient(const Layer& layer);

    /**
     * @brief Build the gradient for @p layer over @p bounds.
     *
     * Linear gradients run through the bounds centre along angle (degrees,
     * default 0) and span half the bounds diagonal on each side. Radial
     * gradients centre on centerX/centerY (fractions, default 0.5) with a
     * radius of radius * max(width, height) (default fraction 0.5).
     * Stops whose colour cannot be parsed are logged and skipped.
     *
     * @return std::nullopt when the layer has no usable gradient
     */
    static std::optional<QGradient> createGradient(const Layer& layer, const QRectF& bounds,
                                                   qreal scale = 1.0);

    /**
     * @brief Set the painter brush for filling @p layer.
     *
     * Uses the gradient when there is one and returns true. Otherwise sets
     * the solid fill colour, unless fill is "none"/"transparent", and
     * returns false.
     */
    static bool applyFill(QPainter& painter, const Layer& layer, const QRectF& bounds,
                          qreal scale = 1.0);

    static GradientValidation validate(const GradientSpec& spec);
    static GradientValidation validate(const QJsonValue& value);

    static std::optional<GradientSpec> clone(const std::optional<GradientSpec>& spec);

    /**
     * @brief Two-stop starting point for the gradient editor.
     *
     * Linear presets run top to bottom (angle 90). Radial presets use a
     * 0.7 radius, which is intentionally fuller than createGradient's 0.5
     * fallback.
     */
    static GradientSpec createDefaultGradient(const QString& type,
                                              const QString& startColor = QStringLiteral("#ffffff"),
                                              const QString& endColor = QStringLiteral("#000000"));

    static QMap<QString, GradientSpec> getPresets();

    static constexpr qreal kDefaultRadius = 0.5;
    static constexpr qreal kDefaultCenter = 0.5;
    static constexpr qreal kPresetRadialRadius = 0.7;
    static constexpr qreal kPresetLinearAngle = 90.0;
};

#endif // GRADIENTBUILDER_H
