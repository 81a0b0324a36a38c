#ifndef SHAPEFACTORY_H
#define SHAPEFACTORY_H

#include <QPointF>
#include <QString>
#include <optional>

#include "layers/Layer.h"
#include "layers/LayerDefaults.h"
#include "style/StyleStore.h"

/**
 * @brief Per-type creation options.
 */
struct ShapeOptions {
    std::optional<int> sides;       // polygon
    std::optional<int> points;      // star
    std::optional<QString> text;    // text
};

/**
 * @brief Creates new layers at a point and resizes them during a drag.
 *
 * New layers start zero-sized at the press point and take their style
 * from the attached StyleStore (or the default style when none is set).
 * The update functions mutate a layer in place from the drag start and
 * current pointer positions.
 */
class ShapeFactory
{
public:
    explicit ShapeFactory(const StyleStore* styleStore = nullptr);

    void setStyleStore(const StyleStore* styleStore) { m_styleStore = styleStore; }
    const StyleStore* styleStore() const { return m_styleStore; }

    /**
     * @brief Create a layer of the named type.
     *
     * "pen" is accepted as an alias of "path".
     * @return std::nullopt for a type the factory cannot create
     */
    std::optional<Layer> create(const QString& type, const QPointF& point,
                                const ShapeOptions& options = ShapeOptions()) const;

    /**
     * @brief create() plus a generated "layer_" id unique within the process.
     */
    std::optional<Layer> createWithId(const QString& type, const QPointF& point,
                                      const ShapeOptions& options = ShapeOptions()) const;

    Layer createPath(const QPointF& point) const;
    Layer createRectangle(const QPointF& point) const;
    Layer createCircle(const QPointF& point) const;
    Layer createEllipse(const QPointF& point) const;
    Layer createLine(const QPointF& point) const;
    Layer createArrow(const QPointF& point) const;
    Layer createPolygon(const QPointF& point, std::optional<int> sides = std::nullopt) const;
    Layer createStar(const QPointF& point, std::optional<int> points = std::nullopt) const;
    Layer createText(const QPointF& point, const QString& text = QString()) const;
    Layer createTextBox(const QPointF& point) const;
    Layer createCallout(const QPointF& point) const;

    // Drag updates
    static void updateRectangle(Layer& layer, const QPointF& start, const QPointF& current);
    static void updateCircle(Layer& layer, const QPointF& start, const QPointF& current);
    static void updateEllipse(Layer& layer, const QPointF& start, const QPointF& current);
    static void updateLine(Layer& layer, const QPointF& current);
    static void updatePolygon(Layer& layer, const QPointF& start, const QPointF& current);
    static void updateStar(Layer& layer, const QPointF& start, const QPointF& current,
                           qreal innerRatio = kStarInnerRatio);
    // updateRectangle() plus a tail tip below the box
    static void updateCallout(Layer& layer, const QPointF& start, const QPointF& current);

    /**
     * @brief Reject accidental zero-size layers.
     *
     * Rectangle, textbox and callout need both sides > 1; circle, polygon
     * and star a radius > 0; ellipse both radii > 0; line and arrow a
     * non-zero length; path at least two points; text non-empty text.
     * Other types are always accepted.
     */
    static bool hasValidSize(const Layer& layer);

    static QString generateId();

    static constexpr qreal kStarInnerRatio = LayerDefaults::kStarInnerRatio;
    static constexpr qreal kMinBoxSize = 1.0;

private:
    ToolStyle currentStyle() const;
    void applyStroke(Layer& layer, const ToolStyle& style) const;
    void applyShadow(Layer& layer, const ToolStyle& style) const;
    void applyTextDefaults(Layer& layer, const ToolStyle& style) const;

    const StyleStore* m_styleStore = nullptr;
};

#endif // SHAPEFACTORY_H
