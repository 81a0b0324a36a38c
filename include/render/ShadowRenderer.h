#ifndef SHADOWRENDERER_H
#define SHADOWRENDERER_H

#include <QColor>
#include <QPainterPath>
#include <QRectF>

#include "layers/Layer.h"
#include "render/RenderTypes.h"

class QPainter;

/**
 * @brief Resolved drop-shadow parameters in device units.
 */
struct ShadowParams {
    QColor color;
    qreal blur = 0.0;
    qreal offsetX = 0.0;
    qreal offsetY = 0.0;
    qreal spread = 0.0;
};

/**
 * @brief Draws soft drop shadows behind layer geometry.
 *
 * QPainter has no shadow state, so a shadow is painted as a stack of
 * offset copies of the shape, each wider and fainter than the last.
 * Callers draw the shadow first and the shape on top of it.
 */
class ShadowRenderer
{
public:
    ShadowRenderer() = default;

    /**
     * @brief Whether @p layer asks for a drop shadow.
     *
     * true/"true"/1/"1" enable and false/"false"/0/"0" disable. Without an
     * explicit flag a non-transparent shadowColor, a positive shadowBlur or
     * a non-zero offset enables the shadow.
     */
    static bool hasShadowEnabled(const Layer& layer);

    ShadowParams resolve(const Layer& layer, const RenderScale& scale = RenderScale()) const;

    void drawPathShadow(QPainter& painter, const QPainterPath& path, const ShadowParams& params) const;
    void drawRectShadow(QPainter& painter, const QRectF& rect, qreal cornerRadius,
                        const ShadowParams& params) const;

    // Shadows leave no painter state behind; kept for symmetry with draw calls
    void clearShadow(QPainter& painter) const { Q_UNUSED(painter); }

private:
    static constexpr int kMaxShadowSteps = 8;
};

#endif // SHADOWRENDERER_H
