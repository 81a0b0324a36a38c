#include "render/ShadowRenderer.h"
#include "layers/LayerDefaults.h"
#include "utils/ColorUtils.h"

#include <QPainter>
#include <QPainterPathStroker>
#include <cmath>

bool ShadowRenderer::hasShadowEnabled(const Layer& layer)
{
    if (isTruthyFlag(layer.shadow)) {
        return true;
    }
    if (isFalsyFlag(layer.shadow)) {
        return false;
    }

    // Legacy layers carry shadow properties without the flag
    if (layer.shadowColor && !layer.shadowColor->isEmpty()) {
        const QColor c = ColorUtils::parseColor(*layer.shadowColor);
        if (c.isValid() && c.alpha() > 0) {
            return true;
        }
    }
    if (layer.shadowBlur && *layer.shadowBlur > 0) {
        return true;
    }
    if ((layer.shadowOffsetX && *layer.shadowOffsetX != 0)
        || (layer.shadowOffsetY && *layer.shadowOffsetY != 0)) {
        return true;
    }
    return false;
}

ShadowParams ShadowRenderer::resolve(const Layer& layer, const RenderScale& scale) const
{
    ShadowParams params;

    QColor color;
    if (layer.shadowColor) {
        color = ColorUtils::parseColor(*layer.shadowColor);
    }
    if (!color.isValid()) {
        color = ColorUtils::parseColor(QString::fromLatin1(LayerDefaults::kRenderShadowColor));
    }
    params.color = color;

    params.blur = qBound(0.0, layer.shadowBlur.value_or(LayerDefaults::kShadowBlur),
                         LayerDefaults::kMaxShadowBlur) * scale.avg;
    params.offsetX = layer.shadowOffsetX.value_or(LayerDefaults::kShadowOffsetX) * scale.sx;
    params.offsetY = layer.shadowOffsetY.value_or(LayerDefaults::kShadowOffsetY) * scale.sy;
    if (layer.shadowSpread && *layer.shadowSpread > 0) {
        params.spread = *layer.shadowSpread * scale.avg;
    }
    return params;
}

void ShadowRenderer::drawPathShadow(QPainter& painter, const QPainterPath& path,
                                    const ShadowParams& params) const
{
    if (path.isEmpty() || !params.color.isValid() || params.color.alpha() == 0) {
        return;
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.translate(params.offsetX, params.offsetY);

    QPainterPath shape = path;
    if (params.spread > 0) {
        QPainterPathStroker stroker;
        stroker.setWidth(params.spread * 2.0);
        stroker.setJoinStyle(Qt::RoundJoin);
        shape = shape.united(stroker.createStroke(path));
    }

    const int steps = qBound(1, static_cast<int>(std::ceil(params.blur / 2.0)), kMaxShadowSteps);
    const int baseAlpha = params.color.alpha();

    // Wider layers first; overlapping layers darken toward the shape edge
    for (int i = steps; i >= 1; --i) {
        QColor layerColor = params.color;
        layerColor.setAlpha(qMax(1, baseAlpha / steps));

        const qreal width = params.blur * i / steps;
        if (width > 0) {
            QPainterPathStroker stroker;
            stroker.setWidth(width);
            stroker.setJoinStyle(Qt::RoundJoin);
            stroker.setCapStyle(Qt::RoundCap);
            painter.fillPath(shape.united(stroker.createStroke(shape)), layerColor);
        } else {
            painter.fillPath(shape, layerColor);
        }
    }

    painter.restore();
}

void ShadowRenderer::drawRectShadow(QPainter& painter, const QRectF& rect, qreal cornerRadius,
                                    const ShadowParams& params) const
{
    QPainterPath path;
    if (cornerRadius > 0) {
        path.addRoundedRect(rect, cornerRadius, cornerRadius);
    } else {
        path.addRect(rect);
    }
    drawPathShadow(painter, path, params);
}
