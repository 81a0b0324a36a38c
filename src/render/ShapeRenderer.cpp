#include "render/ShapeRenderer.h"
#include "utils/ColorUtils.h"
#include "utils/SvgPathParser.h"

#include <QDebug>
#include <QPainter>
#include <QPainterPathStroker>

namespace {

// Zero or negative sizes fall back to the default box like unset ones
qreal boxWidth(const Layer& layer)
{
    return layer.width.value_or(0.0) > 0.0 ? *layer.width : LayerDefaults::kShapeSize;
}

qreal boxHeight(const Layer& layer)
{
    return layer.height.value_or(0.0) > 0.0 ? *layer.height : LayerDefaults::kShapeSize;
}

Qt::FillRule toFillRule(const std::optional<QString>& rule)
{
    if (rule && *rule == QLatin1String("evenodd")) {
        return Qt::OddEvenFill;
    }
    return Qt::WindingFill;
}

bool hasUsableViewBox(const ShapeData& shapeData)
{
    return shapeData.viewBox.width() > 0 && shapeData.viewBox.height() > 0;
}

} // namespace

ShapeRenderer::ShapeRenderer(int cacheSize, const ShadowRenderer* shadowRenderer)
    : m_pathCache(cacheSize)
    , m_shadowRenderer(shadowRenderer)
{
}

ShapeRenderer::PathPtr ShapeRenderer::getPath2D(const QString& pathData)
{
    if (PathPtr* cached = m_pathCache.get(pathData)) {
        return *cached;
    }

    bool ok = true;
    QPainterPath parsed = SvgPathParser::parse(pathData, &ok);
    if (!ok) {
        qWarning() << "ShapeRenderer: Malformed path data, drawing parsed prefix";
    }
    PathPtr path = std::make_shared<const QPainterPath>(std::move(parsed));
    m_pathCache.put(pathData, path);
    return path;
}

QTransform ShapeRenderer::shapeTransform(const Layer& layer, const QRectF& viewBox,
                                         const RenderScale& scale)
{
    const qreal width = boxWidth(layer);
    const qreal height = boxHeight(layer);

    QTransform transform;
    transform.translate(layer.x * scale.sx, layer.y * scale.sy);
    if (layer.rotation && *layer.rotation != 0.0) {
        const qreal cx = width * scale.sx / 2.0;
        const qreal cy = height * scale.sy / 2.0;
        transform.translate(cx, cy);
        transform.rotate(*layer.rotation);
        transform.translate(-cx, -cy);
    }
    transform.scale(width / viewBox.width() * scale.sx, height / viewBox.height() * scale.sy);
    transform.translate(-viewBox.x(), -viewBox.y());
    return transform;
}

qreal ShapeRenderer::getOpacity(std::optional<qreal> specificOpacity, std::optional<qreal> layerOpacity)
{
    if (!specificOpacity && !layerOpacity) {
        return 1.0;
    }
    if (!layerOpacity) {
        return *specificOpacity;
    }
    if (!specificOpacity) {
        return *layerOpacity;
    }
    return *specificOpacity * *layerOpacity;
}

void ShapeRenderer::drawSubPath(QPainter& painter, const QPainterPath& path,
                                const std::optional<QString>& fill, const std::optional<QString>& stroke,
                                qreal strokeWidth, const Layer& layer, bool strokeOnly)
{
    auto resolve = [&layer](const QString& value) {
        if (value == QLatin1String("currentColor")) {
            return layer.stroke.value_or(layer.color.value_or(QString::fromLatin1(LayerDefaults::kStrokeColor)));
        }
        return value;
    };

    if (!strokeOnly && fill && !ColorUtils::isNoneOrTransparent(*fill)) {
        const QColor color = ColorUtils::parseColor(resolve(*fill));
        if (color.isValid()) {
            painter.save();
            painter.setOpacity(painter.opacity() * getOpacity(layer.fillOpacity, layer.opacity));
            painter.fillPath(path, color);
            painter.restore();
        } else {
            qWarning() << "ShapeRenderer: Invalid fill color" << *fill << "on layer" << layer.id;
        }
    }

    if (stroke && !ColorUtils::isNoneOrTransparent(*stroke) && strokeWidth > 0) {
        const QColor color = ColorUtils::parseColor(resolve(*stroke));
        if (color.isValid()) {
            QPen pen(color, strokeWidth);
            if (strokeOnly) {
                pen.setCapStyle(Qt::RoundCap);
                pen.setJoinStyle(Qt::RoundJoin);
            }
            painter.save();
            painter.setOpacity(painter.opacity() * getOpacity(layer.strokeOpacity, layer.opacity));
            painter.strokePath(path, pen);
            painter.restore();
        } else {
            qWarning() << "ShapeRenderer: Invalid stroke color" << *stroke << "on layer" << layer.id;
        }
    }
}

void ShapeRenderer::render(QPainter& painter, const ShapeData* shapeData, const Layer& layer,
                           const RenderScale& scale)
{
    if (!shapeData) {
        qWarning() << "ShapeRenderer: Missing shape data for layer" << layer.id;
        return;
    }
    if (!hasUsableViewBox(*shapeData) || (shapeData->path.isEmpty() && !shapeData->isMultiPath())) {
        qWarning() << "ShapeRenderer: Invalid shape data" << shapeData->id << "for layer" << layer.id;
        return;
    }

    const QTransform transform = shapeTransform(layer, shapeData->viewBox, scale);
    const qreal fitScale = qMin(boxWidth(layer) / shapeData->viewBox.width() * scale.sx,
                                boxHeight(layer) / shapeData->viewBox.height() * scale.sy);
    const qreal defaultStroke = shapeData->strokeOnly ? 2.0 : 1.0;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setTransform(transform, true);

    if (shapeData->isMultiPath()) {
        for (const ShapeSubPath& part : shapeData->paths) {
            QPainterPath path = *getPath2D(part.path);
            path.setFillRule(toFillRule(part.fillRule ? part.fillRule : shapeData->fillRule));
            const std::optional<QString> fill = part.fill ? part.fill : layer.fill;
            const std::optional<QString> stroke = part.stroke ? part.stroke : layer.stroke;
            // Part stroke widths are authored in viewBox units
            const qreal width = part.strokeWidth
                ? *part.strokeWidth
                : layer.strokeWidth.value_or(defaultStroke) * scale.avg / fitScale;
            drawSubPath(painter, path, fill, stroke, width, layer, shapeData->strokeOnly);
        }
    } else {
        QPainterPath path = *getPath2D(shapeData->path);
        path.setFillRule(toFillRule(shapeData->fillRule));
        const qreal width = layer.strokeWidth.value_or(defaultStroke) * scale.avg / fitScale;
        drawSubPath(painter, path, layer.fill, layer.stroke, width, layer, shapeData->strokeOnly);
    }

    painter.restore();
}

QPainterPath ShapeRenderer::outlineFor(const ShapeData& shapeData)
{
    QPainterPath outline;
    if (shapeData.isMultiPath()) {
        for (const ShapeSubPath& part : shapeData.paths) {
            outline.addPath(*getPath2D(part.path));
        }
    } else {
        outline = *getPath2D(shapeData.path);
    }
    outline.setFillRule(toFillRule(shapeData.fillRule));
    return outline;
}

void ShapeRenderer::renderWithEffects(QPainter& painter, const ShapeData* shapeData, const Layer& layer,
                                      const RenderScale& scale, const RenderScale& shadowScale)
{
    if (shapeData && hasUsableViewBox(*shapeData) && ShadowRenderer::hasShadowEnabled(layer)) {
        const ShadowRenderer& shadows = m_shadowRenderer ? *m_shadowRenderer : m_defaultShadowRenderer;
        QPainterPath outline = outlineFor(*shapeData);
        if (shapeData->strokeOnly) {
            QPainterPathStroker stroker;
            stroker.setWidth(layer.strokeWidth.value_or(2.0));
            outline = stroker.createStroke(outline);
        }
        const QPainterPath deviceOutline = shapeTransform(layer, shapeData->viewBox, scale).map(outline);
        shadows.drawPathShadow(painter, deviceOutline, shadows.resolve(layer, shadowScale));
        shadows.clearShadow(painter);
    }
    render(painter, shapeData, layer, scale);
}

bool ShapeRenderer::hitTest(const Layer& layer, const ShapeData* shapeData, qreal px, qreal py)
{
    if (!shapeData || !hasUsableViewBox(*shapeData)) {
        return false;
    }

    const QRectF bounds(layer.x, layer.y,
                        boxWidth(layer),
                        boxHeight(layer));
    if (px < bounds.left() || px > bounds.right() || py < bounds.top() || py > bounds.bottom()) {
        return false;
    }

    bool invertible = false;
    const QTransform inverse = shapeTransform(layer, shapeData->viewBox).inverted(&invertible);
    if (!invertible) {
        return false;
    }
    const QPointF local = inverse.map(QPointF(px, py));

    const QPainterPath outline = outlineFor(*shapeData);
    if (shapeData->strokeOnly) {
        QPainterPathStroker stroker;
        stroker.setWidth(qMax<qreal>(layer.strokeWidth.value_or(2.0), 1.0));
        return stroker.createStroke(outline).contains(local);
    }
    return outline.contains(local);
}

void ShapeRenderer::clearCache()
{
    m_pathCache.clear();
}

int ShapeRenderer::getCacheSize() const
{
    return m_pathCache.size();
}

int ShapeRenderer::cacheCapacity() const
{
    return m_pathCache.capacity();
}

void ShapeRenderer::setCacheCapacity(int capacity)
{
    m_pathCache.setCapacity(capacity);
}

void ShapeRenderer::setShadowRenderer(const ShadowRenderer* shadowRenderer)
{
    m_shadowRenderer = shadowRenderer;
}
