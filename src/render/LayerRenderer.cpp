#include "render/LayerRenderer.h"
#include "render/GradientBuilder.h"
#include "render/ShapeDataProvider.h"
#include "utils/ColorUtils.h"
#include "utils/PolygonGeometry.h"

#include <QDebug>
#include <QPainter>
#include <QPainterPathStroker>
#include <QTransform>
#include <QtMath>
#include <cmath>

namespace {

QColor strokeColorOf(const Layer& layer)
{
    const QString name = layer.stroke.value_or(layer.color.value_or(QString::fromLatin1(LayerDefaults::kStrokeColor)));
    if (ColorUtils::isNoneOrTransparent(name)) {
        return QColor();
    }
    return ColorUtils::parseColor(name);
}

void rotateAbout(QPainter& painter, const QPointF& center, qreal degrees)
{
    painter.translate(center);
    painter.rotate(degrees);
    painter.translate(-center);
}

} // namespace

LayerRenderer::LayerRenderer(int pathCacheSize, int imageCacheSize)
    : m_shapeRenderer(pathCacheSize, &m_shadowRenderer)
    , m_textBoxRenderer(&m_shadowRenderer)
    , m_imageRenderer(std::make_unique<ImageLayerRenderer>())
{
    m_imageRenderer->setCacheCapacity(imageCacheSize);
    m_imageRenderer->setShadowRenderer(&m_shadowRenderer);
}

LayerRenderer::~LayerRenderer()
{
    m_imageRenderer->destroy();
}

void LayerRenderer::setShapeDataProvider(const IShapeDataProvider* provider)
{
    m_shapeProvider = provider;
}

void LayerRenderer::renderLayers(QPainter& painter, const QVector<Layer>& layers,
                                 const LayerRenderOptions& options)
{
    for (const Layer& layer : layers) {
        if (!layer.visible) {
            continue;
        }
        if (!renderLayer(painter, layer, options)) {
            qWarning() << "LayerRenderer: Skipped layer" << layer.id << "of type" << layerTypeName(layer.type);
        }
    }
}

bool LayerRenderer::renderLayer(QPainter& painter, const Layer& layer, const LayerRenderOptions& options)
{
    switch (layer.type) {
    case LayerType::Rectangle:
    case LayerType::Circle:
    case LayerType::Ellipse:
    case LayerType::Polygon:
    case LayerType::Star:
    case LayerType::Path: {
        const QPainterPath path = shapePath(layer);
        if (path.isEmpty()) {
            return false;
        }
        drawVectorShape(painter, layer, path, options);
        return true;
    }
    case LayerType::Line:
    case LayerType::Arrow:
        if (!layer.x1 || !layer.y1 || !layer.x2 || !layer.y2) {
            return false;
        }
        drawLine(painter, layer, options);
        return true;
    case LayerType::Text:
    case LayerType::TextBox:
    case LayerType::Callout:
        m_textBoxRenderer.draw(painter, layer, options.scale, options.shadowScale);
        return true;
    case LayerType::Image:
        m_imageRenderer->draw(painter, layer, options.scale, options.shadowScale);
        return true;
    case LayerType::CustomShape:
        return drawCustomShape(painter, layer, options);
    case LayerType::Group:
        // Children are separate entries in the list
        return true;
    }
    return false;
}

QPainterPath LayerRenderer::shapePath(const Layer& layer)
{
    QPainterPath path;
    const QPointF origin(layer.x, layer.y);

    switch (layer.type) {
    case LayerType::Rectangle: {
        const QRectF rect(layer.x, layer.y, layer.width.value_or(0.0), layer.height.value_or(0.0));
        const qreal radius = qMin(layer.cornerRadius.value_or(0.0), qMin(rect.width(), rect.height()) / 2.0);
        if (radius > 0) {
            path.addRoundedRect(rect, radius, radius);
        } else {
            path.addRect(rect);
        }
        break;
    }
    case LayerType::Circle: {
        const qreal r = layer.radius.value_or(0.0);
        path.addEllipse(origin, r, r);
        break;
    }
    case LayerType::Ellipse:
        path.addEllipse(origin, layer.radiusX.value_or(0.0), layer.radiusY.value_or(0.0));
        break;
    case LayerType::Polygon:
        path.addPolygon(PolygonGeometry::regularPolygon(origin, layer.radius.value_or(0.0),
                                                        layer.sides.value_or(LayerDefaults::kPolygonSides)));
        path.closeSubpath();
        break;
    case LayerType::Star: {
        const qreal outer = layer.outerRadius.value_or(layer.radius.value_or(0.0));
        const qreal inner = layer.innerRadius.value_or(outer * LayerDefaults::kStarInnerRatio);
        path.addPolygon(PolygonGeometry::star(origin, outer, inner,
                                              layer.starPoints.value_or(LayerDefaults::kStarPoints)));
        path.closeSubpath();
        break;
    }
    case LayerType::Path:
        if (layer.points.size() < 2) {
            break;
        }
        path.moveTo(layer.points.first());
        for (int i = 1; i < layer.points.size(); ++i) {
            path.lineTo(layer.points.at(i));
        }
        if (layer.closed) {
            path.closeSubpath();
        }
        break;
    default:
        break;
    }
    return path;
}

QPolygonF LayerRenderer::arrowHead(const QPointF& from, const QPointF& tip, qreal size)
{
    const qreal angle = qAtan2(tip.y() - from.y(), tip.x() - from.x());
    const qreal flank = M_PI / 6.0;

    QPolygonF head;
    head << tip
         << QPointF(tip.x() - size * qCos(angle - flank), tip.y() - size * qSin(angle - flank))
         << QPointF(tip.x() - size * qCos(angle + flank), tip.y() - size * qSin(angle + flank));
    return head;
}

void LayerRenderer::drawVectorShape(QPainter& painter, const Layer& layer, const QPainterPath& path,
                                    const LayerRenderOptions& options)
{
    const RenderScale& scale = options.scale;
    const QPainterPath devicePath = QTransform::fromScale(scale.sx, scale.sy).map(path);
    const QRectF canvasBounds = path.boundingRect();

    const bool isOpenPath = layer.type == LayerType::Path && !layer.closed;
    const bool hasFill = !isOpenPath
        && (GradientBuilder::hasGradient(layer)
            || (layer.fill && !ColorUtils::isNoneOrTransparent(*layer.fill)));
    const QColor strokeColor = strokeColorOf(layer);
    const qreal strokeWidth = layer.strokeWidth.value_or(LayerDefaults::kStrokeWidth) * scale.avg;
    const bool hasStroke = strokeColor.isValid() && strokeWidth > 0;

    QPen pen(strokeColor, strokeWidth);
    pen.setJoinStyle(Qt::RoundJoin);
    pen.setCapStyle(Qt::RoundCap);

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    if (layer.rotation && *layer.rotation != 0.0) {
        rotateAbout(painter, devicePath.boundingRect().center(), *layer.rotation);
    }

    if (ShadowRenderer::hasShadowEnabled(layer) && (hasFill || hasStroke)) {
        QPainterPath outline = devicePath;
        if (!hasFill) {
            QPainterPathStroker stroker(pen);
            outline = stroker.createStroke(devicePath);
        }
        m_shadowRenderer.drawPathShadow(painter, outline, m_shadowRenderer.resolve(layer, options.shadowScale));
        m_shadowRenderer.clearShadow(painter);
    }

    if (hasFill) {
        painter.save();
        painter.setOpacity(painter.opacity() * ShapeRenderer::getOpacity(layer.fillOpacity, layer.opacity));
        painter.setPen(Qt::NoPen);
        painter.setBrush(Qt::NoBrush);
        GradientBuilder::applyFill(painter, layer, canvasBounds, scale.avg);
        if (painter.brush().style() != Qt::NoBrush) {
            painter.drawPath(devicePath);
        }
        painter.restore();
    }

    if (hasStroke) {
        painter.save();
        painter.setOpacity(painter.opacity() * ShapeRenderer::getOpacity(layer.strokeOpacity, layer.opacity));
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
        painter.drawPath(devicePath);
        painter.restore();
    }

    painter.restore();
}

void LayerRenderer::drawLine(QPainter& painter, const Layer& layer, const LayerRenderOptions& options)
{
    const RenderScale& scale = options.scale;
    const QPointF start(*layer.x1 * scale.sx, *layer.y1 * scale.sy);
    const QPointF end(*layer.x2 * scale.sx, *layer.y2 * scale.sy);

    const QColor strokeColor = strokeColorOf(layer);
    const qreal strokeWidth = layer.strokeWidth.value_or(LayerDefaults::kStrokeWidth) * scale.avg;
    if (!strokeColor.isValid() || strokeWidth <= 0) {
        return;
    }

    QPen pen(strokeColor, strokeWidth, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);

    QPainterPath shaft;
    shaft.moveTo(start);
    shaft.lineTo(end);

    QPainterPath heads;
    if (layer.type == LayerType::Arrow) {
        const QString style = layer.arrowStyle.value_or(QString::fromLatin1(LayerDefaults::kArrowStyle));
        const qreal size = layer.arrowSize.value_or(LayerDefaults::kArrowSize) * scale.avg;
        if (style != QLatin1String("none") && start != end) {
            heads.addPolygon(arrowHead(start, end, size));
            heads.closeSubpath();
            if (style == QLatin1String("double")) {
                heads.addPolygon(arrowHead(end, start, size));
                heads.closeSubpath();
            }
        }
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setOpacity(painter.opacity() * ShapeRenderer::getOpacity(layer.strokeOpacity, layer.opacity));
    if (layer.rotation && *layer.rotation != 0.0) {
        rotateAbout(painter, (start + end) / 2.0, *layer.rotation);
    }

    if (ShadowRenderer::hasShadowEnabled(layer)) {
        QPainterPathStroker stroker(pen);
        const QPainterPath outline = stroker.createStroke(shaft).united(heads);
        m_shadowRenderer.drawPathShadow(painter, outline, m_shadowRenderer.resolve(layer, options.shadowScale));
        m_shadowRenderer.clearShadow(painter);
    }

    painter.strokePath(shaft, pen);

    if (!heads.isEmpty()) {
        QColor headFill = strokeColor;
        if (layer.fill && !ColorUtils::isNoneOrTransparent(*layer.fill)) {
            const QColor parsed = ColorUtils::parseColor(*layer.fill);
            if (parsed.isValid()) {
                headFill = parsed;
            }
        }
        painter.setPen(pen);
        painter.setBrush(headFill);
        painter.drawPath(heads);
    }

    painter.restore();
}

bool LayerRenderer::drawCustomShape(QPainter& painter, const Layer& layer, const LayerRenderOptions& options)
{
    if (!m_shapeProvider) {
        qWarning() << "LayerRenderer: No shape data provider for custom shape" << layer.shapeId;
        return false;
    }
    const std::optional<ShapeData> shape = m_shapeProvider->getPathById(layer.shapeId);
    if (!shape) {
        qWarning() << "LayerRenderer: Unknown shape id" << layer.shapeId;
        return false;
    }
    m_shapeRenderer.renderWithEffects(painter, &*shape, layer, options.scale, options.shadowScale);
    return true;
}
