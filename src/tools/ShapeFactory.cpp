#include "tools/ShapeFactory.h"
#include "layers/LayerDefaults.h"
#include "utils/ColorUtils.h"

#include <QDateTime>
#include <QLineF>
#include <QUuid>
#include <atomic>

ShapeFactory::ShapeFactory(const StyleStore* styleStore)
    : m_styleStore(styleStore)
{
}

ToolStyle ShapeFactory::currentStyle() const
{
    return m_styleStore ? m_styleStore->get() : StyleStore::defaultStyle();
}

void ShapeFactory::applyStroke(Layer& layer, const ToolStyle& style) const
{
    layer.stroke = style.color;
    layer.strokeWidth = style.strokeWidth;
}

void ShapeFactory::applyShadow(Layer& layer, const ToolStyle& style) const
{
    layer.shadow = style.shadow;
    layer.shadowColor = style.shadowColor;
    layer.shadowBlur = style.shadowBlur;
    layer.shadowOffsetX = style.shadowOffsetX;
    layer.shadowOffsetY = style.shadowOffsetY;
}

void ShapeFactory::applyTextDefaults(Layer& layer, const ToolStyle& style) const
{
    layer.text = QString();
    layer.fontSize = style.fontSize;
    layer.fontFamily = style.fontFamily;
    layer.fontWeight = QString::fromLatin1(LayerDefaults::kFontWeight);
    layer.fontStyle = QString::fromLatin1(LayerDefaults::kFontStyle);
    layer.color = style.color;
    layer.textAlign = QStringLiteral("left");
    layer.verticalAlign = QStringLiteral("top");
    layer.lineHeight = LayerDefaults::kLineHeight;
    layer.textStrokeWidth = LayerDefaults::kTextStrokeWidth;
    layer.textStrokeColor = QString::fromLatin1(LayerDefaults::kTextStrokeColor);
    layer.textShadow = false;
    layer.textShadowColor = QString::fromLatin1(LayerDefaults::kTextShadowColor);
    layer.textShadowBlur = LayerDefaults::kTextShadowBlur;
    layer.textShadowOffsetX = LayerDefaults::kTextShadowOffsetX;
    layer.textShadowOffsetY = LayerDefaults::kTextShadowOffsetY;
}

std::optional<Layer> ShapeFactory::create(const QString& type, const QPointF& point,
                                          const ShapeOptions& options) const
{
    if (type == QLatin1String("path") || type == QLatin1String("pen")) {
        return createPath(point);
    }
    if (type == QLatin1String("rectangle")) {
        return createRectangle(point);
    }
    if (type == QLatin1String("circle")) {
        return createCircle(point);
    }
    if (type == QLatin1String("ellipse")) {
        return createEllipse(point);
    }
    if (type == QLatin1String("line")) {
        return createLine(point);
    }
    if (type == QLatin1String("arrow")) {
        return createArrow(point);
    }
    if (type == QLatin1String("polygon")) {
        return createPolygon(point, options.sides);
    }
    if (type == QLatin1String("star")) {
        return createStar(point, options.points);
    }
    if (type == QLatin1String("text")) {
        return createText(point, options.text.value_or(QString()));
    }
    if (type == QLatin1String("textbox")) {
        return createTextBox(point);
    }
    if (type == QLatin1String("callout")) {
        return createCallout(point);
    }
    return std::nullopt;
}

std::optional<Layer> ShapeFactory::createWithId(const QString& type, const QPointF& point,
                                                const ShapeOptions& options) const
{
    std::optional<Layer> layer = create(type, point, options);
    if (layer) {
        layer->id = generateId();
    }
    return layer;
}

QString ShapeFactory::generateId()
{
    static std::atomic<quint64> sequence{0};
    const quint64 n = ++sequence;
    return QStringLiteral("layer_%1_%2_%3")
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(n, 0, 36)
        .arg(QUuid::createUuid().toString(QUuid::Id128).left(8));
}

Layer ShapeFactory::createPath(const QPointF& point) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::Path;
    layer.points = {point};
    applyStroke(layer, style);
    layer.fill = QStringLiteral("none");
    applyShadow(layer, style);
    return layer;
}

Layer ShapeFactory::createRectangle(const QPointF& point) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::Rectangle;
    layer.x = point.x();
    layer.y = point.y();
    layer.width = 0.0;
    layer.height = 0.0;
    applyStroke(layer, style);
    layer.fill = style.fill;
    applyShadow(layer, style);
    return layer;
}

Layer ShapeFactory::createCircle(const QPointF& point) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::Circle;
    layer.x = point.x();
    layer.y = point.y();
    layer.radius = 0.0;
    applyStroke(layer, style);
    layer.fill = style.fill;
    applyShadow(layer, style);
    return layer;
}

Layer ShapeFactory::createEllipse(const QPointF& point) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::Ellipse;
    layer.x = point.x();
    layer.y = point.y();
    layer.radiusX = 0.0;
    layer.radiusY = 0.0;
    applyStroke(layer, style);
    layer.fill = style.fill;
    applyShadow(layer, style);
    return layer;
}

Layer ShapeFactory::createLine(const QPointF& point) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::Line;
    layer.x1 = point.x();
    layer.y1 = point.y();
    layer.x2 = point.x();
    layer.y2 = point.y();
    applyStroke(layer, style);
    applyShadow(layer, style);
    return layer;
}

Layer ShapeFactory::createArrow(const QPointF& point) const
{
    const ToolStyle style = currentStyle();
    Layer layer = createLine(point);
    layer.type = LayerType::Arrow;
    layer.arrowStyle = style.arrowStyle.isEmpty() ? QString::fromLatin1(LayerDefaults::kArrowStyle)
                                                  : style.arrowStyle;
    // The head is filled, so it needs a visible colour
    layer.fill = ColorUtils::isNoneOrTransparent(style.color) ? QString::fromLatin1(LayerDefaults::kStrokeColor)
                                                              : style.color;
    layer.arrowSize = qMax(LayerDefaults::kArrowSize, style.strokeWidth * 5.0);
    return layer;
}

Layer ShapeFactory::createPolygon(const QPointF& point, std::optional<int> sides) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::Polygon;
    layer.x = point.x();
    layer.y = point.y();
    layer.radius = 0.0;
    layer.sides = sides.value_or(LayerDefaults::kPolygonSides);
    layer.cornerRadius = 0.0;
    applyStroke(layer, style);
    layer.fill = style.fill;
    applyShadow(layer, style);
    return layer;
}

Layer ShapeFactory::createStar(const QPointF& point, std::optional<int> points) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::Star;
    layer.x = point.x();
    layer.y = point.y();
    layer.outerRadius = 0.0;
    layer.innerRadius = 0.0;
    layer.radius = 0.0;
    layer.starPoints = points.value_or(LayerDefaults::kStarPoints);
    applyStroke(layer, style);
    layer.fill = style.fill;
    applyShadow(layer, style);
    return layer;
}

Layer ShapeFactory::createText(const QPointF& point, const QString& text) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::Text;
    layer.x = point.x();
    layer.y = point.y();
    layer.text = text;
    layer.fontSize = style.fontSize;
    layer.fontFamily = style.fontFamily;
    layer.color = style.color;
    return layer;
}

Layer ShapeFactory::createTextBox(const QPointF& point) const
{
    const ToolStyle style = currentStyle();
    Layer layer;
    layer.type = LayerType::TextBox;
    layer.x = point.x();
    layer.y = point.y();
    layer.width = 0.0;
    layer.height = 0.0;
    applyTextDefaults(layer, style);
    applyStroke(layer, style);
    layer.fill = ColorUtils::isNoneOrTransparent(style.fill) ? QStringLiteral("#ffffff") : style.fill;
    layer.cornerRadius = 0.0;
    layer.padding = LayerDefaults::kTextBoxPadding;
    applyShadow(layer, style);
    return layer;
}

Layer ShapeFactory::createCallout(const QPointF& point) const
{
    Layer layer = createTextBox(point);
    layer.type = LayerType::Callout;
    layer.cornerRadius = 8.0;
    layer.tailTipX = point.x();
    layer.tailTipY = point.y();
    return layer;
}

void ShapeFactory::updateRectangle(Layer& layer, const QPointF& start, const QPointF& current)
{
    layer.x = qMin(start.x(), current.x());
    layer.y = qMin(start.y(), current.y());
    layer.width = qAbs(current.x() - start.x());
    layer.height = qAbs(current.y() - start.y());
}

void ShapeFactory::updateCircle(Layer& layer, const QPointF& start, const QPointF& current)
{
    layer.radius = QLineF(start, current).length();
}

void ShapeFactory::updateEllipse(Layer& layer, const QPointF& start, const QPointF& current)
{
    layer.radiusX = qAbs(current.x() - start.x()) / 2.0;
    layer.radiusY = qAbs(current.y() - start.y()) / 2.0;
    layer.x = (start.x() + current.x()) / 2.0;
    layer.y = (start.y() + current.y()) / 2.0;
}

void ShapeFactory::updateLine(Layer& layer, const QPointF& current)
{
    layer.x2 = current.x();
    layer.y2 = current.y();
}

void ShapeFactory::updatePolygon(Layer& layer, const QPointF& start, const QPointF& current)
{
    layer.radius = QLineF(start, current).length();
}

void ShapeFactory::updateStar(Layer& layer, const QPointF& start, const QPointF& current, qreal innerRatio)
{
    const qreal radius = QLineF(start, current).length();
    layer.outerRadius = radius;
    layer.radius = radius;
    layer.innerRadius = radius * (innerRatio > 0 ? innerRatio : kStarInnerRatio);
}

void ShapeFactory::updateCallout(Layer& layer, const QPointF& start, const QPointF& current)
{
    updateRectangle(layer, start, current);
    const qreal width = layer.width.value_or(0.0);
    const qreal height = layer.height.value_or(0.0);
    layer.tailTipX = layer.x + width * 0.25;
    layer.tailTipY = layer.y + height + qMax<qreal>(20.0, height * 0.5);
}

bool ShapeFactory::hasValidSize(const Layer& layer)
{
    switch (layer.type) {
    case LayerType::Rectangle:
    case LayerType::TextBox:
    case LayerType::Callout:
        return layer.width.value_or(0.0) > kMinBoxSize && layer.height.value_or(0.0) > kMinBoxSize;
    case LayerType::Circle:
        return layer.radius.value_or(0.0) > 0.0;
    case LayerType::Polygon:
        return layer.radius.value_or(0.0) > 0.0;
    case LayerType::Star:
        return layer.outerRadius.value_or(0.0) > 0.0 || layer.radius.value_or(0.0) > 0.0;
    case LayerType::Ellipse:
        return layer.radiusX.value_or(0.0) > 0.0 && layer.radiusY.value_or(0.0) > 0.0;
    case LayerType::Line:
    case LayerType::Arrow: {
        if (!layer.x1 || !layer.y1 || !layer.x2 || !layer.y2) {
            return false;
        }
        return QLineF(*layer.x1, *layer.y1, *layer.x2, *layer.y2).length() > 0.0;
    }
    case LayerType::Path:
        return layer.points.size() >= 2;
    case LayerType::Text:
        return layer.text && !layer.text->isEmpty();
    default:
        return true;
    }
}
