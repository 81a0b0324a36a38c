#include "style/StyleStore.h"

#include <QDebug>
#include <QJsonObject>
#include <QtGlobal>
#include <exception>

namespace {

template <typename T>
void mergeField(const std::optional<T>& incoming, T& current, const char* name, QStringList& changed)
{
    if (incoming && !(*incoming == current)) {
        current = *incoming;
        changed << QString::fromLatin1(name);
    }
}

template <typename T>
void mergeOptionalField(const std::optional<T>& incoming, std::optional<T>& current, const char* name,
                        QStringList& changed)
{
    if (incoming && current != incoming) {
        current = incoming;
        changed << QString::fromLatin1(name);
    }
}

std::optional<QString> jsonString(const QJsonObject& obj, const char* key)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isString()) {
        return value.toString();
    }
    return std::nullopt;
}

std::optional<qreal> jsonNumber(const QJsonObject& obj, const char* key)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isDouble()) {
        return value.toDouble();
    }
    return std::nullopt;
}

bool isTextBearing(LayerType type)
{
    return type == LayerType::Text || type == LayerType::TextBox || type == LayerType::Callout;
}

} // namespace

bool ToolStyle::operator==(const ToolStyle& other) const
{
    return color == other.color
        && strokeWidth == other.strokeWidth
        && fill == other.fill
        && fillOpacity == other.fillOpacity
        && fontSize == other.fontSize
        && fontFamily == other.fontFamily
        && arrowStyle == other.arrowStyle
        && shadow == other.shadow
        && shadowColor == other.shadowColor
        && shadowBlur == other.shadowBlur
        && shadowOffsetX == other.shadowOffsetX
        && shadowOffsetY == other.shadowOffsetY
        && opacity == other.opacity
        && x == other.x
        && y == other.y;
}

bool StylePatch::isEmpty() const
{
    return !color && !strokeWidth && !fill && !fillOpacity && !fontSize && !fontFamily
        && !arrowStyle && !shadow && !shadowColor && !shadowBlur && !shadowOffsetX
        && !shadowOffsetY && !opacity && !x && !y;
}

StyleStore::StyleStore() = default;

StyleStore::StyleStore(const StylePatch& initialStyle)
{
    update(initialStyle);
}

StylePatch StyleStore::clamped(StylePatch patch)
{
    if (patch.strokeWidth) {
        patch.strokeWidth = qMax(kMinStrokeWidth, *patch.strokeWidth);
    }
    if (patch.fontSize) {
        patch.fontSize = qMax(kMinFontSize, *patch.fontSize);
    }
    if (patch.shadowBlur) {
        patch.shadowBlur = qMax<qreal>(0.0, *patch.shadowBlur);
    }
    return patch;
}

void StyleStore::update(const StylePatch& input)
{
    const StylePatch patch = clamped(input);
    QStringList changed;

    mergeField(patch.color, m_style.color, "color", changed);
    mergeField(patch.strokeWidth, m_style.strokeWidth, "strokeWidth", changed);
    mergeField(patch.fill, m_style.fill, "fill", changed);
    mergeField(patch.fillOpacity, m_style.fillOpacity, "fillOpacity", changed);
    mergeField(patch.fontSize, m_style.fontSize, "fontSize", changed);
    mergeField(patch.fontFamily, m_style.fontFamily, "fontFamily", changed);
    mergeField(patch.arrowStyle, m_style.arrowStyle, "arrowStyle", changed);
    mergeField(patch.shadow, m_style.shadow, "shadow", changed);
    mergeField(patch.shadowColor, m_style.shadowColor, "shadowColor", changed);
    mergeField(patch.shadowBlur, m_style.shadowBlur, "shadowBlur", changed);
    mergeField(patch.shadowOffsetX, m_style.shadowOffsetX, "shadowOffsetX", changed);
    mergeField(patch.shadowOffsetY, m_style.shadowOffsetY, "shadowOffsetY", changed);
    mergeField(patch.opacity, m_style.opacity, "opacity", changed);
    mergeOptionalField(patch.x, m_style.x, "x", changed);
    mergeOptionalField(patch.y, m_style.y, "y", changed);

    if (!changed.isEmpty()) {
        notifyListeners(StyleChange{changed, m_style});
    }
}

void StyleStore::updateFromJson(const QJsonValue& value)
{
    if (!value.isObject()) {
        return;
    }
    const QJsonObject obj = value.toObject();

    StylePatch patch;
    patch.color = jsonString(obj, "color");
    patch.strokeWidth = jsonNumber(obj, "strokeWidth");
    patch.fill = jsonString(obj, "fill");
    patch.fillOpacity = jsonNumber(obj, "fillOpacity");
    patch.fontSize = jsonNumber(obj, "fontSize");
    patch.fontFamily = jsonString(obj, "fontFamily");
    patch.arrowStyle = jsonString(obj, "arrowStyle");
    if (obj.contains(QLatin1String("shadow"))) {
        patch.shadow = isTruthyFlag(obj.value(QLatin1String("shadow")).toVariant());
    }
    patch.shadowColor = jsonString(obj, "shadowColor");
    patch.shadowBlur = jsonNumber(obj, "shadowBlur");
    patch.shadowOffsetX = jsonNumber(obj, "shadowOffsetX");
    patch.shadowOffsetY = jsonNumber(obj, "shadowOffsetY");
    patch.opacity = jsonNumber(obj, "opacity");
    patch.x = jsonNumber(obj, "x");
    patch.y = jsonNumber(obj, "y");
    update(patch);
}

void StyleStore::reset()
{
    m_style = ToolStyle();
    const QStringList all = {
        QStringLiteral("color"), QStringLiteral("strokeWidth"), QStringLiteral("fill"),
        QStringLiteral("fillOpacity"), QStringLiteral("fontSize"), QStringLiteral("fontFamily"),
        QStringLiteral("arrowStyle"), QStringLiteral("shadow"), QStringLiteral("shadowColor"),
        QStringLiteral("shadowBlur"), QStringLiteral("shadowOffsetX"), QStringLiteral("shadowOffsetY"),
        QStringLiteral("opacity")
    };
    notifyListeners(StyleChange{all, m_style});
}

void StyleStore::setColor(const QString& color)
{
    StylePatch patch;
    patch.color = color;
    update(patch);
}

void StyleStore::setFill(const QString& fill)
{
    StylePatch patch;
    patch.fill = fill;
    update(patch);
}

void StyleStore::setStrokeWidth(qreal width)
{
    StylePatch patch;
    patch.strokeWidth = width;
    update(patch);
}

void StyleStore::setFontSize(qreal size)
{
    StylePatch patch;
    patch.fontSize = size;
    update(patch);
}

void StyleStore::setFontFamily(const QString& family)
{
    StylePatch patch;
    patch.fontFamily = family;
    update(patch);
}

void StyleStore::setArrowStyle(const QString& style)
{
    StylePatch patch;
    patch.arrowStyle = style;
    update(patch);
}

void StyleStore::setShadowEnabled(bool enabled)
{
    StylePatch patch;
    patch.shadow = enabled;
    update(patch);
}

ShadowStyle StyleStore::getShadow() const
{
    ShadowStyle shadow;
    shadow.shadow = m_style.shadow;
    shadow.shadowColor = m_style.shadowColor;
    shadow.shadowBlur = m_style.shadowBlur;
    shadow.shadowOffsetX = m_style.shadowOffsetX;
    shadow.shadowOffsetY = m_style.shadowOffsetY;
    return shadow;
}

void StyleStore::setShadow(const StylePatch& shadow)
{
    StylePatch patch;
    patch.shadow = shadow.shadow;
    patch.shadowColor = shadow.shadowColor;
    patch.shadowBlur = shadow.shadowBlur;
    patch.shadowOffsetX = shadow.shadowOffsetX;
    patch.shadowOffsetY = shadow.shadowOffsetY;
    update(patch);
}

StyleStore::ListenerHandle StyleStore::subscribe(Listener listener)
{
    if (!listener) {
        return kInvalidHandle;
    }
    const ListenerHandle handle = m_nextHandle++;
    m_listeners.insert(handle, std::move(listener));
    return handle;
}

bool StyleStore::unsubscribe(ListenerHandle handle)
{
    return m_listeners.remove(handle) > 0;
}

void StyleStore::notifyListeners(const StyleChange& change)
{
    // A listener may unsubscribe itself or others while being notified
    const QMap<ListenerHandle, Listener> listeners = m_listeners;
    for (auto it = listeners.cbegin(); it != listeners.cend(); ++it) {
        try {
            it.value()(change);
        } catch (const std::exception& e) {
            qWarning() << "StyleStore: Listener" << it.key() << "failed:" << e.what();
        } catch (...) {
            qWarning() << "StyleStore: Listener" << it.key() << "failed with unknown error";
        }
    }
}

void StyleStore::applyToLayer(Layer& layer, bool includePosition) const
{
    if (!layer.stroke) {
        layer.stroke = m_style.color;
    }
    if (!layer.strokeWidth) {
        layer.strokeWidth = m_style.strokeWidth;
    }
    if (!layer.fill) {
        layer.fill = m_style.fill;
    }

    if (includePosition) {
        if (m_style.x) {
            layer.x = *m_style.x;
        }
        if (m_style.y) {
            layer.y = *m_style.y;
        }
    }

    if (!layer.shadow.isValid()) {
        layer.shadow = m_style.shadow;
    }
    if (!layer.shadowColor) {
        layer.shadowColor = m_style.shadowColor;
    }
    if (!layer.shadowBlur) {
        layer.shadowBlur = m_style.shadowBlur;
    }
    if (!layer.shadowOffsetX) {
        layer.shadowOffsetX = m_style.shadowOffsetX;
    }
    if (!layer.shadowOffsetY) {
        layer.shadowOffsetY = m_style.shadowOffsetY;
    }

    if (isTextBearing(layer.type)) {
        if (!layer.fontSize) {
            layer.fontSize = m_style.fontSize;
        }
        if (!layer.fontFamily) {
            layer.fontFamily = m_style.fontFamily;
        }
        if (!layer.color) {
            layer.color = m_style.color;
        }
    }

    if (layer.type == LayerType::Arrow && !layer.arrowStyle) {
        layer.arrowStyle = m_style.arrowStyle;
    }
}

StylePatch StyleStore::extractFromLayer(const Layer& layer)
{
    StylePatch patch;
    if (layer.stroke && !layer.stroke->isEmpty()) {
        patch.color = layer.stroke;
    }
    // Text colour wins over stroke for text-bearing layers
    if (layer.color && !layer.color->isEmpty()) {
        patch.color = layer.color;
    }
    patch.strokeWidth = layer.strokeWidth;
    if (layer.fill && !layer.fill->isEmpty()) {
        patch.fill = layer.fill;
    }
    patch.fontSize = layer.fontSize;
    if (layer.fontFamily && !layer.fontFamily->isEmpty()) {
        patch.fontFamily = layer.fontFamily;
    }
    if (layer.shadow.isValid()) {
        patch.shadow = isTruthyFlag(layer.shadow);
    }
    if (layer.shadowColor && !layer.shadowColor->isEmpty()) {
        patch.shadowColor = layer.shadowColor;
    }
    patch.shadowBlur = layer.shadowBlur;
    patch.shadowOffsetX = layer.shadowOffsetX;
    patch.shadowOffsetY = layer.shadowOffsetY;
    if (layer.arrowStyle && !layer.arrowStyle->isEmpty()) {
        patch.arrowStyle = layer.arrowStyle;
    }
    return patch;
}

void StyleStore::destroy()
{
    m_listeners.clear();
    m_style = ToolStyle();
}
