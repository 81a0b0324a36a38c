#ifndef STYLESTORE_H
#define STYLESTORE_H

#include <QJsonValue>
#include <QMap>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#include "layers/Layer.h"
#include "layers/LayerDefaults.h"

/**
 * @brief The ambient drawing style new layers are created with.
 */
struct ToolStyle {
    QString color = QString::fromLatin1(LayerDefaults::kStrokeColor);
    qreal strokeWidth = LayerDefaults::kStrokeWidth;
    QString fill = QString::fromLatin1(LayerDefaults::kFillColor);
    qreal fillOpacity = 1.0;
    qreal fontSize = LayerDefaults::kFontSize;
    QString fontFamily = QString::fromLatin1(LayerDefaults::kFontFamily);
    QString arrowStyle = QString::fromLatin1(LayerDefaults::kArrowStyle);
    bool shadow = false;
    QString shadowColor = QString::fromLatin1(LayerDefaults::kShadowColor);
    qreal shadowBlur = LayerDefaults::kShadowBlur;
    qreal shadowOffsetX = LayerDefaults::kShadowOffsetX;
    qreal shadowOffsetY = LayerDefaults::kShadowOffsetY;
    qreal opacity = 1.0;

    // Paste position, only applied when explicitly requested
    std::optional<qreal> x;
    std::optional<qreal> y;

    bool operator==(const ToolStyle& other) const;
    bool operator!=(const ToolStyle& other) const { return !(*this == other); }
};

/**
 * @brief Partial style update. Unset fields are left alone.
 */
struct StylePatch {
    std::optional<QString> color;
    std::optional<qreal> strokeWidth;
    std::optional<QString> fill;
    std::optional<qreal> fillOpacity;
    std::optional<qreal> fontSize;
    std::optional<QString> fontFamily;
    std::optional<QString> arrowStyle;
    std::optional<bool> shadow;
    std::optional<QString> shadowColor;
    std::optional<qreal> shadowBlur;
    std::optional<qreal> shadowOffsetX;
    std::optional<qreal> shadowOffsetY;
    std::optional<qreal> opacity;
    std::optional<qreal> x;
    std::optional<qreal> y;

    bool isEmpty() const;
};

struct ShadowStyle {
    bool shadow = false;
    QString shadowColor;
    qreal shadowBlur = 0.0;
    qreal shadowOffsetX = 0.0;
    qreal shadowOffsetY = 0.0;
};

/**
 * @brief Delivered to listeners after the style changed.
 *
 * changed holds the property names that actually changed, in declaration
 * order. After reset() every property name is listed.
 */
struct StyleChange {
    QStringList changed;
    ToolStyle style;
};

/**
 * @brief Observable store of the current drawing style.
 *
 * Minimums are enforced on every write: strokeWidth >= 0.5,
 * fontSize >= 8 and shadowBlur >= 0. Listeners are notified once per
 * effective change and never for a no-op update. A listener that throws
 * is logged and does not stop the remaining listeners.
 */
class StyleStore
{
public:
    using Listener = std::function<void(const StyleChange&)>;
    using ListenerHandle = quint64;

    static constexpr qreal kMinStrokeWidth = LayerDefaults::kMinStrokeWidth;
    static constexpr qreal kMinFontSize = LayerDefaults::kMinFontSize;
    static constexpr ListenerHandle kInvalidHandle = 0;

    StyleStore();
    explicit StyleStore(const StylePatch& initialStyle);

    static ToolStyle defaultStyle() { return ToolStyle(); }

    // Returns a copy; the live record is never exposed
    ToolStyle get() const { return m_style; }

    void update(const StylePatch& patch);
    void updateFromJson(const QJsonValue& value);
    void reset();

    QString getColor() const { return m_style.color; }
    void setColor(const QString& color);

    QString getFill() const { return m_style.fill; }
    void setFill(const QString& fill);

    qreal getStrokeWidth() const { return m_style.strokeWidth; }
    void setStrokeWidth(qreal width);

    qreal getFontSize() const { return m_style.fontSize; }
    void setFontSize(qreal size);

    QString getFontFamily() const { return m_style.fontFamily; }
    void setFontFamily(const QString& family);

    QString getArrowStyle() const { return m_style.arrowStyle; }
    void setArrowStyle(const QString& style);

    bool getShadowEnabled() const { return m_style.shadow; }
    void setShadowEnabled(bool enabled);

    ShadowStyle getShadow() const;
    // Only shadow fields of the patch are used
    void setShadow(const StylePatch& shadow);

    ListenerHandle subscribe(Listener listener);
    bool unsubscribe(ListenerHandle handle);
    int listenerCount() const { return static_cast<int>(m_listeners.size()); }

    /**
     * @brief Fill the style fields @p layer does not define yet.
     *
     * Stroke, stroke width, fill and shadow apply to every type; font and
     * text colour only to text-bearing layers; arrowStyle only to arrows.
     * Position is copied only when @p includePosition is set and the style
     * carries one.
     */
    void applyToLayer(Layer& layer, bool includePosition = false) const;

    // The inverse of applyToLayer(): style fields currently set on layer
    static StylePatch extractFromLayer(const Layer& layer);

    // Drops listeners and restores defaults without notifying
    void destroy();

private:
    static StylePatch clamped(StylePatch patch);
    void notifyListeners(const StyleChange& change);

    ToolStyle m_style;
    QMap<ListenerHandle, Listener> m_listeners;
    ListenerHandle m_nextHandle = 1;
};

#endif // STYLESTORE_H
