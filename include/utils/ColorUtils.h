#ifndef COLORUTILS_H
#define COLORUTILS_H

#include <QColor>
#include <QString>

/**
 * @brief CSS colour string helpers.
 *
 * Layer payloads carry colours as CSS strings; QColor alone does not
 * understand rgb()/rgba()/hsl() or the CSS #rrggbbaa byte order.
 */
class ColorUtils {
public:
    ColorUtils() = delete;

    /**
     * @brief Parse a CSS colour string.
     *
     * Supports #rgb, #rgba, #rrggbb, #rrggbbaa, rgb(), rgba(), hsl(),
     * hsla(), SVG colour names and "transparent".
     * @return An invalid QColor when the string cannot be parsed.
     */
    static QColor parseColor(const QString& css);

    // "none", "transparent" and empty strings paint nothing
    static bool isNoneOrTransparent(const QString& css);

    // Multiply the colour alpha by opacity (clamped to [0, 1])
    static QColor withOpacity(const QColor& color, qreal opacity);
};

#endif // COLORUTILS_H
