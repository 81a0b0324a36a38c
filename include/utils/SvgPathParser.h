#ifndef SVGPATHPARSER_H
#define SVGPATHPARSER_H

#include <QPainterPath>
#include <QString>

/**
 * @brief Converts SVG path data ("d" attribute) into a QPainterPath.
 *
 * Handles M, L, H, V, C, S, Q, T, A and Z in absolute and relative form,
 * including implicit repeated commands. Elliptical arcs are approximated
 * with cubic Bezier segments of at most 90 degrees.
 */
class SvgPathParser {
public:
    SvgPathParser() = delete;

    /**
     * @brief Parse path data.
     * @param data SVG path data string
     * @param ok Set to false when parsing stopped at malformed input
     * @return The path parsed up to the first error
     */
    static QPainterPath parse(const QString& data, bool* ok = nullptr);
};

#endif // SVGPATHPARSER_H
