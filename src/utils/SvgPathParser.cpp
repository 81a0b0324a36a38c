#include "utils/SvgPathParser.h"

#include <QtMath>
#include <cmath>

namespace {

class PathTokenizer {
public:
    explicit PathTokenizer(const QString& data)
        : m_data(data)
    {
    }

    void skipSeparators()
    {
        while (m_pos < m_data.size()) {
            const QChar c = m_data.at(m_pos);
            if (c.isSpace() || c == QLatin1Char(',')) {
                ++m_pos;
            } else {
                break;
            }
        }
    }

    bool atEnd()
    {
        skipSeparators();
        return m_pos >= m_data.size();
    }

    bool nextIsCommand()
    {
        skipSeparators();
        return m_pos < m_data.size() && m_data.at(m_pos).isLetter()
            && m_data.at(m_pos).toLower() != QLatin1Char('e');
    }

    bool hasNumber()
    {
        skipSeparators();
        if (m_pos >= m_data.size()) {
            return false;
        }
        const QChar c = m_data.at(m_pos);
        return c.isDigit() || c == QLatin1Char('-') || c == QLatin1Char('+') || c == QLatin1Char('.');
    }

    QChar takeCommand()
    {
        skipSeparators();
        return m_data.at(m_pos++);
    }

    bool readNumber(qreal* out)
    {
        if (!hasNumber()) {
            return false;
        }
        const int start = m_pos;
        if (m_data.at(m_pos) == QLatin1Char('-') || m_data.at(m_pos) == QLatin1Char('+')) {
            ++m_pos;
        }
        bool seenDot = false;
        bool seenDigit = false;
        while (m_pos < m_data.size()) {
            const QChar c = m_data.at(m_pos);
            if (c.isDigit()) {
                seenDigit = true;
                ++m_pos;
            } else if (c == QLatin1Char('.') && !seenDot) {
                seenDot = true;
                ++m_pos;
            } else {
                break;
            }
        }
        if (seenDigit && m_pos < m_data.size()
            && (m_data.at(m_pos) == QLatin1Char('e') || m_data.at(m_pos) == QLatin1Char('E'))) {
            int expPos = m_pos + 1;
            if (expPos < m_data.size()
                && (m_data.at(expPos) == QLatin1Char('-') || m_data.at(expPos) == QLatin1Char('+'))) {
                ++expPos;
            }
            if (expPos < m_data.size() && m_data.at(expPos).isDigit()) {
                m_pos = expPos;
                while (m_pos < m_data.size() && m_data.at(m_pos).isDigit()) {
                    ++m_pos;
                }
            }
        }
        if (!seenDigit) {
            m_pos = start;
            return false;
        }
        bool ok = false;
        *out = m_data.mid(start, m_pos - start).toDouble(&ok);
        return ok;
    }

    // Arc flags may be packed without separators ("a1 1 0 01 5 5")
    bool readFlag(bool* out)
    {
        skipSeparators();
        if (m_pos >= m_data.size()) {
            return false;
        }
        const QChar c = m_data.at(m_pos);
        if (c != QLatin1Char('0') && c != QLatin1Char('1')) {
            return false;
        }
        *out = (c == QLatin1Char('1'));
        ++m_pos;
        return true;
    }

private:
    const QString& m_data;
    int m_pos = 0;
};

qreal vectorAngle(qreal ux, qreal uy, qreal vx, qreal vy)
{
    const qreal dot = ux * vx + uy * vy;
    const qreal len = std::sqrt((ux * ux + uy * uy) * (vx * vx + vy * vy));
    qreal angle = std::acos(qBound(-1.0, dot / len, 1.0));
    if (ux * vy - uy * vx < 0) {
        angle = -angle;
    }
    return angle;
}

void arcTo(QPainterPath& path, const QPointF& from, qreal rx, qreal ry, qreal xAxisRotation,
           bool largeArc, bool sweep, const QPointF& to)
{
    if (from == to) {
        return;
    }
    rx = std::fabs(rx);
    ry = std::fabs(ry);
    if (qFuzzyIsNull(rx) || qFuzzyIsNull(ry)) {
        path.lineTo(to);
        return;
    }

    const qreal phi = qDegreesToRadians(xAxisRotation);
    const qreal cosPhi = std::cos(phi);
    const qreal sinPhi = std::sin(phi);

    const qreal dx = (from.x() - to.x()) / 2.0;
    const qreal dy = (from.y() - to.y()) / 2.0;
    const qreal x1p = cosPhi * dx + sinPhi * dy;
    const qreal y1p = -sinPhi * dx + cosPhi * dy;

    // Scale radii up when the endpoints cannot be reached
    const qreal lambda = (x1p * x1p) / (rx * rx) + (y1p * y1p) / (ry * ry);
    if (lambda > 1.0) {
        const qreal s = std::sqrt(lambda);
        rx *= s;
        ry *= s;
    }

    const qreal num = rx * rx * ry * ry - rx * rx * y1p * y1p - ry * ry * x1p * x1p;
    const qreal den = rx * rx * y1p * y1p + ry * ry * x1p * x1p;
    qreal coef = den > 0 ? std::sqrt(qMax(0.0, num / den)) : 0.0;
    if (largeArc == sweep) {
        coef = -coef;
    }
    const qreal cxp = coef * (rx * y1p / ry);
    const qreal cyp = coef * (-(ry * x1p) / rx);

    const qreal cx = cosPhi * cxp - sinPhi * cyp + (from.x() + to.x()) / 2.0;
    const qreal cy = sinPhi * cxp + cosPhi * cyp + (from.y() + to.y()) / 2.0;

    const qreal ux = (x1p - cxp) / rx;
    const qreal uy = (y1p - cyp) / ry;
    const qreal vx = (-x1p - cxp) / rx;
    const qreal vy = (-y1p - cyp) / ry;

    const qreal startAngle = vectorAngle(1.0, 0.0, ux, uy);
    qreal deltaAngle = vectorAngle(ux, uy, vx, vy);
    if (!sweep && deltaAngle > 0) {
        deltaAngle -= 2.0 * M_PI;
    } else if (sweep && deltaAngle < 0) {
        deltaAngle += 2.0 * M_PI;
    }

    const int segments = qMax(1, static_cast<int>(std::ceil(std::fabs(deltaAngle) / (M_PI / 2.0))));
    const qreal step = deltaAngle / segments;

    auto mapPoint = [&](qreal ex, qreal ey) {
        return QPointF(cx + rx * ex * cosPhi - ry * ey * sinPhi,
                       cy + rx * ex * sinPhi + ry * ey * cosPhi);
    };

    for (int i = 0; i < segments; ++i) {
        const qreal theta1 = startAngle + step * i;
        const qreal theta2 = theta1 + step;
        const qreal alpha = (4.0 / 3.0) * std::tan((theta2 - theta1) / 4.0);

        const qreal c1 = std::cos(theta1), s1 = std::sin(theta1);
        const qreal c2 = std::cos(theta2), s2 = std::sin(theta2);

        const QPointF cp1 = mapPoint(c1 - alpha * s1, s1 + alpha * c1);
        const QPointF cp2 = mapPoint(c2 + alpha * s2, s2 - alpha * c2);
        const QPointF end = (i == segments - 1) ? to : mapPoint(c2, s2);
        path.cubicTo(cp1, cp2, end);
    }
}

} // namespace

QPainterPath SvgPathParser::parse(const QString& data, bool* ok)
{
    QPainterPath path;
    PathTokenizer tokens(data);

    QPointF current;
    QPointF subpathStart;
    QPointF lastCubicCtrl;
    QPointF lastQuadCtrl;
    QChar previous;
    bool success = true;

    while (!tokens.atEnd()) {
        if (!tokens.nextIsCommand()) {
            success = false;
            break;
        }
        const QChar command = tokens.takeCommand();
        const bool relative = command.isLower();
        const QChar upper = command.toUpper();
        const QPointF base = relative ? current : QPointF();

        auto readPoint = [&tokens](QPointF* out) {
            qreal px = 0.0;
            qreal py = 0.0;
            if (!tokens.readNumber(&px) || !tokens.readNumber(&py)) {
                return false;
            }
            *out = QPointF(px, py);
            return true;
        };

        if (upper == QLatin1Char('Z')) {
            path.closeSubpath();
            current = subpathStart;
            previous = upper;
            continue;
        }

        // Each command consumes one or more argument groups
        bool first = true;
        do {
            const QPointF origin = relative ? current : QPointF();
            if (upper == QLatin1Char('M')) {
                QPointF p;
                if (!readPoint(&p)) {
                    success = false;
                    break;
                }
                p += (first ? base : origin);
                if (first) {
                    path.moveTo(p);
                    subpathStart = p;
                } else {
                    // Extra coordinate pairs after moveto are implicit lineto
                    path.lineTo(p);
                }
                current = p;
            } else if (upper == QLatin1Char('L')) {
                QPointF p;
                if (!readPoint(&p)) {
                    success = false;
                    break;
                }
                current = p + origin;
                path.lineTo(current);
            } else if (upper == QLatin1Char('H')) {
                qreal v = 0.0;
                if (!tokens.readNumber(&v)) {
                    success = false;
                    break;
                }
                current.setX(relative ? current.x() + v : v);
                path.lineTo(current);
            } else if (upper == QLatin1Char('V')) {
                qreal v = 0.0;
                if (!tokens.readNumber(&v)) {
                    success = false;
                    break;
                }
                current.setY(relative ? current.y() + v : v);
                path.lineTo(current);
            } else if (upper == QLatin1Char('C')) {
                QPointF c1, c2, p;
                if (!readPoint(&c1) || !readPoint(&c2) || !readPoint(&p)) {
                    success = false;
                    break;
                }
                c1 += origin;
                c2 += origin;
                p += origin;
                path.cubicTo(c1, c2, p);
                lastCubicCtrl = c2;
                current = p;
                previous = upper;
            } else if (upper == QLatin1Char('S')) {
                QPointF c2, p;
                if (!readPoint(&c2) || !readPoint(&p)) {
                    success = false;
                    break;
                }
                const bool reflect = previous == QLatin1Char('C') || previous == QLatin1Char('S');
                const QPointF c1 = reflect ? current * 2.0 - lastCubicCtrl : current;
                c2 += origin;
                p += origin;
                path.cubicTo(c1, c2, p);
                lastCubicCtrl = c2;
                current = p;
                previous = upper;
            } else if (upper == QLatin1Char('Q')) {
                QPointF c, p;
                if (!readPoint(&c) || !readPoint(&p)) {
                    success = false;
                    break;
                }
                c += origin;
                p += origin;
                path.quadTo(c, p);
                lastQuadCtrl = c;
                current = p;
                previous = upper;
            } else if (upper == QLatin1Char('T')) {
                QPointF p;
                if (!readPoint(&p)) {
                    success = false;
                    break;
                }
                const bool reflect = previous == QLatin1Char('Q') || previous == QLatin1Char('T');
                const QPointF c = reflect ? current * 2.0 - lastQuadCtrl : current;
                p += origin;
                path.quadTo(c, p);
                lastQuadCtrl = c;
                current = p;
                previous = upper;
            } else if (upper == QLatin1Char('A')) {
                qreal rx = 0.0, ry = 0.0, rotation = 0.0;
                bool largeArc = false, sweep = false;
                QPointF p;
                if (!tokens.readNumber(&rx) || !tokens.readNumber(&ry) || !tokens.readNumber(&rotation)
                    || !tokens.readFlag(&largeArc) || !tokens.readFlag(&sweep) || !readPoint(&p)) {
                    success = false;
                    break;
                }
                p += origin;
                arcTo(path, current, rx, ry, rotation, largeArc, sweep, p);
                current = p;
            } else {
                success = false;
                break;
            }

            if (upper != QLatin1Char('C') && upper != QLatin1Char('S')
                && upper != QLatin1Char('Q') && upper != QLatin1Char('T')) {
                previous = upper;
            }
            first = false;
        } while (tokens.hasNumber());

        if (!success) {
            break;
        }
    }

    if (ok) {
        *ok = success;
    }
    return path;
}
