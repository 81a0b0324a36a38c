#include "utils/ColorUtils.h"

#include <QRegularExpression>
#include <QStringList>
#include <QVector>
#include <QtGlobal>
#include <cmath>

namespace {

int hexNibble(QChar c)
{
    const int v = c.digitValue();
    if (v >= 0 && v <= 9) {
        return v;
    }
    const QChar lower = c.toLower();
    if (lower >= QLatin1Char('a') && lower <= QLatin1Char('f')) {
        return lower.unicode() - 'a' + 10;
    }
    return -1;
}

QColor parseHex(const QString& hex)
{
    QVector<int> nibbles;
    nibbles.reserve(hex.size());
    for (const QChar c : hex) {
        const int n = hexNibble(c);
        if (n < 0) {
            return QColor();
        }
        nibbles.append(n);
    }

    switch (nibbles.size()) {
    case 3:
        return QColor(nibbles[0] * 17, nibbles[1] * 17, nibbles[2] * 17);
    case 4:
        return QColor(nibbles[0] * 17, nibbles[1] * 17, nibbles[2] * 17, nibbles[3] * 17);
    case 6:
        return QColor(nibbles[0] * 16 + nibbles[1],
                      nibbles[2] * 16 + nibbles[3],
                      nibbles[4] * 16 + nibbles[5]);
    case 8:
        // CSS order is RRGGBBAA, unlike QColor's #AARRGGBB
        return QColor(nibbles[0] * 16 + nibbles[1],
                      nibbles[2] * 16 + nibbles[3],
                      nibbles[4] * 16 + nibbles[5],
                      nibbles[6] * 16 + nibbles[7]);
    default:
        return QColor();
    }
}

// Parses "50%" or "0.5"; percentages are divided by 100, numbers by `scale`
bool parseComponent(const QString& token, qreal scale, qreal* out)
{
    QString t = token.trimmed();
    bool ok = false;
    if (t.endsWith(QLatin1Char('%'))) {
        t.chop(1);
        const qreal v = t.toDouble(&ok);
        *out = v / 100.0;
    } else {
        const qreal v = t.toDouble(&ok);
        *out = v / scale;
    }
    return ok;
}

QStringList functionArguments(const QString& css, const QString& name)
{
    static const QRegularExpression kSeparators(QStringLiteral("[,\\s/]+"));
    const QString body = css.mid(name.size() + 1, css.size() - name.size() - 2);
    return body.split(kSeparators, Qt::SkipEmptyParts);
}

} // namespace

QColor ColorUtils::parseColor(const QString& css)
{
    const QString value = css.trimmed().toLower();
    if (value.isEmpty() || value == QLatin1String("none")) {
        return QColor();
    }
    if (value == QLatin1String("transparent")) {
        return QColor(0, 0, 0, 0);
    }

    if (value.startsWith(QLatin1Char('#'))) {
        return parseHex(value.mid(1));
    }

    const bool isRgb = value.startsWith(QLatin1String("rgb(")) || value.startsWith(QLatin1String("rgba("));
    const bool isHsl = value.startsWith(QLatin1String("hsl(")) || value.startsWith(QLatin1String("hsla("));
    if ((isRgb || isHsl) && value.endsWith(QLatin1Char(')'))) {
        const QString name = value.left(value.indexOf(QLatin1Char('(')));
        const QStringList args = functionArguments(value, name);
        if (args.size() != 3 && args.size() != 4) {
            return QColor();
        }

        qreal alpha = 1.0;
        if (args.size() == 4 && !parseComponent(args[3], 1.0, &alpha)) {
            return QColor();
        }
        alpha = qBound(0.0, alpha, 1.0);

        if (isRgb) {
            qreal r = 0.0, g = 0.0, b = 0.0;
            if (!parseComponent(args[0], 255.0, &r) || !parseComponent(args[1], 255.0, &g)
                || !parseComponent(args[2], 255.0, &b)) {
                return QColor();
            }
            return QColor::fromRgbF(qBound(0.0, r, 1.0), qBound(0.0, g, 1.0),
                                    qBound(0.0, b, 1.0), alpha);
        }

        QString hue = args[0];
        hue.remove(QLatin1String("deg"));
        bool ok = false;
        qreal h = hue.toDouble(&ok);
        qreal s = 0.0, l = 0.0;
        if (!ok || !parseComponent(args[1], 100.0, &s) || !parseComponent(args[2], 100.0, &l)) {
            return QColor();
        }
        h = std::fmod(h, 360.0);
        if (h < 0) {
            h += 360.0;
        }
        return QColor::fromHslF(h / 360.0, qBound(0.0, s, 1.0), qBound(0.0, l, 1.0), alpha);
    }

    QColor named(value);
    return named.isValid() ? named : QColor();
}

bool ColorUtils::isNoneOrTransparent(const QString& css)
{
    const QString value = css.trimmed().toLower();
    return value.isEmpty() || value == QLatin1String("none") || value == QLatin1String("transparent");
}

QColor ColorUtils::withOpacity(const QColor& color, qreal opacity)
{
    QColor result = color;
    result.setAlphaF(color.alphaF() * qBound(0.0, opacity, 1.0));
    return result;
}
