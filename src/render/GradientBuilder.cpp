#include "render/GradientBuilder.h"
#include "layers/LayerJson.h"
#include "utils/ColorUtils.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonObject>
#include <QLinearGradient>
#include <QPainter>
#include <QRadialGradient>
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace {

constexpr qreal kStopEpsilon = 1e-6;

bool isSupportedType(const QString& type)
{
    return type == QLatin1String("linear") || type == QLatin1String("radial");
}

void addColorStops(QGradient& gradient, QVector<GradientStop> stops)
{
    for (GradientStop& stop : stops) {
        stop.offset = qBound(0.0, stop.offset, 1.0);
    }
    std::stable_sort(stops.begin(), stops.end(), [](const GradientStop& a, const GradientStop& b) {
        return a.offset < b.offset;
    });

    // setColorAt() replaces a stop at an equal position, so coincident
    // offsets are spread apart to keep hard edges
    qreal previous = -1.0;
    for (const GradientStop& stop : stops) {
        const QColor color = ColorUtils::parseColor(stop.color);
        if (!color.isValid()) {
            qWarning() << "GradientBuilder: Invalid color:" << stop.color;
            continue;
        }
        qreal offset = stop.offset;
        if (offset <= previous) {
            offset = qMin(1.0, previous + kStopEpsilon);
        }
        gradient.setColorAt(offset, color);
        previous = offset;
    }
}

GradientSpec makeSpec(const QString& type, std::initializer_list<GradientStop> stops)
{
    GradientSpec spec;
    spec.type = type;
    spec.colors = QVector<GradientStop>(stops);
    return spec;
}

} // namespace

bool GradientBuilder::hasGradient(const Layer& layer)
{
    if (!layer.gradient) {
        return false;
    }
    return isSupportedType(layer.gradient->type) && layer.gradient->colors.size() >= 2;
}

std::optional<QGradient> GradientBuilder::createGradient(const Layer& layer, const QRectF& bounds,
                                                         qreal scale)
{
    if (!hasGradient(layer)) {
        return std::nullopt;
    }

    const GradientSpec& spec = *layer.gradient;
    const qreal s = scale > 0 ? scale : 1.0;
    const QRectF box(bounds.x() * s, bounds.y() * s, bounds.width() * s, bounds.height() * s);

    if (spec.type == QLatin1String("linear")) {
        const qreal angle = qDegreesToRadians(spec.angle.value_or(0.0));
        const QPointF center = box.center();
        const qreal halfDiagonal = std::sqrt(box.width() * box.width() + box.height() * box.height()) / 2.0;
        const QPointF delta(std::cos(angle) * halfDiagonal, std::sin(angle) * halfDiagonal);

        QLinearGradient gradient(center - delta, center + delta);
        addColorStops(gradient, spec.colors);
        return gradient;
    }

    const QPointF center(box.x() + spec.centerX.value_or(kDefaultCenter) * box.width(),
                         box.y() + spec.centerY.value_or(kDefaultCenter) * box.height());
    const qreal radius = spec.radius.value_or(kDefaultRadius) * qMax(box.width(), box.height());

    QRadialGradient gradient(center, radius);
    addColorStops(gradient, spec.colors);
    return gradient;
}

bool GradientBuilder::applyFill(QPainter& painter, const Layer& layer, const QRectF& bounds,
                                qreal scale)
{
    const std::optional<QGradient> gradient = createGradient(layer, bounds, scale);
    if (gradient) {
        painter.setBrush(QBrush(*gradient));
        return true;
    }

    if (layer.fill && !ColorUtils::isNoneOrTransparent(*layer.fill)) {
        const QColor color = ColorUtils::parseColor(*layer.fill);
        if (color.isValid()) {
            painter.setBrush(color);
        } else {
            qWarning() << "GradientBuilder: Invalid fill color:" << *layer.fill;
        }
    }
    return false;
}

GradientValidation GradientBuilder::validate(const GradientSpec& spec)
{
    return validate(QJsonValue(LayerJson::gradientToJson(spec)));
}

GradientValidation GradientBuilder::validate(const QJsonValue& value)
{
    GradientValidation result;
    if (!value.isObject()) {
        result.valid = false;
        result.errors << QStringLiteral("Gradient must be an object");
        return result;
    }

    const QJsonObject o = value.toObject();
    const QString type = o.value(QLatin1String("type")).toString();
    if (!isSupportedType(type)) {
        result.errors << QStringLiteral("Gradient type must be \"linear\" or \"radial\"");
    }

    const QJsonValue colors = o.value(QLatin1String("colors"));
    if (!colors.isArray()) {
        result.errors << QStringLiteral("Gradient colors must be an array");
    } else if (colors.toArray().size() < 2) {
        result.errors << QStringLiteral("Gradient must have at least 2 color stops");
    } else {
        const QJsonArray stops = colors.toArray();
        for (int i = 0; i < stops.size(); ++i) {
            const QJsonObject stop = stops.at(i).toObject();
            const QJsonValue offset = stop.value(QLatin1String("offset"));
            if (!offset.isDouble() || offset.toDouble() < 0.0 || offset.toDouble() > 1.0) {
                result.errors << QStringLiteral("Color stop %1: offset must be a number between 0 and 1").arg(i);
            }
            if (!stop.value(QLatin1String("color")).isString()) {
                result.errors << QStringLiteral("Color stop %1: color must be a string").arg(i);
            }
        }
    }

    auto checkRange = [&o, &result](const char* key, qreal min, qreal max, const QString& message) {
        const QJsonValue v = o.value(QLatin1String(key));
        if (v.isUndefined()) {
            return;
        }
        if (!v.isDouble() || v.toDouble() < min || v.toDouble() > max) {
            result.errors << message;
        }
    };

    if (type == QLatin1String("linear")) {
        checkRange("angle", 0.0, 360.0,
                   QStringLiteral("Linear gradient angle must be a number between 0 and 360"));
    } else if (type == QLatin1String("radial")) {
        checkRange("centerX", 0.0, 1.0,
                   QStringLiteral("Radial gradient centerX must be a number between 0 and 1"));
        checkRange("centerY", 0.0, 1.0,
                   QStringLiteral("Radial gradient centerY must be a number between 0 and 1"));
        checkRange("radius", 0.0, 1.0,
                   QStringLiteral("Radial gradient radius must be a number between 0 and 1"));
    }

    result.valid = result.errors.isEmpty();
    return result;
}

std::optional<GradientSpec> GradientBuilder::clone(const std::optional<GradientSpec>& spec)
{
    if (!spec) {
        return std::nullopt;
    }
    GradientSpec copy;
    copy.type = spec->type;
    copy.angle = spec->angle;
    copy.centerX = spec->centerX;
    copy.centerY = spec->centerY;
    copy.radius = spec->radius;
    copy.colors.reserve(spec->colors.size());
    for (const GradientStop& stop : spec->colors) {
        copy.colors.append(GradientStop{ stop.offset, stop.color });
    }
    return copy;
}

GradientSpec GradientBuilder::createDefaultGradient(const QString& type, const QString& startColor,
                                                    const QString& endColor)
{
    GradientSpec spec = makeSpec(type, { { 0.0, startColor }, { 1.0, endColor } });
    if (type == QLatin1String("linear")) {
        spec.angle = kPresetLinearAngle;
    } else if (type == QLatin1String("radial")) {
        spec.centerX = kDefaultCenter;
        spec.centerY = kDefaultCenter;
        spec.radius = kPresetRadialRadius;
    }
    return spec;
}

QMap<QString, GradientSpec> GradientBuilder::getPresets()
{
    QMap<QString, GradientSpec> presets;

    GradientSpec sunset = makeSpec(QStringLiteral("linear"),
                                   { { 0.0, QStringLiteral("#ff512f") }, { 1.0, QStringLiteral("#f09819") } });
    sunset.angle = 180.0;
    presets.insert(QStringLiteral("sunset"), sunset);

    GradientSpec ocean = makeSpec(QStringLiteral("linear"),
                                  { { 0.0, QStringLiteral("#2193b0") }, { 1.0, QStringLiteral("#6dd5ed") } });
    ocean.angle = 135.0;
    presets.insert(QStringLiteral("ocean"), ocean);

    GradientSpec forest = makeSpec(QStringLiteral("linear"),
                                   { { 0.0, QStringLiteral("#134e5e") }, { 1.0, QStringLiteral("#71b280") } });
    forest.angle = 90.0;
    presets.insert(QStringLiteral("forest"), forest);

    GradientSpec fire = makeSpec(QStringLiteral("radial"),
                                 { { 0.0, QStringLiteral("#f5af19") },
                                   { 0.5, QStringLiteral("#f12711") },
                                   { 1.0, QStringLiteral("#6b0f1a") } });
    fire.centerX = kDefaultCenter;
    fire.centerY = kDefaultCenter;
    fire.radius = kPresetRadialRadius;
    presets.insert(QStringLiteral("fire"), fire);

    GradientSpec steel = makeSpec(QStringLiteral("linear"),
                                  { { 0.0, QStringLiteral("#bdc3c7") },
                                    { 0.5, QStringLiteral("#2c3e50") },
                                    { 1.0, QStringLiteral("#bdc3c7") } });
    steel.angle = 90.0;
    presets.insert(QStringLiteral("steel"), steel);

    GradientSpec rainbow = makeSpec(QStringLiteral("linear"),
                                    { { 0.0, QStringLiteral("#ff0000") },
                                      { 0.17, QStringLiteral("#ff8000") },
                                      { 0.33, QStringLiteral("#ffff00") },
                                      { 0.5, QStringLiteral("#00ff00") },
                                      { 0.67, QStringLiteral("#0080ff") },
                                      { 0.83, QStringLiteral("#8000ff") },
                                      { 1.0, QStringLiteral("#ff00ff") } });
    rainbow.angle = 90.0;
    presets.insert(QStringLiteral("rainbow"), rainbow);

    return presets;
}
