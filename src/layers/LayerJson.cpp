#include "layers/LayerJson.h"

#include <QDebug>
#include <QJsonValue>

namespace {

void readString(const QJsonObject& o, const char* key, std::optional<QString>& out)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isString()) {
        out = v.toString();
    }
}

void readNumber(const QJsonObject& o, const char* key, std::optional<qreal>& out)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isDouble()) {
        out = v.toDouble();
    }
}

void readInt(const QJsonObject& o, const char* key, std::optional<int>& out)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isDouble()) {
        out = v.toInt();
    }
}

// Flags keep their JSON type so the permissive truthy check sees "1" vs 1
QVariant readFlag(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) {
        return QVariant();
    }
    return v.toVariant();
}

void writeString(QJsonObject& o, const char* key, const std::optional<QString>& value)
{
    if (value) {
        o.insert(QLatin1String(key), *value);
    }
}

void writeNumber(QJsonObject& o, const char* key, const std::optional<qreal>& value)
{
    if (value) {
        o.insert(QLatin1String(key), *value);
    }
}

void writeInt(QJsonObject& o, const char* key, const std::optional<int>& value)
{
    if (value) {
        o.insert(QLatin1String(key), *value);
    }
}

void writeFlag(QJsonObject& o, const char* key, const QVariant& value)
{
    if (value.isValid()) {
        o.insert(QLatin1String(key), QJsonValue::fromVariant(value));
    }
}

RichTextRun runFromJson(const QJsonValue& value)
{
    RichTextRun run;
    if (!value.isObject()) {
        return run;
    }
    const QJsonObject o = value.toObject();
    if (o.value(QLatin1String("text")).isString()) {
        run.text = o.value(QLatin1String("text")).toString();
    }
    const QJsonValue styleValue = o.value(QLatin1String("style"));
    if (styleValue.isObject()) {
        const QJsonObject s = styleValue.toObject();
        RichTextStyle style;
        readString(s, "fontWeight", style.fontWeight);
        readString(s, "fontStyle", style.fontStyle);
        readNumber(s, "fontSize", style.fontSize);
        readString(s, "fontFamily", style.fontFamily);
        readString(s, "color", style.color);
        readString(s, "textDecoration", style.textDecoration);
        run.style = style;
    }
    return run;
}

QJsonObject runToJson(const RichTextRun& run)
{
    QJsonObject o;
    if (run.text) {
        o.insert(QStringLiteral("text"), *run.text);
    } else {
        o.insert(QStringLiteral("text"), QJsonValue());
    }
    if (run.style) {
        QJsonObject s;
        writeString(s, "fontWeight", run.style->fontWeight);
        writeString(s, "fontStyle", run.style->fontStyle);
        writeNumber(s, "fontSize", run.style->fontSize);
        writeString(s, "fontFamily", run.style->fontFamily);
        writeString(s, "color", run.style->color);
        writeString(s, "textDecoration", run.style->textDecoration);
        o.insert(QStringLiteral("style"), s);
    }
    return o;
}

} // namespace

namespace LayerJson {

std::optional<GradientSpec> gradientFromJson(const QJsonValue& value)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject o = value.toObject();

    GradientSpec spec;
    spec.type = o.value(QLatin1String("type")).toString();
    readNumber(o, "angle", spec.angle);
    readNumber(o, "centerX", spec.centerX);
    readNumber(o, "centerY", spec.centerY);
    readNumber(o, "radius", spec.radius);

    const QJsonArray colors = o.value(QLatin1String("colors")).toArray();
    for (const QJsonValue& entry : colors) {
        const QJsonObject stop = entry.toObject();
        GradientStop s;
        s.offset = stop.value(QLatin1String("offset")).toDouble();
        s.color = stop.value(QLatin1String("color")).toString();
        spec.colors.append(s);
    }
    return spec;
}

QJsonObject gradientToJson(const GradientSpec& spec)
{
    QJsonObject o;
    o.insert(QStringLiteral("type"), spec.type);
    writeNumber(o, "angle", spec.angle);
    writeNumber(o, "centerX", spec.centerX);
    writeNumber(o, "centerY", spec.centerY);
    writeNumber(o, "radius", spec.radius);

    QJsonArray colors;
    for (const GradientStop& stop : spec.colors) {
        QJsonObject s;
        s.insert(QStringLiteral("offset"), stop.offset);
        s.insert(QStringLiteral("color"), stop.color);
        colors.append(s);
    }
    o.insert(QStringLiteral("colors"), colors);
    return o;
}

std::optional<Layer> layerFromJson(const QJsonObject& o)
{
    const std::optional<LayerType> type = layerTypeFromString(o.value(QLatin1String("type")).toString());
    if (!type) {
        return std::nullopt;
    }

    Layer layer;
    layer.type = *type;
    layer.id = o.value(QLatin1String("id")).toString();
    layer.name = o.value(QLatin1String("name")).toString();
    layer.visible = o.value(QLatin1String("visible")).toBool(true);
    layer.x = o.value(QLatin1String("x")).toDouble(0.0);
    layer.y = o.value(QLatin1String("y")).toDouble(0.0);

    readString(o, "stroke", layer.stroke);
    readString(o, "color", layer.color);
    readString(o, "fill", layer.fill);
    readNumber(o, "strokeWidth", layer.strokeWidth);
    readNumber(o, "opacity", layer.opacity);
    readNumber(o, "fillOpacity", layer.fillOpacity);
    readNumber(o, "strokeOpacity", layer.strokeOpacity);
    readNumber(o, "rotation", layer.rotation);
    if (o.contains(QLatin1String("gradient"))) {
        layer.gradient = gradientFromJson(o.value(QLatin1String("gradient")));
    }

    layer.shadow = readFlag(o, "shadow");
    readString(o, "shadowColor", layer.shadowColor);
    readNumber(o, "shadowBlur", layer.shadowBlur);
    readNumber(o, "shadowOffsetX", layer.shadowOffsetX);
    readNumber(o, "shadowOffsetY", layer.shadowOffsetY);
    readNumber(o, "shadowSpread", layer.shadowSpread);

    readNumber(o, "width", layer.width);
    readNumber(o, "height", layer.height);
    readNumber(o, "cornerRadius", layer.cornerRadius);
    readNumber(o, "padding", layer.padding);
    readNumber(o, "radius", layer.radius);
    readInt(o, "sides", layer.sides);
    readNumber(o, "radiusX", layer.radiusX);
    readNumber(o, "radiusY", layer.radiusY);
    readNumber(o, "outerRadius", layer.outerRadius);
    readNumber(o, "innerRadius", layer.innerRadius);

    readNumber(o, "x1", layer.x1);
    readNumber(o, "y1", layer.y1);
    readNumber(o, "x2", layer.x2);
    readNumber(o, "y2", layer.y2);
    readString(o, "arrowStyle", layer.arrowStyle);
    readNumber(o, "arrowSize", layer.arrowSize);

    const QJsonValue points = o.value(QLatin1String("points"));
    if (points.isArray()) {
        for (const QJsonValue& p : points.toArray()) {
            const QJsonObject po = p.toObject();
            layer.points.append(QPointF(po.value(QLatin1String("x")).toDouble(),
                                        po.value(QLatin1String("y")).toDouble()));
        }
    } else if (points.isDouble()) {
        layer.starPoints = points.toInt();
    }
    if (!layer.starPoints) {
        readInt(o, "starPoints", layer.starPoints);
    }
    layer.closed = o.value(QLatin1String("closed")).toBool(false);

    readString(o, "text", layer.text);
    readNumber(o, "fontSize", layer.fontSize);
    readString(o, "fontFamily", layer.fontFamily);
    readString(o, "fontWeight", layer.fontWeight);
    readString(o, "fontStyle", layer.fontStyle);
    readString(o, "textAlign", layer.textAlign);
    readString(o, "verticalAlign", layer.verticalAlign);
    readNumber(o, "lineHeight", layer.lineHeight);
    readNumber(o, "textStrokeWidth", layer.textStrokeWidth);
    readString(o, "textStrokeColor", layer.textStrokeColor);
    layer.textShadow = readFlag(o, "textShadow");
    readString(o, "textShadowColor", layer.textShadowColor);
    readNumber(o, "textShadowBlur", layer.textShadowBlur);
    readNumber(o, "textShadowOffsetX", layer.textShadowOffsetX);
    readNumber(o, "textShadowOffsetY", layer.textShadowOffsetY);

    const QJsonValue richText = o.value(QLatin1String("richText"));
    if (richText.isArray()) {
        for (const QJsonValue& run : richText.toArray()) {
            layer.richText.append(runFromJson(run));
        }
    }

    readNumber(o, "tailTipX", layer.tailTipX);
    readNumber(o, "tailTipY", layer.tailTipY);

    layer.src = o.value(QLatin1String("src")).toString();
    layer.shapeId = o.value(QLatin1String("shapeId")).toString();
    for (const QJsonValue& child : o.value(QLatin1String("children")).toArray()) {
        if (child.isString()) {
            layer.children.append(child.toString());
        }
    }
    return layer;
}

QJsonObject layerToJson(const Layer& layer)
{
    QJsonObject o;
    o.insert(QStringLiteral("type"), layerTypeName(layer.type));
    if (!layer.id.isEmpty()) {
        o.insert(QStringLiteral("id"), layer.id);
    }
    if (!layer.name.isEmpty()) {
        o.insert(QStringLiteral("name"), layer.name);
    }
    if (!layer.visible) {
        o.insert(QStringLiteral("visible"), false);
    }
    o.insert(QStringLiteral("x"), layer.x);
    o.insert(QStringLiteral("y"), layer.y);

    writeString(o, "stroke", layer.stroke);
    writeString(o, "color", layer.color);
    writeString(o, "fill", layer.fill);
    writeNumber(o, "strokeWidth", layer.strokeWidth);
    writeNumber(o, "opacity", layer.opacity);
    writeNumber(o, "fillOpacity", layer.fillOpacity);
    writeNumber(o, "strokeOpacity", layer.strokeOpacity);
    writeNumber(o, "rotation", layer.rotation);
    if (layer.gradient) {
        o.insert(QStringLiteral("gradient"), gradientToJson(*layer.gradient));
    }

    writeFlag(o, "shadow", layer.shadow);
    writeString(o, "shadowColor", layer.shadowColor);
    writeNumber(o, "shadowBlur", layer.shadowBlur);
    writeNumber(o, "shadowOffsetX", layer.shadowOffsetX);
    writeNumber(o, "shadowOffsetY", layer.shadowOffsetY);
    writeNumber(o, "shadowSpread", layer.shadowSpread);

    writeNumber(o, "width", layer.width);
    writeNumber(o, "height", layer.height);
    writeNumber(o, "cornerRadius", layer.cornerRadius);
    writeNumber(o, "padding", layer.padding);
    writeNumber(o, "radius", layer.radius);
    writeInt(o, "sides", layer.sides);
    writeNumber(o, "radiusX", layer.radiusX);
    writeNumber(o, "radiusY", layer.radiusY);
    writeNumber(o, "outerRadius", layer.outerRadius);
    writeNumber(o, "innerRadius", layer.innerRadius);

    writeNumber(o, "x1", layer.x1);
    writeNumber(o, "y1", layer.y1);
    writeNumber(o, "x2", layer.x2);
    writeNumber(o, "y2", layer.y2);
    writeString(o, "arrowStyle", layer.arrowStyle);
    writeNumber(o, "arrowSize", layer.arrowSize);

    if (layer.type == LayerType::Star) {
        writeInt(o, "points", layer.starPoints);
    } else if (!layer.points.isEmpty()) {
        QJsonArray points;
        for (const QPointF& p : layer.points) {
            QJsonObject po;
            po.insert(QStringLiteral("x"), p.x());
            po.insert(QStringLiteral("y"), p.y());
            points.append(po);
        }
        o.insert(QStringLiteral("points"), points);
    }
    if (layer.type == LayerType::Path) {
        o.insert(QStringLiteral("closed"), layer.closed);
    }

    writeString(o, "text", layer.text);
    writeNumber(o, "fontSize", layer.fontSize);
    writeString(o, "fontFamily", layer.fontFamily);
    writeString(o, "fontWeight", layer.fontWeight);
    writeString(o, "fontStyle", layer.fontStyle);
    writeString(o, "textAlign", layer.textAlign);
    writeString(o, "verticalAlign", layer.verticalAlign);
    writeNumber(o, "lineHeight", layer.lineHeight);
    writeNumber(o, "textStrokeWidth", layer.textStrokeWidth);
    writeString(o, "textStrokeColor", layer.textStrokeColor);
    writeFlag(o, "textShadow", layer.textShadow);
    writeString(o, "textShadowColor", layer.textShadowColor);
    writeNumber(o, "textShadowBlur", layer.textShadowBlur);
    writeNumber(o, "textShadowOffsetX", layer.textShadowOffsetX);
    writeNumber(o, "textShadowOffsetY", layer.textShadowOffsetY);

    if (!layer.richText.isEmpty()) {
        QJsonArray runs;
        for (const RichTextRun& run : layer.richText) {
            runs.append(runToJson(run));
        }
        o.insert(QStringLiteral("richText"), runs);
    }

    writeNumber(o, "tailTipX", layer.tailTipX);
    writeNumber(o, "tailTipY", layer.tailTipY);

    if (!layer.src.isEmpty()) {
        o.insert(QStringLiteral("src"), layer.src);
    }
    if (!layer.shapeId.isEmpty()) {
        o.insert(QStringLiteral("shapeId"), layer.shapeId);
    }
    if (!layer.children.isEmpty()) {
        o.insert(QStringLiteral("children"), QJsonArray::fromStringList(layer.children));
    }
    return o;
}

QVector<Layer> layersFromJson(const QJsonArray& array)
{
    QVector<Layer> layers;
    layers.reserve(array.size());
    for (int i = 0; i < array.size(); ++i) {
        const QJsonValue entry = array.at(i);
        if (!entry.isObject()) {
            qWarning() << "LayerJson: Skipping non-object entry at index" << i;
            continue;
        }
        std::optional<Layer> layer = layerFromJson(entry.toObject());
        if (!layer) {
            qWarning() << "LayerJson: Skipping layer with unknown type"
                       << entry.toObject().value(QLatin1String("type")).toString()
                       << "at index" << i;
            continue;
        }
        layers.append(std::move(*layer));
    }
    return layers;
}

QJsonArray layersToJson(const QVector<Layer>& layers)
{
    QJsonArray array;
    for (const Layer& layer : layers) {
        array.append(layerToJson(layer));
    }
    return array;
}

} // namespace LayerJson
