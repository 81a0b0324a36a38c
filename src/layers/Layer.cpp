#include "layers/Layer.h"

namespace {

struct LayerTypeEntry {
    LayerType type;
    const char* name;
};

constexpr LayerTypeEntry kLayerTypes[] = {
    { LayerType::Rectangle, "rectangle" },
    { LayerType::Circle, "circle" },
    { LayerType::Ellipse, "ellipse" },
    { LayerType::Line, "line" },
    { LayerType::Arrow, "arrow" },
    { LayerType::Polygon, "polygon" },
    { LayerType::Star, "star" },
    { LayerType::Path, "path" },
    { LayerType::Text, "text" },
    { LayerType::TextBox, "textbox" },
    { LayerType::Callout, "callout" },
    { LayerType::Image, "image" },
    { LayerType::Group, "group" },
    { LayerType::CustomShape, "customShape" },
};

} // namespace

QString layerTypeName(LayerType type)
{
    for (const auto& entry : kLayerTypes) {
        if (entry.type == type) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QString();
}

std::optional<LayerType> layerTypeFromString(const QString& name)
{
    // Freehand pen strokes are stored as paths
    if (name == QLatin1String("pen")) {
        return LayerType::Path;
    }
    for (const auto& entry : kLayerTypes) {
        if (name == QLatin1String(entry.name)) {
            return entry.type;
        }
    }
    return std::nullopt;
}

bool isTruthyFlag(const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        return value.toBool();
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Double:
    case QMetaType::Float:
        return value.toDouble() == 1.0;
    case QMetaType::QString: {
        const QString s = value.toString();
        return s == QLatin1String("true") || s == QLatin1String("1");
    }
    default:
        return false;
    }
}

bool isFalsyFlag(const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        return !value.toBool();
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Double:
    case QMetaType::Float:
        return value.toDouble() == 0.0;
    case QMetaType::QString: {
        const QString s = value.toString();
        return s == QLatin1String("false") || s == QLatin1String("0");
    }
    default:
        return false;
    }
}
