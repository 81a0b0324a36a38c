#include "cli/LayerDocument.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace LayerCanvas {
namespace CLI {

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

} // namespace

std::optional<LayerDocument> loadLayerDocument(const QString& path, QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QString("Cannot open %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument json = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QString("Invalid JSON in %1 at offset %2: %3")
                                   .arg(path)
                                   .arg(parseError.offset)
                                   .arg(parseError.errorString()));
        return std::nullopt;
    }

    LayerDocument document;
    if (json.isArray()) {
        document.layers = json.array();
        return document;
    }

    const QJsonObject root = json.object();
    if (!root.value("layers").isArray()) {
        setError(errorMessage, QString("%1 has no \"layers\" array").arg(path));
        return std::nullopt;
    }
    document.layers = root.value("layers").toArray();

    const int width = root.value("width").toInt(0);
    const int height = root.value("height").toInt(0);
    if (width > 0 && height > 0) {
        document.size = QSize(width, height);
    }
    if (root.value("background").isString()) {
        document.background = root.value("background").toString();
    }
    return document;
}

} // namespace CLI
} // namespace LayerCanvas
