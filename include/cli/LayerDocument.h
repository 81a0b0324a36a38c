#ifndef LAYER_DOCUMENT_H
#define LAYER_DOCUMENT_H

#include <QJsonArray>
#include <QSize>
#include <QString>
#include <optional>

namespace LayerCanvas {
namespace CLI {

/**
 * @brief A layer list read from disk.
 *
 * The file holds either a bare JSON array of layers or an object with a
 * "layers" array and optional "width", "height" and "background".
 */
struct LayerDocument
{
    QJsonArray layers;
    std::optional<QSize> size;
    std::optional<QString> background;
};

/**
 * @brief Read and parse a layer document.
 * @param errorMessage Receives a description of the failure
 * @return std::nullopt if the file cannot be read or is not a layer document
 */
std::optional<LayerDocument> loadLayerDocument(const QString& path, QString* errorMessage);

} // namespace CLI
} // namespace LayerCanvas

#endif // LAYER_DOCUMENT_H
