#ifndef LAYERJSON_H
#define LAYERJSON_H

#include <QJsonArray>
#include <QJsonObject>
#include <QVector>
#include <optional>

#include "layers/Layer.h"

/**
 * @brief Conversion between Layer records and their JSON representation.
 *
 * Field names follow the layer wire format used by the host application
 * (lower camel case). Unknown fields are ignored; fields of the wrong JSON
 * type are treated as absent. For star layers "points" carries the tip
 * count, for path layers it carries the vertex array.
 */
namespace LayerJson {

/**
 * @brief Parse one layer.
 * @return std::nullopt when "type" is missing or not a known layer type
 */
std::optional<Layer> layerFromJson(const QJsonObject& object);

QJsonObject layerToJson(const Layer& layer);

/**
 * @brief Parse an ordered layer list, keeping order.
 *
 * Entries that are not objects or have an unknown type are skipped with a
 * warning.
 */
QVector<Layer> layersFromJson(const QJsonArray& array);

QJsonArray layersToJson(const QVector<Layer>& layers);

/**
 * @brief Parse a gradient description.
 *
 * Structural checks are left to GradientBuilder::validate(); this only
 * fails when @p value is not an object.
 */
std::optional<GradientSpec> gradientFromJson(const QJsonValue& value);

QJsonObject gradientToJson(const GradientSpec& spec);

} // namespace LayerJson

#endif // LAYERJSON_H
