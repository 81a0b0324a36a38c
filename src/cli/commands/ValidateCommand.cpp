#include "cli/commands/ValidateCommand.h"

#include "cli/LayerDocument.h"
#include "layers/LayerJson.h"
#include "render/GradientBuilder.h"
#include "tools/ShapeFactory.h"
#include "utils/PolygonGeometry.h"

#include <QJsonObject>
#include <QTextStream>

namespace LayerCanvas {
namespace CLI {

QString ValidateCommand::name() const { return "validate"; }

QString ValidateCommand::description() const { return "Check a layer document for problems"; }

void ValidateCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("input", "Layer document (JSON array or {\"layers\": [...]})");
}

CLIResult ValidateCommand::execute(const QCommandLineParser& parser)
{
    const QStringList positionalArgs = parser.positionalArguments();
    if (positionalArgs.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                "Input file required.\n"
                                "Usage: layercanvas-render validate <input.json>");
    }

    QString errorMessage;
    const std::optional<LayerDocument> document = loadLayerDocument(positionalArgs.at(0), &errorMessage);
    if (!document) {
        return CLIResult::error(CLIResult::Code::FileError, errorMessage);
    }

    const QStringList problems = validateLayers(document->layers);
    if (problems.isEmpty()) {
        return CLIResult::success(QString("%1 layers OK").arg(document->layers.size()));
    }

    QString output;
    QTextStream out(&output);
    out << problems.size() << " problem(s) in " << document->layers.size() << " layers:\n";
    for (const QString& problem : problems) {
        out << "  " << problem << "\n";
    }
    return CLIResult::error(CLIResult::Code::InvalidDocument, output);
}

QStringList ValidateCommand::validateLayers(const QJsonArray& layers)
{
    QStringList problems;

    for (int i = 0; i < layers.size(); ++i) {
        const QJsonValue value = layers.at(i);
        if (!value.isObject()) {
            problems << QString("Layer %1: not an object").arg(i);
            continue;
        }

        const QJsonObject object = value.toObject();
        const QString label = object.value("id").isString()
            ? QString("Layer %1 (%2)").arg(i).arg(object.value("id").toString())
            : QString("Layer %1").arg(i);

        const std::optional<Layer> layer = LayerJson::layerFromJson(object);
        if (!layer) {
            problems << QString("%1: unknown type \"%2\"").arg(label, object.value("type").toString());
            continue;
        }

        if (object.contains("gradient")) {
            const GradientValidation validation = GradientBuilder::validate(object.value("gradient"));
            for (const QString& error : validation.errors) {
                problems << QString("%1: gradient: %2").arg(label, error);
            }
        }

        if (!ShapeFactory::hasValidSize(*layer)) {
            problems << QString("%1: %2 has no visible size").arg(label, layerTypeName(layer->type));
        }

        std::optional<int> count;
        if (layer->type == LayerType::Polygon) {
            count = layer->sides;
        } else if (layer->type == LayerType::Star) {
            count = layer->starPoints;
        }
        if (count && (*count < PolygonGeometry::kMinSides || *count > PolygonGeometry::kMaxSides)) {
            problems << QString("%1: %2 count %3 is outside %4..%5")
                            .arg(label, layerTypeName(layer->type))
                            .arg(*count)
                            .arg(PolygonGeometry::kMinSides)
                            .arg(PolygonGeometry::kMaxSides);
        }
    }
    return problems;
}

} // namespace CLI
} // namespace LayerCanvas
