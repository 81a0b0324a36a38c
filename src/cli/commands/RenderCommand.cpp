#include "cli/commands/RenderCommand.h"

#include "cli/LayerDocument.h"
#include "layers/LayerJson.h"
#include "render/LayerRenderer.h"
#include "settings/EditorSettingsManager.h"
#include "utils/ColorUtils.h"

#include <QBuffer>
#include <QPainter>

namespace LayerCanvas {
namespace CLI {

namespace {

bool parseDimension(const QCommandLineParser& parser, const QString& option, int* value)
{
    if (!parser.isSet(option)) {
        return true;
    }
    bool ok = false;
    const int parsed = parser.value(option).toInt(&ok);
    if (!ok || parsed <= 0 || parsed > RenderCommand::kMaxDimension) {
        return false;
    }
    *value = parsed;
    return true;
}

} // namespace

QString RenderCommand::name() const { return "render"; }

QString RenderCommand::description() const { return "Render a layer document to PNG"; }

void RenderCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("input", "Layer document (JSON array or {\"layers\": [...]})");
    parser.addOption({{"W", "width"}, "Canvas width in layer units", "px"});
    parser.addOption({{"H", "height"}, "Canvas height in layer units", "px"});
    parser.addOption({{"b", "background"}, "Background colour (CSS syntax)", "color"});
    parser.addOption({{"s", "scale"}, "Output scale factor", "factor", "1"});
    parser.addOption({{"o", "output"}, "Output PNG file path", "file"});
    parser.addOption({"raw", "Output raw PNG to stdout"});
}

CLIResult RenderCommand::execute(const QCommandLineParser& parser)
{
    const QStringList positionalArgs = parser.positionalArguments();
    if (positionalArgs.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                "Input file required.\n"
                                "Usage: layercanvas-render render <input.json> -o <output.png>");
    }
    if (!parser.isSet("output") && !parser.isSet("raw")) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                "Either --output or --raw is required");
    }

    QString errorMessage;
    const std::optional<LayerDocument> document = loadLayerDocument(positionalArgs.at(0), &errorMessage);
    if (!document) {
        return CLIResult::error(CLIResult::Code::FileError, errorMessage);
    }

    int width = document->size ? document->size->width() : kDefaultWidth;
    int height = document->size ? document->size->height() : kDefaultHeight;
    if (!parseDimension(parser, "width", &width)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                QString("Invalid width: %1").arg(parser.value("width")));
    }
    if (!parseDimension(parser, "height", &height)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                QString("Invalid height: %1").arg(parser.value("height")));
    }

    bool scaleOk = false;
    const qreal scale = parser.value("scale").toDouble(&scaleOk);
    if (!scaleOk || scale <= 0.0 || width * scale > kMaxDimension || height * scale > kMaxDimension) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                QString("Invalid scale: %1").arg(parser.value("scale")));
    }

    const QString backgroundName = parser.isSet("background")
        ? parser.value("background")
        : document->background.value_or(QStringLiteral("transparent"));
    const QColor background = ColorUtils::isNoneOrTransparent(backgroundName)
        ? QColor(Qt::transparent)
        : ColorUtils::parseColor(backgroundName);
    if (!background.isValid()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                QString("Invalid background colour: %1").arg(backgroundName));
    }

    const QVector<Layer> layers = LayerJson::layersFromJson(document->layers);
    const QImage image = renderLayers(layers, QSize(width, height), background, scale);

    if (parser.isSet("raw")) {
        QByteArray data;
        QBuffer buffer(&data);
        buffer.open(QIODevice::WriteOnly);
        if (!image.save(&buffer, "PNG")) {
            return CLIResult::error(CLIResult::Code::GeneralError, "Failed to encode PNG");
        }
        return CLIResult::pngBytes(data);
    }

    const QString outputPath = parser.value("output");
    if (!image.save(outputPath, "PNG")) {
        return CLIResult::error(CLIResult::Code::FileError,
                                QString("Failed to save: %1").arg(outputPath));
    }
    return CLIResult::success(QString("Rendered %1 layers to: %2").arg(layers.size()).arg(outputPath));
}

QImage RenderCommand::renderLayers(const QVector<Layer>& layers, const QSize& canvasSize,
                                   const QColor& background, qreal scale)
{
    const QSize pixelSize(qRound(canvasSize.width() * scale), qRound(canvasSize.height() * scale));
    QImage image(pixelSize, QImage::Format_ARGB32_Premultiplied);

    const auto& settings = EditorSettingsManager::instance();
    LayerRenderer renderer(settings.loadPathCacheSize(), settings.loadImageCacheSize());

    LayerRenderOptions options;
    options.scale = RenderScale::uniform(scale);
    options.shadowScale = RenderScale::uniform(scale);

    auto paint = [&]() {
        image.fill(background);
        QPainter painter(&image);
        painter.setRenderHint(QPainter::Antialiasing);
        renderer.renderLayers(painter, layers, options);
    };

    paint();

    // Image layers decode asynchronously; repaint once they are ready
    if (renderer.imageRenderer().pendingDecodeCount() > 0) {
        renderer.imageRenderer().waitForPendingDecodes();
        paint();
    }
    return image;
}

} // namespace CLI
} // namespace LayerCanvas
