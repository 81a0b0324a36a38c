#ifndef RENDER_COMMAND_H
#define RENDER_COMMAND_H

#include "cli/CLICommand.h"

#include <QColor>
#include <QImage>
#include <QSize>
#include <QVector>

#include "layers/Layer.h"

namespace LayerCanvas {
namespace CLI {

/**
 * @brief Render a layer document to a PNG file (no GUI)
 */
class RenderCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    /**
     * @brief Draw @p layers onto a new image of @p canvasSize * @p scale.
     *
     * Image layers are decoded before the final pass, so the result never
     * shows a loading placeholder for a decodable source.
     */
    static QImage renderLayers(const QVector<Layer>& layers, const QSize& canvasSize,
                               const QColor& background, qreal scale);

    static constexpr int kDefaultWidth = 800;
    static constexpr int kDefaultHeight = 600;
    static constexpr int kMaxDimension = 16384;
};

} // namespace CLI
} // namespace LayerCanvas

#endif // RENDER_COMMAND_H
