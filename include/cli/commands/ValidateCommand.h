#ifndef VALIDATE_COMMAND_H
#define VALIDATE_COMMAND_H

#include "cli/CLICommand.h"

#include <QJsonArray>
#include <QStringList>

namespace LayerCanvas {
namespace CLI {

/**
 * @brief Check a layer document without rendering it
 */
class ValidateCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    /**
     * @brief Problems found in a layer array, one line each.
     *
     * Reports entries that are not objects or have an unknown type,
     * malformed gradients and zero-size shapes.
     */
    static QStringList validateLayers(const QJsonArray& layers);
};

} // namespace CLI
} // namespace LayerCanvas

#endif // VALIDATE_COMMAND_H
