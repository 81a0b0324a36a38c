#ifndef CLI_COMMAND_H
#define CLI_COMMAND_H

#include "CLIResult.h"

#include <QCommandLineParser>
#include <QString>
#include <memory>

namespace LayerCanvas {
namespace CLI {

/**
 * @brief Abstract base class for CLI commands
 */
class CLICommand
{
public:
    virtual ~CLICommand() = default;

    /**
     * @brief Command name (e.g., "render", "validate")
     */
    virtual QString name() const = 0;

    /**
     * @brief Command description for help text
     */
    virtual QString description() const = 0;

    /**
     * @brief Configure command options
     */
    virtual void setupOptions(QCommandLineParser& parser) = 0;

    /**
     * @brief Execute the command
     * @param parser Parsed command line
     * @return Execution result
     */
    virtual CLIResult execute(const QCommandLineParser& parser) = 0;
};

using CLICommandPtr = std::unique_ptr<CLICommand>;

} // namespace CLI
} // namespace LayerCanvas

#endif // CLI_COMMAND_H
