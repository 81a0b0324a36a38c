#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLICommand.h"
#include "CLIResult.h"

#include <QString>
#include <QStringList>
#include <map>
#include <memory>

namespace LayerCanvas {
namespace CLI {

/**
 * @brief Dispatches `layercanvas-render <command> [options]`.
 *
 * Owns the render and validate commands. Each invocation gets a fresh
 * QCommandLineParser with the command's options and a --help option.
 * Command names match case-insensitively.
 */
class CLIHandler
{
public:
    CLIHandler();
    ~CLIHandler();

    /**
     * @brief Run the command named by arguments[1]
     * @param arguments Full argv, program name first
     */
    CLIResult process(const QStringList& arguments);

    // Registered command names in sorted order
    QStringList commandNames() const;

    QString getHelpText() const;
    static QString getVersionText();

private:
    void registerCommands();
    CLICommand* findCommand(const QString& name) const;

    std::map<QString, CLICommandPtr> m_commands;
};

} // namespace CLI
} // namespace LayerCanvas

#endif // CLI_HANDLER_H
