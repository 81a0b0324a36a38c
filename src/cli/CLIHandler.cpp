#include "cli/CLIHandler.h"

#include "cli/commands/RenderCommand.h"
#include "cli/commands/ValidateCommand.h"
#include "version.h"

#include <QCommandLineParser>
#include <QTextStream>

namespace LayerCanvas {
namespace CLI {

CLIHandler::CLIHandler() { registerCommands(); }

CLIHandler::~CLIHandler() = default;

void CLIHandler::registerCommands()
{
    auto addCmd = [this](CLICommandPtr cmd) { m_commands[cmd->name()] = std::move(cmd); };

    addCmd(std::make_unique<RenderCommand>());
    addCmd(std::make_unique<ValidateCommand>());
}

CLIResult CLIHandler::process(const QStringList& arguments)
{
    if (arguments.size() < 2) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, getHelpText());
    }

    const QString& cmdOrOption = arguments.at(1);

    // Handle global options
    if (cmdOrOption == "--help" || cmdOrOption == "-h") {
        return CLIResult::success(getHelpText());
    }
    if (cmdOrOption == "--version" || cmdOrOption == "-v") {
        return CLIResult::success(getVersionText());
    }

    // Find command
    CLICommand* command = findCommand(cmdOrOption);
    if (!command) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Unknown command: %1 (available: %2)\n\n%3")
                .arg(cmdOrOption, commandNames().join(", "), getHelpText()));
    }

    // Setup and parse command arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(command->description());
    parser.addHelpOption();

    command->setupOptions(parser);

    // Remove command name, keep remaining arguments
    QStringList cmdArgs = arguments;
    cmdArgs.removeAt(1);

    if (!parser.parse(cmdArgs)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }

    if (parser.isSet("help")) {
        return CLIResult::success(parser.helpText());
    }

    return command->execute(parser);
}

QStringList CLIHandler::commandNames() const
{
    QStringList names;
    for (const auto& entry : m_commands) {
        names << entry.first;
    }
    return names;
}

CLICommand* CLIHandler::findCommand(const QString& name) const
{
    auto it = m_commands.find(name.toLower());
    return it != m_commands.end() ? it->second.get() : nullptr;
}

QString CLIHandler::getHelpText() const
{
    QString help;
    QTextStream out(&help);

    out << "LayerCanvas - Layer document renderer\n\n";
    out << "Usage: layercanvas-render <command> [options]\n\n";
    out << "Commands:\n";

    // std::map keeps names sorted
    for (const auto& [name, cmd] : m_commands) {
        out << QString("  %1  %2\n").arg(name, -10).arg(cmd->description());
    }

    out << "\nGlobal Options:\n";
    out << "  -h, --help     Display this help message\n";
    out << "  -v, --version  Display version information\n";
    out << "\nUse 'layercanvas-render <command> --help' for more information about a command.\n";

    return help;
}

QString CLIHandler::getVersionText() { return QString("LayerCanvas version %1").arg(LAYERCANVAS_VERSION); }

} // namespace CLI
} // namespace LayerCanvas
