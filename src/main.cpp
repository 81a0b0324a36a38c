#include <QGuiApplication>
#include <QTextStream>
#include <cstdio>

#include "cli/CLIHandler.h"
#include "version.h"

int main(int argc, char *argv[])
{
    // Rendering needs fonts but no display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(LAYERCANVAS_APP_NAME);
    app.setOrganizationName(LAYERCANVAS_APP_NAME);
    app.setApplicationVersion(LAYERCANVAS_VERSION);

    LayerCanvas::CLI::CLIHandler handler;
    const LayerCanvas::CLI::CLIResult result = handler.process(app.arguments());

    if (!result.data.isEmpty()) {
        std::fwrite(result.data.constData(), 1, static_cast<size_t>(result.data.size()), stdout);
        std::fflush(stdout);
    } else if (!result.message.isEmpty()) {
        QTextStream stream(result.isSuccess() ? stdout : stderr);
        stream << result.message;
        if (!result.message.endsWith('\n')) {
            stream << '\n';
        }
    }

    return result.exitCode();
}
