#ifndef CLI_RESULT_H
#define CLI_RESULT_H

#include <QByteArray>
#include <QString>

namespace LayerCanvas {
namespace CLI {

/**
 * @brief Outcome of a layercanvas-render command.
 *
 * The code is also the process exit status. `render --raw` returns the
 * encoded PNG in @c data and leaves @c message empty.
 */
struct CLIResult
{
    enum class Code {
        Success = 0,
        GeneralError = 1,     // PNG encoding failed
        InvalidArguments = 2, // Missing input, bad size, scale or colour
        FileError = 3,        // Document unreadable or not a layer document, output unwritable
        InvalidDocument = 4,  // validate found problems
    };

    Code code = Code::Success;
    QString message;
    QByteArray data;

    bool isSuccess() const { return code == Code::Success; }
    int exitCode() const { return static_cast<int>(code); }

    static CLIResult success(const QString& msg = QString()) { return {Code::Success, msg, {}}; }

    static CLIResult error(Code code, const QString& msg) { return {code, msg, {}}; }

    static CLIResult pngBytes(const QByteArray& png) { return {Code::Success, {}, png}; }
};

} // namespace CLI
} // namespace LayerCanvas

#endif // CLI_RESULT_H
