#include <QtTest>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "cli/CLIHandler.h"
#include "cli/commands/ValidateCommand.h"

using LayerCanvas::CLI::CLIHandler;
using LayerCanvas::CLI::CLIResult;
using LayerCanvas::CLI::ValidateCommand;

class tst_ValidateCommand : public QObject
{
    Q_OBJECT

private slots:
    void validateLayers_acceptsWellFormedLayers();
    void validateLayers_reportsNonObjects();
    void validateLayers_reportsUnknownType();
    void validateLayers_reportsGradientProblems();
    void validateLayers_reportsZeroSizeShapes();
    void validateLayers_labelsWithId();
    void validateLayers_reportsVertexCountOutOfRange();

    void execute_cleanDocument();
    void execute_documentWithProblems();
    void execute_missingFile();

private:
    static QJsonArray parseArray(const QByteArray& json);
};

QJsonArray tst_ValidateCommand::parseArray(const QByteArray& json)
{
    return QJsonDocument::fromJson(json).array();
}

void tst_ValidateCommand::validateLayers_acceptsWellFormedLayers()
{
    const QJsonArray layers = parseArray(R"([
        {"type": "rectangle", "x": 0, "y": 0, "width": 10, "height": 10},
        {"type": "pen", "points": [{"x": 0, "y": 0}, {"x": 5, "y": 5}]},
        {"type": "text", "x": 0, "y": 0, "text": "hi"},
        {"type": "image", "src": "a.png"},
        {"type": "group", "children": []}
    ])");
    QVERIFY(ValidateCommand::validateLayers(layers).isEmpty());
}

void tst_ValidateCommand::validateLayers_reportsNonObjects()
{
    const QStringList problems = ValidateCommand::validateLayers(parseArray(R"([42, "x"])"));
    QCOMPARE(problems, QStringList({"Layer 0: not an object", "Layer 1: not an object"}));
}

void tst_ValidateCommand::validateLayers_reportsUnknownType()
{
    const QStringList problems = ValidateCommand::validateLayers(parseArray(R"([{"type": "sparkle"}])"));
    QCOMPARE(problems, QStringList{"Layer 0: unknown type \"sparkle\""});
}

void tst_ValidateCommand::validateLayers_reportsGradientProblems()
{
    const QStringList problems = ValidateCommand::validateLayers(parseArray(R"([
        {"type": "rectangle", "width": 10, "height": 10,
         "gradient": {"type": "linear", "colors": [{"offset": 0, "color": "#000"}]}}
    ])"));
    QCOMPARE(problems.size(), 1);
    QVERIFY(problems.first().startsWith("Layer 0: gradient: "));
    QVERIFY(problems.first().contains("at least 2 color stops"));
}

void tst_ValidateCommand::validateLayers_reportsZeroSizeShapes()
{
    const QStringList problems = ValidateCommand::validateLayers(parseArray(R"([
        {"type": "circle", "x": 5, "y": 5},
        {"type": "line", "x1": 1, "y1": 1, "x2": 1, "y2": 1},
        {"type": "text", "x": 0, "y": 0}
    ])"));
    QCOMPARE(problems, QStringList({
        "Layer 0: circle has no visible size",
        "Layer 1: line has no visible size",
        "Layer 2: text has no visible size",
    }));
}

void tst_ValidateCommand::validateLayers_labelsWithId()
{
    const QStringList problems = ValidateCommand::validateLayers(parseArray(R"([
        {"type": "ellipse", "id": "oval", "radiusX": 4}
    ])"));
    QCOMPARE(problems, QStringList{"Layer 0 (oval): ellipse has no visible size"});
}

void tst_ValidateCommand::validateLayers_reportsVertexCountOutOfRange()
{
    const QStringList problems = ValidateCommand::validateLayers(parseArray(R"([
        {"type": "star", "x": 10, "y": 10, "outerRadius": 8, "points": 2000000000},
        {"type": "polygon", "x": 10, "y": 10, "radius": 8, "sides": 2},
        {"type": "polygon", "x": 10, "y": 10, "radius": 8, "sides": 20}
    ])"));
    QCOMPARE(problems, QStringList({
        "Layer 0: star count 2000000000 is outside 3..20",
        "Layer 1: polygon count 2 is outside 3..20",
    }));
}

void tst_ValidateCommand::execute_cleanDocument()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("ok.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"layers": [{"type": "star", "x": 10, "y": 10, "outerRadius": 8}]})");
    file.close();

    CLIHandler handler;
    const CLIResult result = handler.process({"layercanvas-render", "validate", path});
    QVERIFY2(result.isSuccess(), qPrintable(result.message));
    QCOMPARE(result.message, QString("1 layers OK"));
}

void tst_ValidateCommand::execute_documentWithProblems()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("bad.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"([{"type": "rectangle"}, {"type": "circle", "radius": 3}])");
    file.close();

    ValidateCommand command;
    QCommandLineParser parser;
    command.setupOptions(parser);
    QVERIFY(parser.parse({"layercanvas-render", path}));

    const CLIResult result = command.execute(parser);
    QCOMPARE(result.code, CLIResult::Code::InvalidDocument);
    QCOMPARE(result.exitCode(), 4);
    QVERIFY(result.message.startsWith("1 problem(s) in 2 layers:"));
    QVERIFY(result.message.contains("Layer 0: rectangle has no visible size"));
}

void tst_ValidateCommand::execute_missingFile()
{
    ValidateCommand command;
    QCommandLineParser parser;
    command.setupOptions(parser);

    QVERIFY(parser.parse({"layercanvas-render"}));
    QCOMPARE(command.execute(parser).code, CLIResult::Code::InvalidArguments);

    QVERIFY(parser.parse({"layercanvas-render", "/nonexistent/layers.json"}));
    const CLIResult result = command.execute(parser);
    QCOMPARE(result.code, CLIResult::Code::FileError);
    QVERIFY(result.message.contains("Cannot open"));
}

QTEST_MAIN(tst_ValidateCommand)
#include "tst_ValidateCommand.moc"
