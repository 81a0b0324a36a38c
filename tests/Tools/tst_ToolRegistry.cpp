#include <QtTest/QtTest>
#include "tools/ToolRegistry.h"
#include "tools/ToolDefinition.h"

/**
 * @brief Tests for ToolRegistry class
 *
 * Covers:
 * - Singleton pattern and independent registries
 * - Built-in tool set, order and categories
 * - Tool classification (drawing, selection, shape)
 * - Registration, replacement and removal
 * - Cursor lookup and display names
 */
class TestToolRegistry : public QObject
{
    Q_OBJECT

private slots:
    // Singleton tests
    void testSingleton_SameInstance();
    void testIndependentRegistries();

    // Built-in tools
    void testBuiltIns_ToolNamesInOrder();
    void testBuiltIns_Categories();
    void testBuiltIns_PenIsDrawingTool();

    // Retrieval
    void testGet_ValidTool();
    void testGet_UnknownTool();
    void testGetCursor_data();
    void testGetCursor();
    void testGetDisplayName();
    void testGetCursorMap();

    // Classification
    void testIsDrawingTool();
    void testIsSelectionTool();
    void testIsShapeTool();
    void testCreatesLayer();

    // Registration
    void testRegisterTool_AppliesDefaults();
    void testRegisterTool_EmptyNameIgnored();
    void testRegisterTool_ReplaceKeepsOrder();
    void testRegisterTool_MovesBetweenCategories();
    void testUnregisterTool_DropsEmptyCategory();
    void testClearAndReset();

    // Cursor shapes
    void testCursorShape();
};

// ============================================================================
// Singleton Tests
// ============================================================================

void TestToolRegistry::testSingleton_SameInstance()
{
    ToolRegistry& instance1 = ToolRegistry::instance();
    ToolRegistry& instance2 = ToolRegistry::instance();

    QCOMPARE(&instance1, &instance2);
}

void TestToolRegistry::testIndependentRegistries()
{
    ToolRegistry local;
    local.unregisterTool("pan");

    QVERIFY(!local.has("pan"));
    QVERIFY(ToolRegistry::instance().has("pan"));
}

// ============================================================================
// Built-in Tools
// ============================================================================

void TestToolRegistry::testBuiltIns_ToolNamesInOrder()
{
    ToolRegistry registry;
    const QStringList expected = {
        "pointer", "pan", "pen", "path", "rectangle", "circle", "ellipse", "polygon",
        "star", "line", "arrow", "text", "textbox", "callout", "eyedropper"
    };
    QCOMPARE(registry.getToolNames(), expected);
}

void TestToolRegistry::testBuiltIns_Categories()
{
    ToolRegistry registry;
    const QStringList expected = {
        "selection", "navigation", "drawing", "shape", "line", "annotation", "utility"
    };
    QCOMPARE(registry.getCategories(), expected);
    QCOMPARE(registry.getToolsByCategory("line"), QStringList({ "line", "arrow" }));
    QCOMPARE(registry.getToolsByCategory("shape").size(), 5);
    QVERIFY(registry.getToolsByCategory("nonexistent").isEmpty());
}

void TestToolRegistry::testBuiltIns_PenIsDrawingTool()
{
    ToolRegistry registry;
    const auto pen = registry.get("pen");
    QVERIFY(pen.has_value());
    QCOMPARE(pen->category, QString("drawing"));
    QCOMPARE(pen->cursor, QString("crosshair"));
    QVERIFY(pen->createsLayer);
}

// ============================================================================
// Retrieval Tests
// ============================================================================

void TestToolRegistry::testGet_ValidTool()
{
    ToolRegistry registry;
    const auto text = registry.get("text");
    QVERIFY(text.has_value());
    QCOMPARE(text->name, QString("text"));
    QCOMPARE(text->cursor, QString("text"));
    QCOMPARE(text->category, QString("annotation"));
    QVERIFY(text->isValid());
}

void TestToolRegistry::testGet_UnknownTool()
{
    ToolRegistry registry;
    QVERIFY(!registry.get("laser").has_value());
    QVERIFY(!registry.has("laser"));
}

void TestToolRegistry::testGetCursor_data()
{
    QTest::addColumn<QString>("tool");
    QTest::addColumn<QString>("cursor");

    QTest::newRow("pointer") << "pointer" << "default";
    QTest::newRow("pan") << "pan" << "grab";
    QTest::newRow("rectangle") << "rectangle" << "crosshair";
    QTest::newRow("text") << "text" << "text";
    QTest::newRow("unknown") << "unknown" << "default";
}

void TestToolRegistry::testGetCursor()
{
    QFETCH(QString, tool);
    QFETCH(QString, cursor);

    ToolRegistry registry;
    QCOMPARE(registry.getCursor(tool), cursor);
}

void TestToolRegistry::testGetDisplayName()
{
    ToolRegistry registry;
    QCOMPARE(registry.getDisplayName("rectangle"), QString("Rectangle"));
    QCOMPARE(registry.getDisplayName("textbox"), QString("Textbox"));
    QCOMPARE(registry.getDisplayName(QString()), QString());
}

void TestToolRegistry::testGetCursorMap()
{
    ToolRegistry registry;
    const QMap<QString, QString> map = registry.getCursorMap();
    QCOMPARE(map.size(), registry.getToolNames().size());
    QCOMPARE(map.value("pan"), QString("grab"));
    QCOMPARE(map.value("eyedropper"), QString("crosshair"));
}

// ============================================================================
// Classification Tests
// ============================================================================

void TestToolRegistry::testIsDrawingTool()
{
    ToolRegistry registry;
    QVERIFY(registry.isDrawingTool("pen"));
    QVERIFY(registry.isDrawingTool("star"));
    QVERIFY(registry.isDrawingTool("arrow"));
    QVERIFY(registry.isDrawingTool("callout"));

    QVERIFY(!registry.isDrawingTool("pointer"));
    QVERIFY(!registry.isDrawingTool("pan"));
    QVERIFY(!registry.isDrawingTool("eyedropper"));
    QVERIFY(!registry.isDrawingTool("unknown"));
}

void TestToolRegistry::testIsSelectionTool()
{
    ToolRegistry registry;
    QVERIFY(registry.isSelectionTool("pointer"));
    QVERIFY(!registry.isSelectionTool("pan"));
    QVERIFY(!registry.isSelectionTool("unknown"));
}

void TestToolRegistry::testIsShapeTool()
{
    ToolRegistry registry;
    QVERIFY(registry.isShapeTool("polygon"));
    QVERIFY(!registry.isShapeTool("line"));
    QVERIFY(!registry.isShapeTool("path"));
}

void TestToolRegistry::testCreatesLayer()
{
    ToolRegistry registry;
    QVERIFY(registry.createsLayer("path"));
    QVERIFY(registry.createsLayer("textbox"));
    QVERIFY(!registry.createsLayer("pointer"));
    QVERIFY(!registry.createsLayer("eyedropper"));
    QVERIFY(!registry.createsLayer("unknown"));
}

// ============================================================================
// Registration Tests
// ============================================================================

void TestToolRegistry::testRegisterTool_AppliesDefaults()
{
    ToolRegistry registry;
    ToolDefinition def;
    def.cursor.clear();
    def.category.clear();
    def.createsLayer = false;
    registry.registerTool("laser", def);

    const auto laser = registry.get("laser");
    QVERIFY(laser.has_value());
    QCOMPARE(laser->name, QString("laser"));
    QCOMPARE(laser->cursor, QString("default"));
    QCOMPARE(laser->category, QString("other"));
    QCOMPARE(registry.getToolNames().last(), QString("laser"));
    QCOMPARE(registry.getCategories().last(), QString("other"));
    QCOMPARE(registry.getToolsByCategory("other"), QStringList{ "laser" });
}

void TestToolRegistry::testRegisterTool_EmptyNameIgnored()
{
    ToolRegistry registry;
    const int before = registry.getToolNames().size();
    registry.registerTool(QString(), ToolDefinition());
    QCOMPARE(registry.getToolNames().size(), before);
}

void TestToolRegistry::testRegisterTool_ReplaceKeepsOrder()
{
    ToolRegistry registry;
    ToolDefinition def;
    def.cursor = QStringLiteral("pointer");
    def.category = QStringLiteral("shape");
    registry.registerTool("circle", def);

    QCOMPARE(registry.getCursor("circle"), QString("pointer"));
    QCOMPARE(registry.getToolNames().indexOf("circle"), 5);
    QCOMPARE(registry.getToolsByCategory("shape").count("circle"), 1);
}

void TestToolRegistry::testRegisterTool_MovesBetweenCategories()
{
    ToolRegistry registry;
    ToolDefinition def;
    def.category = QStringLiteral("utility");
    def.createsLayer = false;
    registry.registerTool("pan", def);

    QCOMPARE(registry.get("pan")->category, QString("utility"));
    QCOMPARE(registry.getToolsByCategory("utility"), QStringList({ "eyedropper", "pan" }));
    // navigation only held pan
    QVERIFY(!registry.getCategories().contains("navigation"));
}

void TestToolRegistry::testUnregisterTool_DropsEmptyCategory()
{
    ToolRegistry registry;
    QVERIFY(registry.unregisterTool("eyedropper"));
    QVERIFY(!registry.has("eyedropper"));
    QVERIFY(!registry.getToolNames().contains("eyedropper"));
    QVERIFY(!registry.getCategories().contains("utility"));

    QVERIFY(!registry.unregisterTool("eyedropper"));

    QVERIFY(registry.unregisterTool("line"));
    QCOMPARE(registry.getToolsByCategory("line"), QStringList{ "arrow" });
}

void TestToolRegistry::testClearAndReset()
{
    ToolRegistry registry;
    registry.clear();
    QVERIFY(registry.getToolNames().isEmpty());
    QVERIFY(registry.getCategories().isEmpty());
    QVERIFY(registry.getCursorMap().isEmpty());
    QCOMPARE(registry.getCursor("pan"), QString("default"));

    registry.reset();
    QCOMPARE(registry.getToolNames().size(), 15);
    QVERIFY(registry.isShapeTool("star"));
}

// ============================================================================
// Cursor Shapes
// ============================================================================

void TestToolRegistry::testCursorShape()
{
    QCOMPARE(ToolRegistry::cursorShape("crosshair"), Qt::CrossCursor);
    QCOMPARE(ToolRegistry::cursorShape("grab"), Qt::OpenHandCursor);
    QCOMPARE(ToolRegistry::cursorShape("text"), Qt::IBeamCursor);
    QCOMPARE(ToolRegistry::cursorShape("default"), Qt::ArrowCursor);
    QCOMPARE(ToolRegistry::cursorShape("bogus"), Qt::ArrowCursor);
}

QTEST_MAIN(TestToolRegistry)
#include "tst_ToolRegistry.moc"
