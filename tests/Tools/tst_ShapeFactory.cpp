#include <QtTest/QtTest>
#include <QSet>

#include "layers/LayerDefaults.h"
#include "style/StyleStore.h"
#include "tools/ShapeFactory.h"

/**
 * @brief Tests for ShapeFactory
 *
 * Covers:
 * - Creating each layer type with the current style
 * - Type names the factory cannot create
 * - Arrow head fill and size
 * - Drag updates for boxes, radii, lines and callouts
 * - Size validation
 * - Generated ids
 */
class TestShapeFactory : public QObject
{
    Q_OBJECT

private slots:
    // Creation
    void testCreate_UsesStyleStore();
    void testCreate_DefaultStyleWithoutStore();
    void testCreate_PenAliasMakesPath();
    void testCreate_UnknownType();
    void testCreate_PolygonAndStarOptions();
    void testCreate_TextBoxDefaults();
    void testCreate_CalloutTailAtPoint();
    void testCreateWithId_SetsId();

    // Arrows
    void testCreateArrow_FillFollowsStroke();
    void testCreateArrow_TransparentStrokeFallsBack();
    void testCreateArrow_SizeScalesWithStrokeWidth();

    // Drag updates
    void testUpdateRectangle_NormalizesNegativeDrag();
    void testUpdateCircle_RadiusIsDragLength();
    void testUpdateEllipse_CentresBetweenPoints();
    void testUpdateStar_InnerRatio();
    void testUpdateLine_MovesEndPoint();
    void testUpdateCallout_TailBelowBox();

    // Validation
    void testHasValidSize_data();
    void testHasValidSize();
    void testHasValidSize_PathAndText();

    void testGenerateId_Unique();
};

// ============================================================================
// Creation
// ============================================================================

void TestShapeFactory::testCreate_UsesStyleStore()
{
    StyleStore store;
    store.setColor("#ff0000");
    store.setFill("#00ff00");
    store.setStrokeWidth(4);
    store.setShadowEnabled(true);
    ShapeFactory factory(&store);

    const auto layer = factory.create("rectangle", QPointF(10, 20));
    QVERIFY(layer.has_value());
    QCOMPARE(layer->type, LayerType::Rectangle);
    QCOMPARE(layer->x, 10.0);
    QCOMPARE(layer->y, 20.0);
    QCOMPARE(layer->width.value_or(-1), 0.0);
    QCOMPARE(layer->height.value_or(-1), 0.0);
    QCOMPARE(layer->stroke.value_or(QString()), QString("#ff0000"));
    QCOMPARE(layer->fill.value_or(QString()), QString("#00ff00"));
    QCOMPARE(layer->strokeWidth.value_or(0), 4.0);
    QVERIFY(layer->shadow.toBool());
    QVERIFY(layer->id.isEmpty());
}

void TestShapeFactory::testCreate_DefaultStyleWithoutStore()
{
    ShapeFactory factory;
    const auto layer = factory.create("circle", QPointF(5, 5));
    QVERIFY(layer.has_value());
    QCOMPARE(layer->stroke.value_or(QString()), QString::fromLatin1(LayerDefaults::kStrokeColor));
    QCOMPARE(layer->strokeWidth.value_or(0), LayerDefaults::kStrokeWidth);
    QCOMPARE(layer->radius.value_or(-1), 0.0);
}

void TestShapeFactory::testCreate_PenAliasMakesPath()
{
    ShapeFactory factory;
    const auto layer = factory.create("pen", QPointF(3, 4));
    QVERIFY(layer.has_value());
    QCOMPARE(layer->type, LayerType::Path);
    QCOMPARE(layer->points, QVector<QPointF>{ QPointF(3, 4) });
    QCOMPARE(layer->fill.value_or(QString()), QString("none"));
    QVERIFY(!layer->closed);
}

void TestShapeFactory::testCreate_UnknownType()
{
    ShapeFactory factory;
    QVERIFY(!factory.create("image", QPointF()).has_value());
    QVERIFY(!factory.create("hexagon", QPointF()).has_value());
    QVERIFY(!factory.createWithId("group", QPointF()).has_value());
}

void TestShapeFactory::testCreate_PolygonAndStarOptions()
{
    ShapeFactory factory;
    QCOMPARE(factory.create("polygon", QPointF())->sides.value_or(0), LayerDefaults::kPolygonSides);
    QCOMPARE(factory.create("star", QPointF())->starPoints.value_or(0), LayerDefaults::kStarPoints);

    ShapeOptions options;
    options.sides = 8;
    options.points = 7;
    options.text = QStringLiteral("hello");
    QCOMPARE(factory.create("polygon", QPointF(), options)->sides.value_or(0), 8);
    QCOMPARE(factory.create("star", QPointF(), options)->starPoints.value_or(0), 7);
    QCOMPARE(factory.create("text", QPointF(), options)->text.value_or(QString()), QString("hello"));
}

void TestShapeFactory::testCreate_TextBoxDefaults()
{
    ShapeFactory factory;
    const auto layer = factory.create("textbox", QPointF(1, 2));
    QVERIFY(layer.has_value());
    QCOMPARE(layer->type, LayerType::TextBox);
    // Transparent style fill is replaced so the box stays readable
    QCOMPARE(layer->fill.value_or(QString()), QString("#ffffff"));
    QCOMPARE(layer->padding.value_or(0), LayerDefaults::kTextBoxPadding);
    QCOMPARE(layer->textAlign.value_or(QString()), QString("left"));
    QCOMPARE(layer->verticalAlign.value_or(QString()), QString("top"));
    QVERIFY(layer->text.has_value());
}

void TestShapeFactory::testCreate_CalloutTailAtPoint()
{
    ShapeFactory factory;
    const auto layer = factory.create("callout", QPointF(30, 40));
    QVERIFY(layer.has_value());
    QCOMPARE(layer->type, LayerType::Callout);
    QCOMPARE(layer->tailTipX.value_or(0), 30.0);
    QCOMPARE(layer->tailTipY.value_or(0), 40.0);
    QCOMPARE(layer->cornerRadius.value_or(0), 8.0);
}

void TestShapeFactory::testCreateWithId_SetsId()
{
    ShapeFactory factory;
    const auto layer = factory.createWithId("line", QPointF());
    QVERIFY(layer.has_value());
    QVERIFY(layer->id.startsWith("layer_"));
}

// ============================================================================
// Arrows
// ============================================================================

void TestShapeFactory::testCreateArrow_FillFollowsStroke()
{
    StyleStore store;
    store.setColor("#3366ff");
    ShapeFactory factory(&store);

    const Layer arrow = factory.createArrow(QPointF(10, 10));
    QCOMPARE(arrow.type, LayerType::Arrow);
    QCOMPARE(arrow.fill.value_or(QString()), QString("#3366ff"));
    QCOMPARE(arrow.arrowStyle.value_or(QString()), QString::fromLatin1(LayerDefaults::kArrowStyle));
    QCOMPARE(arrow.x1.value_or(0), 10.0);
    QCOMPARE(arrow.x2.value_or(0), 10.0);
}

void TestShapeFactory::testCreateArrow_TransparentStrokeFallsBack()
{
    StyleStore store;
    store.setColor("transparent");
    ShapeFactory factory(&store);

    const Layer arrow = factory.createArrow(QPointF());
    QCOMPARE(arrow.fill.value_or(QString()), QString::fromLatin1(LayerDefaults::kStrokeColor));
}

void TestShapeFactory::testCreateArrow_SizeScalesWithStrokeWidth()
{
    StyleStore store;
    ShapeFactory factory(&store);

    store.setStrokeWidth(2);
    QCOMPARE(factory.createArrow(QPointF()).arrowSize.value_or(0), 15.0);

    store.setStrokeWidth(6);
    QCOMPARE(factory.createArrow(QPointF()).arrowSize.value_or(0), 30.0);
}

// ============================================================================
// Drag Updates
// ============================================================================

void TestShapeFactory::testUpdateRectangle_NormalizesNegativeDrag()
{
    ShapeFactory factory;
    Layer layer = factory.createRectangle(QPointF(100, 100));
    ShapeFactory::updateRectangle(layer, QPointF(100, 100), QPointF(60, 130));

    QCOMPARE(layer.x, 60.0);
    QCOMPARE(layer.y, 100.0);
    QCOMPARE(layer.width.value_or(0), 40.0);
    QCOMPARE(layer.height.value_or(0), 30.0);
}

void TestShapeFactory::testUpdateCircle_RadiusIsDragLength()
{
    ShapeFactory factory;
    Layer layer = factory.createCircle(QPointF(0, 0));
    ShapeFactory::updateCircle(layer, QPointF(0, 0), QPointF(30, 40));
    QCOMPARE(layer.radius.value_or(0), 50.0);
    QCOMPARE(layer.x, 0.0);
}

void TestShapeFactory::testUpdateEllipse_CentresBetweenPoints()
{
    ShapeFactory factory;
    Layer layer = factory.createEllipse(QPointF(10, 10));
    ShapeFactory::updateEllipse(layer, QPointF(10, 10), QPointF(50, 30));

    QCOMPARE(layer.x, 30.0);
    QCOMPARE(layer.y, 20.0);
    QCOMPARE(layer.radiusX.value_or(0), 20.0);
    QCOMPARE(layer.radiusY.value_or(0), 10.0);
}

void TestShapeFactory::testUpdateStar_InnerRatio()
{
    ShapeFactory factory;
    Layer layer = factory.createStar(QPointF());
    ShapeFactory::updateStar(layer, QPointF(0, 0), QPointF(0, 50));
    QCOMPARE(layer.outerRadius.value_or(0), 50.0);
    QCOMPARE(layer.innerRadius.value_or(0), 50.0 * ShapeFactory::kStarInnerRatio);

    ShapeFactory::updateStar(layer, QPointF(0, 0), QPointF(0, 50), 0.5);
    QCOMPARE(layer.innerRadius.value_or(0), 25.0);

    // Non-positive ratio falls back to the default
    ShapeFactory::updateStar(layer, QPointF(0, 0), QPointF(0, 50), 0.0);
    QCOMPARE(layer.innerRadius.value_or(0), 50.0 * ShapeFactory::kStarInnerRatio);
}

void TestShapeFactory::testUpdateLine_MovesEndPoint()
{
    ShapeFactory factory;
    Layer layer = factory.createLine(QPointF(5, 5));
    ShapeFactory::updateLine(layer, QPointF(25, 45));

    QCOMPARE(layer.x1.value_or(0), 5.0);
    QCOMPARE(layer.y1.value_or(0), 5.0);
    QCOMPARE(layer.x2.value_or(0), 25.0);
    QCOMPARE(layer.y2.value_or(0), 45.0);
}

void TestShapeFactory::testUpdateCallout_TailBelowBox()
{
    ShapeFactory factory;
    Layer small = factory.createCallout(QPointF(0, 0));
    ShapeFactory::updateCallout(small, QPointF(0, 0), QPointF(100, 20));
    QCOMPARE(small.tailTipX.value_or(0), 25.0);
    QCOMPARE(small.tailTipY.value_or(0), 40.0);

    Layer tall = factory.createCallout(QPointF(0, 0));
    ShapeFactory::updateCallout(tall, QPointF(0, 0), QPointF(100, 100));
    QCOMPARE(tall.tailTipY.value_or(0), 150.0);
}

// ============================================================================
// Validation
// ============================================================================

void TestShapeFactory::testHasValidSize_data()
{
    QTest::addColumn<QString>("type");
    QTest::addColumn<QPointF>("dragTo");
    QTest::addColumn<bool>("valid");

    QTest::newRow("rectangle zero") << "rectangle" << QPointF(0, 0) << false;
    QTest::newRow("rectangle thin") << "rectangle" << QPointF(50, 1) << false;
    QTest::newRow("rectangle") << "rectangle" << QPointF(50, 30) << true;
    QTest::newRow("textbox zero") << "textbox" << QPointF(0, 0) << false;
    QTest::newRow("circle zero") << "circle" << QPointF(0, 0) << false;
    QTest::newRow("circle") << "circle" << QPointF(3, 4) << true;
    QTest::newRow("ellipse flat") << "ellipse" << QPointF(40, 0) << false;
    QTest::newRow("ellipse") << "ellipse" << QPointF(40, 10) << true;
    QTest::newRow("polygon") << "polygon" << QPointF(10, 0) << true;
    QTest::newRow("star zero") << "star" << QPointF(0, 0) << false;
    QTest::newRow("line zero") << "line" << QPointF(0, 0) << false;
    QTest::newRow("arrow") << "arrow" << QPointF(0, 8) << true;
}

void TestShapeFactory::testHasValidSize()
{
    QFETCH(QString, type);
    QFETCH(QPointF, dragTo);
    QFETCH(bool, valid);

    ShapeFactory factory;
    const QPointF start(0, 0);
    auto layer = factory.create(type, start);
    QVERIFY(layer.has_value());

    switch (layer->type) {
    case LayerType::Rectangle:
    case LayerType::TextBox:
        ShapeFactory::updateRectangle(*layer, start, dragTo);
        break;
    case LayerType::Circle:
        ShapeFactory::updateCircle(*layer, start, dragTo);
        break;
    case LayerType::Ellipse:
        ShapeFactory::updateEllipse(*layer, start, dragTo);
        break;
    case LayerType::Polygon:
        ShapeFactory::updatePolygon(*layer, start, dragTo);
        break;
    case LayerType::Star:
        ShapeFactory::updateStar(*layer, start, dragTo);
        break;
    case LayerType::Line:
    case LayerType::Arrow:
        ShapeFactory::updateLine(*layer, dragTo);
        break;
    default:
        break;
    }

    QCOMPARE(ShapeFactory::hasValidSize(*layer), valid);
}

void TestShapeFactory::testGenerateId_Unique()
{
    QSet<QString> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(ShapeFactory::generateId());
    }
    QCOMPARE(ids.size(), 100);
}

void TestShapeFactory::testHasValidSize_PathAndText()
{
    ShapeFactory factory;
    Layer path = factory.createPath(QPointF());
    QVERIFY(!ShapeFactory::hasValidSize(path));
    path.points.append(QPointF(1, 1));
    QVERIFY(ShapeFactory::hasValidSize(path));

    Layer text = factory.createText(QPointF());
    QVERIFY(!ShapeFactory::hasValidSize(text));
    text.text = QStringLiteral("x");
    QVERIFY(ShapeFactory::hasValidSize(text));
}

QTEST_MAIN(TestShapeFactory)
#include "tst_ShapeFactory.moc"
