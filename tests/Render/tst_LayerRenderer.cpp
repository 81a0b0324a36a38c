#include <QtTest/QtTest>
#include <QImage>
#include <QPainter>
#include <QtMath>

#include "render/LayerRenderer.h"
#include "render/ShapeDataProvider.h"

namespace {

class FakeShapeProvider : public IShapeDataProvider
{
public:
    std::optional<ShapeData> getPathById(const QString& id) const override
    {
        if (id != QLatin1String("square")) {
            return std::nullopt;
        }
        ShapeData shape;
        shape.id = id;
        shape.path = QStringLiteral("M0 0 H10 V10 H0 Z");
        shape.viewBox = QRectF(0, 0, 10, 10);
        return shape;
    }

    QVector<ShapeData> getByCategory(const QString&) const override { return {}; }
    QVector<ShapeData> search(const QString&) const override { return {}; }
};

} // namespace

/**
 * @brief Tests for LayerRenderer
 *
 * Covers:
 * - Outline geometry for every vector layer type
 * - Arrow head geometry
 * - Paint order and visibility
 * - Lines, arrows and their head styles
 * - Custom shapes through the shape data provider
 * - Skipping layers that cannot be drawn
 */
class TestLayerRenderer : public QObject
{
    Q_OBJECT

private slots:
    // Geometry
    void testShapePath_Rectangle();
    void testShapePath_Circle();
    void testShapePath_Ellipse();
    void testShapePath_PolygonAndStar();
    void testShapePath_PathNeedsTwoPoints();
    void testShapePath_NonOutlineTypesEmpty();
    void testArrowHead_Geometry();

    // Frame
    void testRenderLayers_PaintsInListOrder();
    void testRenderLayers_SkipsInvisible();
    void testRenderLayers_SkipsUndrawableLayer();
    void testRenderLayer_Scale();
    void testRenderLayer_FillOpacity();
    void testRenderLayer_GradientFill();

    // Lines
    void testRenderLayer_ArrowHeadStyles();
    void testRenderLayer_LineMissingEndpoint();

    // Custom shapes and groups
    void testRenderLayer_CustomShape();
    void testRenderLayer_CustomShapeWithoutProvider();
    void testRenderLayer_UnknownShapeId();
    void testRenderLayer_GroupDrawsNothing();

private:
    static QImage canvas(int w = 100, int h = 100)
    {
        QImage image(w, h, QImage::Format_ARGB32_Premultiplied);
        image.fill(Qt::white);
        return image;
    }

    static Layer rect(const QString& id, qreal x, qreal y, qreal w, qreal h, const QString& fill)
    {
        Layer layer;
        layer.type = LayerType::Rectangle;
        layer.id = id;
        layer.x = x;
        layer.y = y;
        layer.width = w;
        layer.height = h;
        layer.fill = fill;
        layer.stroke = QStringLiteral("transparent");
        return layer;
    }

    static Layer arrow(const QString& style)
    {
        Layer layer;
        layer.type = LayerType::Arrow;
        layer.id = QStringLiteral("arrow");
        layer.x1 = 10;
        layer.y1 = 50;
        layer.x2 = 90;
        layer.y2 = 50;
        layer.stroke = QStringLiteral("#000000");
        layer.strokeWidth = 2;
        layer.arrowSize = 20;
        layer.arrowStyle = style;
        return layer;
    }
};

// ============================================================================
// Geometry
// ============================================================================

void TestLayerRenderer::testShapePath_Rectangle()
{
    Layer layer = rect("r", 10, 20, 30, 40, "#000000");
    QCOMPARE(LayerRenderer::shapePath(layer).boundingRect(), QRectF(10, 20, 30, 40));

    layer.cornerRadius = 50;
    const QPainterPath rounded = LayerRenderer::shapePath(layer);
    QCOMPARE(rounded.boundingRect(), QRectF(10, 20, 30, 40));
    QVERIFY(!rounded.contains(QPointF(10.5, 20.5)));
}

void TestLayerRenderer::testShapePath_Circle()
{
    Layer layer;
    layer.type = LayerType::Circle;
    layer.x = 50;
    layer.y = 50;
    layer.radius = 20;
    QCOMPARE(LayerRenderer::shapePath(layer).boundingRect(), QRectF(30, 30, 40, 40));
}

void TestLayerRenderer::testShapePath_Ellipse()
{
    Layer layer;
    layer.type = LayerType::Ellipse;
    layer.x = 50;
    layer.y = 50;
    layer.radiusX = 30;
    layer.radiusY = 10;
    QCOMPARE(LayerRenderer::shapePath(layer).boundingRect(), QRectF(20, 40, 60, 20));
}

void TestLayerRenderer::testShapePath_PolygonAndStar()
{
    Layer polygon;
    polygon.type = LayerType::Polygon;
    polygon.x = 0;
    polygon.y = 0;
    polygon.radius = 10;
    polygon.sides = 4;
    const QRectF polygonBounds = LayerRenderer::shapePath(polygon).boundingRect();
    QVERIFY(qAbs(polygonBounds.top() + 10.0) < 1e-9);
    QVERIFY(qAbs(polygonBounds.width() - 20.0) < 1e-9);

    Layer star;
    star.type = LayerType::Star;
    star.outerRadius = 30;
    star.starPoints = 5;
    const QPainterPath starPath = LayerRenderer::shapePath(star);
    QVERIFY(starPath.contains(QPointF(0, 0)));
    QVERIFY(qAbs(starPath.boundingRect().top() + 30.0) < 1e-9);
    // Default inner ratio keeps the notches well inside the outer radius
    const qreal notchAngle = -M_PI / 2.0 + M_PI / 5.0;
    QVERIFY(!starPath.contains(QPointF(25 * std::cos(notchAngle), 25 * std::sin(notchAngle))));
}

void TestLayerRenderer::testShapePath_PathNeedsTwoPoints()
{
    Layer layer;
    layer.type = LayerType::Path;
    layer.points = { QPointF(1, 1) };
    QVERIFY(LayerRenderer::shapePath(layer).isEmpty());

    layer.points << QPointF(20, 1) << QPointF(20, 20);
    const QPainterPath open = LayerRenderer::shapePath(layer);
    QCOMPARE(open.elementCount(), 3);

    layer.closed = true;
    const QPainterPath closed = LayerRenderer::shapePath(layer);
    QCOMPARE(closed.elementCount(), 4);
    QCOMPARE(closed.currentPosition(), QPointF(1, 1));
}

void TestLayerRenderer::testShapePath_NonOutlineTypesEmpty()
{
    Layer layer;
    layer.type = LayerType::Text;
    QVERIFY(LayerRenderer::shapePath(layer).isEmpty());
    layer.type = LayerType::Line;
    QVERIFY(LayerRenderer::shapePath(layer).isEmpty());
    layer.type = LayerType::Image;
    QVERIFY(LayerRenderer::shapePath(layer).isEmpty());
}

void TestLayerRenderer::testArrowHead_Geometry()
{
    const QPolygonF head = LayerRenderer::arrowHead(QPointF(0, 0), QPointF(100, 0), 20);
    QCOMPARE(head.size(), 3);
    QCOMPARE(head.at(0), QPointF(100, 0));

    const qreal back = 100 - 20 * std::cos(M_PI / 6.0);
    const qreal spread = 20 * std::sin(M_PI / 6.0);
    QVERIFY(qAbs(head.at(1).x() - back) < 1e-9);
    QVERIFY(qAbs(head.at(2).x() - back) < 1e-9);
    QVERIFY(qAbs(qAbs(head.at(1).y()) - spread) < 1e-9);
    QVERIFY(qAbs(head.at(1).y() + head.at(2).y()) < 1e-9);
}

// ============================================================================
// Frame
// ============================================================================

void TestLayerRenderer::testRenderLayers_PaintsInListOrder()
{
    LayerRenderer renderer;
    const QVector<Layer> layers = {
        rect("bottom", 10, 10, 60, 60, "#ff0000"),
        rect("top", 40, 40, 50, 50, "#0000ff"),
    };

    QImage image = canvas();
    {
        QPainter painter(&image);
        renderer.renderLayers(painter, layers);
    }
    QCOMPARE(image.pixelColor(20, 20), QColor(255, 0, 0));
    QCOMPARE(image.pixelColor(50, 50), QColor(0, 0, 255));
    QCOMPARE(image.pixelColor(80, 80), QColor(0, 0, 255));
}

void TestLayerRenderer::testRenderLayers_SkipsInvisible()
{
    LayerRenderer renderer;
    Layer hidden = rect("hidden", 0, 0, 100, 100, "#ff0000");
    hidden.visible = false;

    QImage image = canvas();
    {
        QPainter painter(&image);
        renderer.renderLayers(painter, { hidden });
    }
    QCOMPARE(image.pixelColor(50, 50), QColor(Qt::white));
}

void TestLayerRenderer::testRenderLayers_SkipsUndrawableLayer()
{
    LayerRenderer renderer;
    Layer empty;
    empty.type = LayerType::Path;
    empty.id = QStringLiteral("empty");

    const QVector<Layer> layers = { empty, rect("after", 0, 0, 100, 100, "#00ff00") };
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("LayerRenderer: Skipped layer.*empty.*path.*"));

    QImage image = canvas();
    {
        QPainter painter(&image);
        renderer.renderLayers(painter, layers);
    }
    // A bad layer does not stop the frame
    QCOMPARE(image.pixelColor(50, 50), QColor(0, 255, 0));
}

void TestLayerRenderer::testRenderLayer_Scale()
{
    LayerRenderer renderer;
    LayerRenderOptions options;
    options.scale = RenderScale::uniform(2.0);

    QImage image = canvas();
    {
        QPainter painter(&image);
        QVERIFY(renderer.renderLayer(painter, rect("r", 10, 10, 20, 20, "#ff0000"), options));
    }
    QCOMPARE(image.pixelColor(25, 25), QColor(255, 0, 0));
    QCOMPARE(image.pixelColor(55, 55), QColor(255, 0, 0));
    QCOMPARE(image.pixelColor(65, 65), QColor(Qt::white));
}

void TestLayerRenderer::testRenderLayer_FillOpacity()
{
    LayerRenderer renderer;
    Layer layer = rect("r", 0, 0, 100, 100, "#000000");
    layer.fillOpacity = 0.5;

    QImage image = canvas();
    {
        QPainter painter(&image);
        renderer.renderLayer(painter, layer);
    }
    const int gray = image.pixelColor(50, 50).red();
    QVERIFY(gray > 110);
    QVERIFY(gray < 145);
}

void TestLayerRenderer::testRenderLayer_GradientFill()
{
    LayerRenderer renderer;
    Layer layer = rect("r", 0, 0, 100, 100, "#ffffff");
    GradientSpec spec;
    spec.type = QStringLiteral("linear");
    spec.colors = { { 0.0, QStringLiteral("#ff0000") }, { 1.0, QStringLiteral("#0000ff") } };
    layer.gradient = spec;

    QImage image = canvas();
    {
        QPainter painter(&image);
        renderer.renderLayer(painter, layer);
    }
    const QColor left = image.pixelColor(2, 50);
    const QColor right = image.pixelColor(97, 50);
    QVERIFY(left.red() > left.blue());
    QVERIFY(right.blue() > right.red());
}

// ============================================================================
// Lines
// ============================================================================

void TestLayerRenderer::testRenderLayer_ArrowHeadStyles()
{
    LayerRenderer renderer;

    QImage single = canvas();
    {
        QPainter painter(&single);
        QVERIFY(renderer.renderLayer(painter, arrow("single")));
    }
    // Head flank near the tip, off the shaft
    QVERIFY(single.pixelColor(80, 53).lightness() < 128);
    QCOMPARE(single.pixelColor(19, 53), QColor(Qt::white));

    QImage both = canvas();
    {
        QPainter painter(&both);
        renderer.renderLayer(painter, arrow("double"));
    }
    QVERIFY(both.pixelColor(80, 53).lightness() < 128);
    QVERIFY(both.pixelColor(19, 53).lightness() < 128);

    QImage none = canvas();
    {
        QPainter painter(&none);
        renderer.renderLayer(painter, arrow("none"));
    }
    QCOMPARE(none.pixelColor(80, 53), QColor(Qt::white));
    QVERIFY(none.pixelColor(50, 50).lightness() < 128);
}

void TestLayerRenderer::testRenderLayer_LineMissingEndpoint()
{
    LayerRenderer renderer;
    Layer line;
    line.type = LayerType::Line;
    line.x1 = 0;
    line.y1 = 0;
    line.x2 = 10;

    QImage image = canvas();
    QPainter painter(&image);
    QVERIFY(!renderer.renderLayer(painter, line));
}

// ============================================================================
// Custom shapes and groups
// ============================================================================

void TestLayerRenderer::testRenderLayer_CustomShape()
{
    LayerRenderer renderer;
    FakeShapeProvider provider;
    renderer.setShapeDataProvider(&provider);

    Layer layer;
    layer.type = LayerType::CustomShape;
    layer.shapeId = QStringLiteral("square");
    layer.x = 20;
    layer.y = 20;
    layer.width = 50;
    layer.height = 50;
    layer.fill = QStringLiteral("#ff00ff");

    QImage image = canvas();
    {
        QPainter painter(&image);
        QVERIFY(renderer.renderLayer(painter, layer));
    }
    QCOMPARE(image.pixelColor(45, 45), QColor(255, 0, 255));
    QCOMPARE(renderer.shapeRenderer().getCacheSize(), 1);
}

void TestLayerRenderer::testRenderLayer_CustomShapeWithoutProvider()
{
    LayerRenderer renderer;
    Layer layer;
    layer.type = LayerType::CustomShape;
    layer.shapeId = QStringLiteral("square");

    QImage image = canvas();
    QPainter painter(&image);
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("LayerRenderer: No shape data provider.*"));
    QVERIFY(!renderer.renderLayer(painter, layer));
}

void TestLayerRenderer::testRenderLayer_UnknownShapeId()
{
    LayerRenderer renderer;
    FakeShapeProvider provider;
    renderer.setShapeDataProvider(&provider);
    Layer layer;
    layer.type = LayerType::CustomShape;
    layer.shapeId = QStringLiteral("hexagon");

    QImage image = canvas();
    QPainter painter(&image);
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("LayerRenderer: Unknown shape id.*hexagon.*"));
    QVERIFY(!renderer.renderLayer(painter, layer));
}

void TestLayerRenderer::testRenderLayer_GroupDrawsNothing()
{
    LayerRenderer renderer;
    Layer group;
    group.type = LayerType::Group;
    group.children = { "a", "b" };

    QImage image = canvas();
    {
        QPainter painter(&image);
        QVERIFY(renderer.renderLayer(painter, group));
    }
    QCOMPARE(image.pixelColor(50, 50), QColor(Qt::white));
}

QTEST_MAIN(TestLayerRenderer)
#include "tst_LayerRenderer.moc"
