#include <QtTest/QtTest>
#include "utils/ColorUtils.h"

/**
 * @brief Tests for CSS colour parsing
 *
 * Covers:
 * - Hex forms (#rgb, #rgba, #rrggbb, #rrggbbaa)
 * - rgb()/rgba() and hsl()/hsla()
 * - Named colours and transparent/none
 * - Invalid input
 * - withOpacity()
 */
class TestColorUtils : public QObject
{
    Q_OBJECT

private slots:
    void testParseColor_Hex_data();
    void testParseColor_Hex();
    void testParseColor_HexAlphaIsLast();
    void testParseColor_Rgb();
    void testParseColor_Rgba();
    void testParseColor_RgbPercent();
    void testParseColor_Hsl();
    void testParseColor_Named();
    void testParseColor_Transparent();
    void testParseColor_Invalid_data();
    void testParseColor_Invalid();
    void testIsNoneOrTransparent();
    void testWithOpacity();
};

void TestColorUtils::testParseColor_Hex_data()
{
    QTest::addColumn<QString>("css");
    QTest::addColumn<QColor>("expected");

    QTest::newRow("short") << "#f00" << QColor(255, 0, 0);
    QTest::newRow("long") << "#00ff00" << QColor(0, 255, 0);
    QTest::newRow("uppercase") << "#0000FF" << QColor(0, 0, 255);
    QTest::newRow("whitespace") << "  #ffffff " << QColor(255, 255, 255);
}

void TestColorUtils::testParseColor_Hex()
{
    QFETCH(QString, css);
    QFETCH(QColor, expected);

    QCOMPARE(ColorUtils::parseColor(css), expected);
}

void TestColorUtils::testParseColor_HexAlphaIsLast()
{
    const QColor color = ColorUtils::parseColor("#ff000080");
    QCOMPARE(color.red(), 255);
    QCOMPARE(color.green(), 0);
    QCOMPARE(color.alpha(), 0x80);

    QCOMPARE(ColorUtils::parseColor("#f008").alpha(), 0x88);
}

void TestColorUtils::testParseColor_Rgb()
{
    QCOMPARE(ColorUtils::parseColor("rgb(10, 20, 30)"), QColor(10, 20, 30));
}

void TestColorUtils::testParseColor_Rgba()
{
    const QColor color = ColorUtils::parseColor("rgba(0,0,0,0.5)");
    QVERIFY(color.isValid());
    QCOMPARE(color.red(), 0);
    QVERIFY(qAbs(color.alphaF() - 0.5) < 0.01);
}

void TestColorUtils::testParseColor_RgbPercent()
{
    const QColor color = ColorUtils::parseColor("rgb(100%, 0%, 50%)");
    QCOMPARE(color.red(), 255);
    QCOMPARE(color.green(), 0);
    QVERIFY(qAbs(color.blue() - 128) <= 1);
}

void TestColorUtils::testParseColor_Hsl()
{
    const QColor red = ColorUtils::parseColor("hsl(0, 100%, 50%)");
    QVERIFY(red.red() >= 254);
    QVERIFY(red.green() <= 1);
    QVERIFY(red.blue() <= 1);

    const QColor translucent = ColorUtils::parseColor("hsla(120, 100%, 50%, 0.25)");
    QVERIFY(translucent.green() >= 254);
    QVERIFY(qAbs(translucent.alphaF() - 0.25) < 0.01);
}

void TestColorUtils::testParseColor_Named()
{
    QCOMPARE(ColorUtils::parseColor("red"), QColor(255, 0, 0));
    QCOMPARE(ColorUtils::parseColor("White"), QColor(255, 255, 255));
    QCOMPARE(ColorUtils::parseColor("steelblue"), QColor(70, 130, 180));
}

void TestColorUtils::testParseColor_Transparent()
{
    const QColor color = ColorUtils::parseColor("transparent");
    QVERIFY(color.isValid());
    QCOMPARE(color.alpha(), 0);
}

void TestColorUtils::testParseColor_Invalid_data()
{
    QTest::addColumn<QString>("css");

    QTest::newRow("empty") << "";
    QTest::newRow("none") << "none";
    QTest::newRow("bad hex") << "#ggg";
    QTest::newRow("wrong hex length") << "#12345";
    QTest::newRow("unknown name") << "notacolor";
    QTest::newRow("rgb missing channel") << "rgb(1, 2)";
    QTest::newRow("rgb garbage") << "rgb(a, b, c)";
}

void TestColorUtils::testParseColor_Invalid()
{
    QFETCH(QString, css);
    QVERIFY(!ColorUtils::parseColor(css).isValid());
}

void TestColorUtils::testIsNoneOrTransparent()
{
    QVERIFY(ColorUtils::isNoneOrTransparent("none"));
    QVERIFY(ColorUtils::isNoneOrTransparent("transparent"));
    QVERIFY(ColorUtils::isNoneOrTransparent(" Transparent "));
    QVERIFY(ColorUtils::isNoneOrTransparent(""));
    QVERIFY(!ColorUtils::isNoneOrTransparent("#000000"));
    QVERIFY(!ColorUtils::isNoneOrTransparent("rgba(0,0,0,0)"));
}

void TestColorUtils::testWithOpacity()
{
    const QColor half = ColorUtils::withOpacity(QColor(255, 0, 0, 200), 0.5);
    QCOMPARE(half.alpha(), 100);

    QCOMPARE(ColorUtils::withOpacity(QColor(255, 0, 0), 2.0).alpha(), 255);
    QCOMPARE(ColorUtils::withOpacity(QColor(255, 0, 0), -1.0).alpha(), 0);
}

QTEST_MAIN(TestColorUtils)
#include "tst_ColorUtils.moc"
