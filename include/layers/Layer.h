#ifndef LAYER_H
#define LAYER_H

#include <QPointF>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>
#include <optional>

/**
 * @brief Layer kinds understood by the renderers and tools.
 *
 * Wire names are the lower-camel strings used in layer JSON
 * (see layerTypeName()).
 */
enum class LayerType {
    Rectangle = 0,
    Circle,
    Ellipse,
    Line,
    Arrow,
    Polygon,
    Star,
    Path,
    Text,
    TextBox,
    Callout,
    Image,
    Group,
    CustomShape
};

QString layerTypeName(LayerType type);
std::optional<LayerType> layerTypeFromString(const QString& name);

/**
 * @brief Per-run style override for rich text.
 *
 * Unset fields inherit from the owning layer's base style.
 */
struct RichTextStyle {
    std::optional<QString> fontWeight;
    std::optional<QString> fontStyle;
    std::optional<qreal> fontSize;
    std::optional<QString> fontFamily;
    std::optional<QString> color;
    std::optional<QString> textDecoration;

    bool isEmpty() const
    {
        return !fontWeight && !fontStyle && !fontSize && !fontFamily
            && !color && !textDecoration;
    }
};

/**
 * @brief A contiguous span of text sharing one style override.
 *
 * A run whose text is nullopt came from a non-string payload and is
 * skipped by every consumer. An empty string is a valid zero-length run.
 */
struct RichTextRun {
    std::optional<QString> text;
    std::optional<RichTextStyle> style;

    bool isValid() const { return text.has_value(); }
};

struct GradientStop {
    qreal offset = 0.0;
    QString color;
};

/**
 * @brief Declarative gradient description attached to a layer.
 *
 * type is kept as a string so that malformed specs can be represented
 * and rejected by GradientBuilder::validate().
 */
struct GradientSpec {
    QString type;
    std::optional<qreal> angle;     // linear, degrees
    std::optional<qreal> centerX;   // radial, fraction of bounds width
    std::optional<qreal> centerY;   // radial, fraction of bounds height
    std::optional<qreal> radius;    // radial, fraction of max(width, height)
    QVector<GradientStop> colors;
};

/**
 * @brief One drawable/editable annotation object.
 *
 * A single tagged record: the type tag selects which geometry fields are
 * meaningful. Style and geometry fields are optional so that "already set
 * on the layer" is explicit (StyleStore::applyToLayer never overwrites
 * them).
 */
struct Layer {
    LayerType type = LayerType::Rectangle;
    QString id;
    QString name;
    bool visible = true;

    qreal x = 0.0;
    qreal y = 0.0;

    // Common style
    std::optional<QString> stroke;
    std::optional<QString> color;
    std::optional<QString> fill;
    std::optional<qreal> strokeWidth;
    std::optional<qreal> opacity;
    std::optional<qreal> fillOpacity;
    std::optional<qreal> strokeOpacity;
    std::optional<qreal> rotation;
    std::optional<GradientSpec> gradient;

    // Shadow (flag accepts true/"true"/1/"1")
    QVariant shadow;
    std::optional<QString> shadowColor;
    std::optional<qreal> shadowBlur;
    std::optional<qreal> shadowOffsetX;
    std::optional<qreal> shadowOffsetY;
    std::optional<qreal> shadowSpread;

    // rectangle, textbox, callout, image, customShape
    std::optional<qreal> width;
    std::optional<qreal> height;
    std::optional<qreal> cornerRadius;
    std::optional<qreal> padding;

    // circle, polygon
    std::optional<qreal> radius;
    std::optional<int> sides;

    // ellipse
    std::optional<qreal> radiusX;
    std::optional<qreal> radiusY;

    // star
    std::optional<qreal> outerRadius;
    std::optional<qreal> innerRadius;
    std::optional<int> starPoints;

    // line, arrow
    std::optional<qreal> x1;
    std::optional<qreal> y1;
    std::optional<qreal> x2;
    std::optional<qreal> y2;
    std::optional<QString> arrowStyle;
    std::optional<qreal> arrowSize;

    // path
    QVector<QPointF> points;
    bool closed = false;

    // text, textbox, callout
    std::optional<QString> text;
    std::optional<qreal> fontSize;
    std::optional<QString> fontFamily;
    std::optional<QString> fontWeight;
    std::optional<QString> fontStyle;
    std::optional<QString> textAlign;
    std::optional<QString> verticalAlign;
    std::optional<qreal> lineHeight;
    std::optional<qreal> textStrokeWidth;
    std::optional<QString> textStrokeColor;
    QVariant textShadow;
    std::optional<QString> textShadowColor;
    std::optional<qreal> textShadowBlur;
    std::optional<qreal> textShadowOffsetX;
    std::optional<qreal> textShadowOffsetY;
    QVector<RichTextRun> richText;

    // callout tail tip, absolute canvas coordinates
    std::optional<qreal> tailTipX;
    std::optional<qreal> tailTipY;

    // image
    QString src;

    // customShape
    QString shapeId;

    // group
    QStringList children;
};

/**
 * @brief Permissive flag check used for shadow/textShadow.
 *
 * true, "true", 1 and "1" enable; everything else does not.
 */
bool isTruthyFlag(const QVariant& value);

/**
 * @brief Explicit disable check: false, "false", 0 and "0".
 */
bool isFalsyFlag(const QVariant& value);

#endif // LAYER_H
