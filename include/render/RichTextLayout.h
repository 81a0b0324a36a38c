#ifndef RICHTEXTLAYOUT_H
#define RICHTEXTLAYOUT_H

#include <QFont>
#include <QString>
#include <QStringList>
#include <QVector>

#include "layers/Layer.h"
#include "render/RenderTypes.h"

/**
 * @brief Where one character of the concatenated plain text came from.
 */
struct CharRunPosition {
    int runIndex = 0;
    int localIndex = 0;
};

/**
 * @brief Metrics of one wrapped line.
 *
 * start/end are offsets into the concatenated plain text; end is
 * exclusive.
 */
struct LineMetrics {
    QString text;
    int start = 0;
    int end = 0;
    qreal maxFontSize = 0.0;
    qreal lineHeight = 0.0;
};

/**
 * @brief Text shadow and stroke settings in device units.
 */
struct TextStyle {
    bool hasTextShadow = false;
    QString textShadowColor;
    qreal textShadowBlur = 0.0;
    qreal textShadowOffsetX = 0.0;
    qreal textShadowOffsetY = 0.0;
    bool hasTextStroke = false;
    QString textStrokeColor;
    qreal textStrokeWidth = 0.0;
};

/**
 * @brief Layer-level font and colour that runs inherit from.
 */
struct BaseStyle {
    qreal fontSize = 0.0;
    QString fontFamily;
    QString fontWeight;
    QString fontStyle;
    QString color;
};

/**
 * @brief Layout arithmetic for multi-run ("rich") text.
 *
 * Line breaking itself is done by the caller (TextBoxRenderer); these
 * helpers map the broken lines back onto runs and place them in a box.
 * Runs whose text is unset are ignored everywhere but keep their index.
 */
class RichTextLayout
{
public:
    RichTextLayout() = delete;

    static bool hasRichText(const Layer& layer);

    static QString getRichTextPlainText(const QVector<RichTextRun>& richText);

    static QVector<CharRunPosition> buildCharToRunMap(const QVector<RichTextRun>& richText);

    /**
     * @brief Largest font size among the runs intersecting [lineStart, lineEnd).
     *
     * Explicit run sizes are multiplied by scale.avg; when no run is larger
     * the unmultiplied @p baseFontSize is returned (callers pass it already
     * scaled).
     */
    static qreal findMaxFontSizeForLine(const QVector<RichTextRun>& richText, int lineStart,
                                        int lineEnd, qreal baseFontSize, const RenderScale& scale);

    static QVector<LineMetrics> calculateLineMetrics(const QStringList& lines,
                                                     const QVector<RichTextRun>& richText,
                                                     const QString& plainText, qreal baseFontSize,
                                                     qreal lineHeightMultiplier,
                                                     const RenderScale& scale);

    static qreal calculateTotalTextHeight(const QVector<LineMetrics>& lineMetrics);

    static qreal calculateTextStartY(const QString& verticalAlign, qreal boxY, qreal padding,
                                     qreal availableHeight, qreal totalTextHeight);

    static qreal calculateLineX(const QString& align, qreal boxX, qreal boxWidth, qreal lineWidth,
                                qreal padding);

    static TextStyle buildTextStyle(const Layer& layer, const RenderScale& shadowScale,
                                    const RenderScale& scale);

    static BaseStyle buildBaseStyle(const Layer& layer);

    /**
     * @brief Font for a run, falling back to @p base for unset fields.
     * @param scale Multiplier applied to the resolved pixel size
     */
    static QFont fontForRun(const BaseStyle& base, const std::optional<RichTextStyle>& style,
                            qreal scale);

    /**
     * @brief Build a QFont from CSS-like values.
     *
     * @p family may be a comma separated CSS family list; "bold"/"bolder"
     * or a numeric weight >= 600 gives a bold font.
     */
    static QFont makeFont(qreal pixelSize, const QString& family, const QString& weight,
                          const QString& style);
};

#endif // RICHTEXTLAYOUT_H
