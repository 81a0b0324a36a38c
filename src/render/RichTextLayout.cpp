#include "render/RichTextLayout.h"
#include "layers/LayerDefaults.h"

#include <QtMath>

bool RichTextLayout::hasRichText(const Layer& layer)
{
    for (const RichTextRun& run : layer.richText) {
        if (run.isValid()) {
            return true;
        }
    }
    return false;
}

QString RichTextLayout::getRichTextPlainText(const QVector<RichTextRun>& richText)
{
    QString plain;
    for (const RichTextRun& run : richText) {
        if (run.isValid()) {
            plain += *run.text;
        }
    }
    return plain;
}

QVector<CharRunPosition> RichTextLayout::buildCharToRunMap(const QVector<RichTextRun>& richText)
{
    QVector<CharRunPosition> map;
    for (int runIndex = 0; runIndex < richText.size(); ++runIndex) {
        const RichTextRun& run = richText.at(runIndex);
        if (!run.isValid()) {
            continue;
        }
        for (int localIndex = 0; localIndex < run.text->size(); ++localIndex) {
            map.append(CharRunPosition{ runIndex, localIndex });
        }
    }
    return map;
}

qreal RichTextLayout::findMaxFontSizeForLine(const QVector<RichTextRun>& richText, int lineStart,
                                             int lineEnd, qreal baseFontSize,
                                             const RenderScale& scale)
{
    qreal maxFontSize = baseFontSize;
    int charPos = 0;

    for (const RichTextRun& run : richText) {
        if (!run.isValid()) {
            continue;
        }
        const int runStart = charPos;
        const int runEnd = charPos + run.text->size();
        charPos = runEnd;

        if (runEnd <= lineStart || runStart >= lineEnd) {
            continue;
        }

        if (run.style && run.style->fontSize && *run.style->fontSize > 0) {
            const qreal runFontSize = *run.style->fontSize * scale.avg;
            if (runFontSize > maxFontSize) {
                maxFontSize = runFontSize;
            }
        }
    }
    return maxFontSize;
}

QVector<LineMetrics> RichTextLayout::calculateLineMetrics(const QStringList& lines,
                                                          const QVector<RichTextRun>& richText,
                                                          const QString& plainText,
                                                          qreal baseFontSize,
                                                          qreal lineHeightMultiplier,
                                                          const RenderScale& scale)
{
    QVector<LineMetrics> metrics;
    metrics.reserve(lines.size());
    int charPos = 0;

    for (int i = 0; i < lines.size(); ++i) {
        LineMetrics line;
        line.text = lines.at(i);
        line.start = charPos;
        line.end = charPos + line.text.size();
        line.maxFontSize = findMaxFontSizeForLine(richText, line.start, line.end, baseFontSize, scale);
        line.lineHeight = line.maxFontSize * lineHeightMultiplier;
        metrics.append(line);

        charPos = line.end;

        // The break consumed one separator character
        if (i < lines.size() - 1 && charPos < plainText.size()) {
            const QChar next = plainText.at(charPos);
            if (next == QLatin1Char(' ') || next == QLatin1Char('\n')) {
                ++charPos;
            }
        }
    }
    return metrics;
}

qreal RichTextLayout::calculateTotalTextHeight(const QVector<LineMetrics>& lineMetrics)
{
    qreal total = 0.0;
    for (const LineMetrics& line : lineMetrics) {
        total += line.lineHeight;
    }
    return total;
}

qreal RichTextLayout::calculateTextStartY(const QString& verticalAlign, qreal boxY, qreal padding,
                                          qreal availableHeight, qreal totalTextHeight)
{
    if (verticalAlign == QLatin1String("middle")) {
        return boxY + padding + (availableHeight - totalTextHeight) / 2.0;
    }
    if (verticalAlign == QLatin1String("bottom")) {
        return boxY + padding + availableHeight - totalTextHeight;
    }
    return boxY + padding;
}

qreal RichTextLayout::calculateLineX(const QString& align, qreal boxX, qreal boxWidth,
                                     qreal lineWidth, qreal padding)
{
    if (align == QLatin1String("center")) {
        return boxX + (boxWidth - lineWidth) / 2.0;
    }
    if (align == QLatin1String("right")) {
        return boxX + boxWidth - padding - lineWidth;
    }
    return boxX + padding;
}

TextStyle RichTextLayout::buildTextStyle(const Layer& layer, const RenderScale& shadowScale,
                                         const RenderScale& scale)
{
    TextStyle style;
    style.hasTextShadow = isTruthyFlag(layer.textShadow);
    style.textShadowColor = layer.textShadowColor && !layer.textShadowColor->isEmpty()
        ? *layer.textShadowColor
        : QString::fromLatin1(LayerDefaults::kTextShadowColor);
    style.textShadowBlur = layer.textShadowBlur.value_or(LayerDefaults::kTextShadowBlur) * shadowScale.avg;
    style.textShadowOffsetX = layer.textShadowOffsetX.value_or(LayerDefaults::kTextShadowOffsetX) * shadowScale.avg;
    style.textShadowOffsetY = layer.textShadowOffsetY.value_or(LayerDefaults::kTextShadowOffsetY) * shadowScale.avg;

    const qreal strokeWidth = layer.textStrokeWidth.value_or(LayerDefaults::kTextStrokeWidth);
    style.hasTextStroke = strokeWidth > 0;
    style.textStrokeColor = layer.textStrokeColor && !layer.textStrokeColor->isEmpty()
        ? *layer.textStrokeColor
        : QString::fromLatin1(LayerDefaults::kTextStrokeColor);
    style.textStrokeWidth = strokeWidth * scale.avg;
    return style;
}

BaseStyle RichTextLayout::buildBaseStyle(const Layer& layer)
{
    auto stringOr = [](const std::optional<QString>& value, const char* fallback) {
        return value && !value->isEmpty() ? *value : QString::fromLatin1(fallback);
    };

    BaseStyle base;
    base.fontSize = layer.fontSize && *layer.fontSize > 0 ? *layer.fontSize : LayerDefaults::kFontSize;
    base.fontFamily = stringOr(layer.fontFamily, LayerDefaults::kFontFamily);
    base.fontWeight = stringOr(layer.fontWeight, LayerDefaults::kFontWeight);
    base.fontStyle = stringOr(layer.fontStyle, LayerDefaults::kFontStyle);
    base.color = stringOr(layer.color, LayerDefaults::kTextColor);
    return base;
}

QFont RichTextLayout::fontForRun(const BaseStyle& base, const std::optional<RichTextStyle>& style,
                                 qreal scale)
{
    qreal size = base.fontSize;
    QString family = base.fontFamily;
    QString weight = base.fontWeight;
    QString fontStyle = base.fontStyle;
    if (style) {
        if (style->fontSize && *style->fontSize > 0) {
            size = *style->fontSize;
        }
        if (style->fontFamily && !style->fontFamily->isEmpty()) {
            family = *style->fontFamily;
        }
        if (style->fontWeight && !style->fontWeight->isEmpty()) {
            weight = *style->fontWeight;
        }
        if (style->fontStyle && !style->fontStyle->isEmpty()) {
            fontStyle = *style->fontStyle;
        }
    }
    QFont font = makeFont(size * scale, family, weight, fontStyle);
    if (style && style->textDecoration) {
        const QString& decoration = *style->textDecoration;
        font.setUnderline(decoration == QLatin1String("underline"));
        font.setStrikeOut(decoration == QLatin1String("line-through"));
        font.setOverline(decoration == QLatin1String("overline"));
    }
    return font;
}

QFont RichTextLayout::makeFont(qreal pixelSize, const QString& family, const QString& weight,
                               const QString& style)
{
    QFont font;

    QStringList families;
    for (const QString& part : family.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        QString name = part.trimmed();
        if (name.size() >= 2 && (name.startsWith(QLatin1Char('"')) || name.startsWith(QLatin1Char('\'')))) {
            name = name.mid(1, name.size() - 2);
        }
        if (name == QLatin1String("sans-serif")) {
            font.setStyleHint(QFont::SansSerif);
        } else if (name == QLatin1String("serif")) {
            font.setStyleHint(QFont::Serif);
        } else if (name == QLatin1String("monospace")) {
            font.setStyleHint(QFont::Monospace);
        } else if (!name.isEmpty()) {
            families << name;
        }
    }
    if (!families.isEmpty()) {
        font.setFamilies(families);
    }

    font.setPixelSize(qMax(1, qRound(pixelSize)));

    bool numeric = false;
    const int numericWeight = weight.toInt(&numeric);
    if (weight == QLatin1String("bold") || weight == QLatin1String("bolder")
        || (numeric && numericWeight >= 600)) {
        font.setBold(true);
    } else if (weight == QLatin1String("lighter") || (numeric && numericWeight <= 300)) {
        font.setWeight(QFont::Light);
    }

    font.setItalic(style == QLatin1String("italic") || style == QLatin1String("oblique"));
    return font;
}
