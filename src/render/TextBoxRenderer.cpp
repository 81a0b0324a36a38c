#include "render/TextBoxRenderer.h"
#include "render/GradientBuilder.h"
#include "layers/LayerDefaults.h"
#include "utils/ColorUtils.h"

#include <QDebug>
#include <QFontMetricsF>
#include <QPainter>
#include <QtMath>
#include <limits>

namespace {

struct RunSlice {
    int runIndex;
    QString text;
};

// Pieces of each run that fall within [start, end) of the plain text
QVector<RunSlice> slicesInRange(const QVector<RichTextRun>& runs, int start, int end)
{
    QVector<RunSlice> slices;
    int charPos = 0;
    for (int i = 0; i < runs.size(); ++i) {
        const RichTextRun& run = runs.at(i);
        if (!run.isValid()) {
            continue;
        }
        const int runStart = charPos;
        const int runEnd = charPos + run.text->size();
        charPos = runEnd;
        if (runEnd <= start || runStart >= end) {
            continue;
        }
        const int sliceStart = qMax(0, start - runStart);
        const int sliceEnd = qMin(static_cast<int>(run.text->size()), end - runStart);
        if (sliceEnd > sliceStart) {
            slices.append(RunSlice{ i, run.text->mid(sliceStart, sliceEnd - sliceStart) });
        }
    }
    return slices;
}

} // namespace

TextBoxRenderer::TextBoxRenderer(const ShadowRenderer* shadowRenderer)
    : m_shadowRenderer(shadowRenderer)
{
}

void TextBoxRenderer::setShadowRenderer(const ShadowRenderer* shadowRenderer)
{
    m_shadowRenderer = shadowRenderer;
}

const ShadowRenderer& TextBoxRenderer::shadowRenderer() const
{
    return m_shadowRenderer ? *m_shadowRenderer : m_defaultShadowRenderer;
}

QPainterPath TextBoxRenderer::boxPath(const QRectF& rect, qreal cornerRadius,
                                      const std::optional<QPointF>& tailTip)
{
    QPainterPath path;
    const qreal radius = qMin(cornerRadius, qMin(rect.width(), rect.height()) / 2.0);
    if (radius > 0) {
        path.addRoundedRect(rect, radius, radius);
    } else {
        path.addRect(rect);
    }

    if (!tailTip || rect.contains(*tailTip)) {
        return path;
    }

    const QPointF tip = *tailTip;
    const QPointF center = rect.center();
    const qreal dx = tip.x() - center.x();
    const qreal dy = tip.y() - center.y();

    // Attach the tail to the edge facing the tip
    QPolygonF tail;
    if (qAbs(dy) * rect.width() >= qAbs(dx) * rect.height()) {
        const qreal half = qMin(kTailBaseWidth, rect.width() / 3.0) / 2.0;
        const qreal baseX = qBound(rect.left() + radius + half, tip.x(), rect.right() - radius - half);
        const qreal edgeY = dy > 0 ? rect.bottom() : rect.top();
        tail << QPointF(baseX - half, edgeY) << tip << QPointF(baseX + half, edgeY);
    } else {
        const qreal half = qMin(kTailBaseWidth, rect.height() / 3.0) / 2.0;
        const qreal baseY = qBound(rect.top() + radius + half, tip.y(), rect.bottom() - radius - half);
        const qreal edgeX = dx > 0 ? rect.right() : rect.left();
        tail << QPointF(edgeX, baseY - half) << tip << QPointF(edgeX, baseY + half);
    }
    tail << tail.first();

    QPainterPath tailPath;
    tailPath.addPolygon(tail);
    return path.united(tailPath);
}

void TextBoxRenderer::draw(QPainter& painter, const Layer& layer, const RenderScale& scale,
                           const RenderScale& shadowScale) const
{
    const bool isPlainText = layer.type == LayerType::Text;
    const qreal opacity = qBound(0.0, layer.opacity.value_or(1.0), 1.0);
    const qreal padding = (isPlainText ? 0.0 : layer.padding.value_or(LayerDefaults::kTextBoxPadding)) * scale.avg;

    QRectF box(layer.x * scale.sx, layer.y * scale.sy,
               layer.width.value_or(kDefaultBoxWidth) * scale.sx,
               layer.height.value_or(kDefaultBoxHeight) * scale.sy);

    if (isPlainText) {
        // Free text has no box: size it to the unwrapped content
        const BaseStyle base = RichTextLayout::buildBaseStyle(layer);
        QVector<RichTextRun> runs = layer.richText;
        if (!RichTextLayout::hasRichText(layer)) {
            runs = { RichTextRun{ layer.text.value_or(QString()), std::nullopt } };
        }
        const QString plain = RichTextLayout::getRichTextPlainText(runs);
        const QStringList lines = plain.split(QLatin1Char('\n'));
        const QVector<LineMetrics> metrics = RichTextLayout::calculateLineMetrics(
            lines, runs, plain, base.fontSize * scale.avg,
            layer.lineHeight.value_or(LayerDefaults::kLineHeight), scale);
        qreal widest = 0.0;
        for (const LineMetrics& line : metrics) {
            widest = qMax(widest, measureRichTextRange(runs, line.start, line.end, base, scale.avg));
        }
        box.setWidth(qMax(box.width(), widest));
        box.setHeight(qMax(RichTextLayout::calculateTotalTextHeight(metrics), 1.0));
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setOpacity(painter.opacity() * opacity);

    if (layer.rotation && *layer.rotation != 0.0) {
        const QPointF c = box.center();
        painter.translate(c);
        painter.rotate(*layer.rotation);
        painter.translate(-c);
    }

    if (!isPlainText) {
        std::optional<QPointF> tailTip;
        if (layer.type == LayerType::Callout && layer.tailTipX && layer.tailTipY) {
            tailTip = QPointF(*layer.tailTipX * scale.sx, *layer.tailTipY * scale.sy);
        }
        const QPainterPath outline = boxPath(box, layer.cornerRadius.value_or(0.0) * scale.avg, tailTip);

        const bool hasFill = GradientBuilder::hasGradient(layer)
            || (layer.fill && !ColorUtils::isNoneOrTransparent(*layer.fill));
        const QString strokeColor = layer.stroke.value_or(QString());
        const qreal strokeWidth = layer.strokeWidth.value_or(0.0) * scale.avg;
        const bool hasStroke = !ColorUtils::isNoneOrTransparent(strokeColor) && strokeWidth > 0;

        if ((hasFill || hasStroke) && ShadowRenderer::hasShadowEnabled(layer)) {
            const ShadowRenderer& shadows = shadowRenderer();
            shadows.drawPathShadow(painter, outline, shadows.resolve(layer, shadowScale));
            shadows.clearShadow(painter);
        }

        if (hasFill) {
            painter.save();
            painter.setOpacity(painter.opacity() * qBound(0.0, layer.fillOpacity.value_or(1.0), 1.0));
            painter.setPen(Qt::NoPen);
            painter.setBrush(Qt::NoBrush);
            const QRectF canvasBounds(layer.x, layer.y, box.width() / scale.sx, box.height() / scale.sy);
            if (GradientBuilder::applyFill(painter, layer, canvasBounds, scale.avg)
                || painter.brush().style() != Qt::NoBrush) {
                painter.drawPath(outline);
            }
            painter.restore();
        }

        if (hasStroke) {
            const QColor color = ColorUtils::parseColor(strokeColor);
            if (color.isValid()) {
                QPen pen(ColorUtils::withOpacity(color, layer.strokeOpacity.value_or(1.0)), strokeWidth);
                pen.setJoinStyle(Qt::RoundJoin);
                painter.setPen(pen);
                painter.setBrush(Qt::NoBrush);
                painter.drawPath(outline);
            } else {
                qWarning() << "TextBoxRenderer: Invalid stroke color" << strokeColor << "on layer" << layer.id;
            }
        }
    }

    drawTextContent(painter, layer, box, padding, scale, shadowScale);
    painter.restore();
}

void TextBoxRenderer::drawTextContent(QPainter& painter, const Layer& layer, const QRectF& box,
                                      qreal padding, const RenderScale& scale,
                                      const RenderScale& shadowScale) const
{
    QVector<RichTextRun> runs;
    if (RichTextLayout::hasRichText(layer)) {
        runs = layer.richText;
    } else if (layer.text && !layer.text->isEmpty()) {
        runs = { RichTextRun{ *layer.text, std::nullopt } };
    } else {
        return;
    }

    const BaseStyle base = RichTextLayout::buildBaseStyle(layer);
    const TextStyle textStyle = RichTextLayout::buildTextStyle(layer, shadowScale, scale);
    const QString plain = RichTextLayout::getRichTextPlainText(runs);
    const qreal baseFontSize = base.fontSize * scale.avg;

    const qreal maxWidth = layer.type == LayerType::Text
        ? std::numeric_limits<qreal>::max()
        : box.width() - padding * 2.0;
    const QStringList lines = wrapRichText(runs, base, maxWidth, scale.avg);
    const QVector<LineMetrics> metrics = RichTextLayout::calculateLineMetrics(
        lines, runs, plain, baseFontSize, layer.lineHeight.value_or(LayerDefaults::kLineHeight), scale);

    const qreal totalHeight = RichTextLayout::calculateTotalTextHeight(metrics);
    const qreal availableHeight = box.height() - padding * 2.0;
    const QString align = layer.textAlign.value_or(QStringLiteral("left"));
    const qreal startY = RichTextLayout::calculateTextStartY(
        layer.verticalAlign.value_or(QStringLiteral("top")), box.y(), padding, availableHeight, totalHeight);

    painter.save();
    painter.setClipRect(box, Qt::IntersectClip);

    qreal currentY = startY;
    for (const LineMetrics& line : metrics) {
        const qreal baselineY = currentY + line.maxFontSize;
        if (baselineY > box.bottom() + 0.5) {
            break;
        }
        const qreal lineWidth = measureRichTextRange(runs, line.start, line.end, base, scale.avg);
        const qreal lineX = RichTextLayout::calculateLineX(align, box.x(), box.width(), lineWidth, padding);
        drawLine(painter, runs, line, lineX, baselineY, base, textStyle, scale.avg);
        currentY += line.lineHeight;
    }

    painter.restore();
}

void TextBoxRenderer::drawLine(QPainter& painter, const QVector<RichTextRun>& runs,
                               const LineMetrics& line, qreal lineX, qreal baselineY,
                               const BaseStyle& base, const TextStyle& textStyle, qreal scale) const
{
    qreal x = lineX;
    for (const RunSlice& slice : slicesInRange(runs, line.start, line.end)) {
        const RichTextRun& run = runs.at(slice.runIndex);
        const QFont font = RichTextLayout::fontForRun(base, run.style, scale);

        QString colorName = base.color;
        if (run.style && run.style->color && !run.style->color->isEmpty()) {
            colorName = *run.style->color;
        }
        QColor color = ColorUtils::parseColor(colorName);
        if (!color.isValid()) {
            color = ColorUtils::parseColor(QString::fromLatin1(LayerDefaults::kTextColor));
        }

        QPainterPath glyphs;
        glyphs.addText(QPointF(x, baselineY), font, slice.text);

        if (textStyle.hasTextShadow) {
            ShadowParams params;
            params.color = ColorUtils::parseColor(textStyle.textShadowColor);
            params.blur = textStyle.textShadowBlur;
            params.offsetX = textStyle.textShadowOffsetX;
            params.offsetY = textStyle.textShadowOffsetY;
            shadowRenderer().drawPathShadow(painter, glyphs, params);
        }

        if (textStyle.hasTextStroke) {
            const QColor strokeColor = ColorUtils::parseColor(textStyle.textStrokeColor);
            if (strokeColor.isValid()) {
                QPen pen(strokeColor, textStyle.textStrokeWidth);
                pen.setJoinStyle(Qt::RoundJoin);
                pen.setMiterLimit(2.0);
                painter.strokePath(glyphs, pen);
            }
        }

        painter.fillPath(glyphs, color);
        x += QFontMetricsF(font).horizontalAdvance(slice.text);
    }
}

qreal TextBoxRenderer::measureRichTextRange(const QVector<RichTextRun>& richText, int start, int end,
                                            const BaseStyle& base, qreal scale) const
{
    qreal width = 0.0;
    for (const RunSlice& slice : slicesInRange(richText, start, end)) {
        const QFont font = RichTextLayout::fontForRun(base, richText.at(slice.runIndex).style, scale);
        width += QFontMetricsF(font).horizontalAdvance(slice.text);
    }
    return width;
}

QStringList TextBoxRenderer::wrapRichText(const QVector<RichTextRun>& richText, const BaseStyle& base,
                                          qreal maxWidth, qreal scale) const
{
    const QString plain = RichTextLayout::getRichTextPlainText(richText);
    QStringList lines;

    int paragraphStart = 0;
    for (const QString& paragraph : plain.split(QLatin1Char('\n'))) {
        if (paragraph.isEmpty()) {
            lines << QString();
            paragraphStart += 1;
            continue;
        }

        const QStringList words = paragraph.split(QLatin1Char(' '));
        int lineStart = paragraphStart;
        QString currentLine;
        bool lineHasWord = false;

        for (const QString& word : words) {
            const QString candidate = lineHasWord ? currentLine + QLatin1Char(' ') + word : word;
            const qreal width = measureRichTextRange(richText, lineStart, lineStart + candidate.size(), base, scale);
            if (width > maxWidth && lineHasWord && !currentLine.isEmpty()) {
                lines << currentLine;
                // Skip the space the break replaced
                lineStart += currentLine.size() + 1;
                currentLine = word;
            } else {
                currentLine = candidate;
            }
            lineHasWord = true;
        }
        if (!currentLine.isEmpty()) {
            lines << currentLine;
        }
        paragraphStart += paragraph.size() + 1;
    }

    if (lines.isEmpty()) {
        lines << QString();
    }
    return lines;
}
