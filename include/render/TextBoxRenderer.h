#ifndef TEXTBOXRENDERER_H
#define TEXTBOXRENDERER_H

#include <QFont>
#include <QPainterPath>
#include <QRectF>
#include <QStringList>

#include "layers/Layer.h"
#include "render/RenderTypes.h"
#include "render/RichTextLayout.h"
#include "render/ShadowRenderer.h"

class QPainter;

/**
 * @brief Draws text, textbox and callout layers.
 *
 * A textbox is a (rounded) rectangle with optional fill, stroke and drop
 * shadow, holding word-wrapped text clipped to the box. Callouts add a
 * tail pointing at tailTipX/tailTipY. Plain text is laid out as a single
 * unstyled run so both paths share RichTextLayout.
 */
class TextBoxRenderer
{
public:
    explicit TextBoxRenderer(const ShadowRenderer* shadowRenderer = nullptr);

    void setShadowRenderer(const ShadowRenderer* shadowRenderer);

    void draw(QPainter& painter, const Layer& layer, const RenderScale& scale = RenderScale(),
              const RenderScale& shadowScale = RenderScale()) const;

    /**
     * @brief Greedy word wrap of multi-run text.
     *
     * Paragraphs split on '\n', words on single spaces. Each candidate line
     * is measured with the fonts of the runs it spans. An empty paragraph
     * yields an empty line; the result is never empty.
     */
    QStringList wrapRichText(const QVector<RichTextRun>& richText, const BaseStyle& base,
                             qreal maxWidth, qreal scale) const;

    // Width of plain-text range [start, end) drawn with each run's font
    qreal measureRichTextRange(const QVector<RichTextRun>& richText, int start, int end,
                               const BaseStyle& base, qreal scale) const;

    /**
     * @brief Box outline, including the callout tail when the tip lies
     * outside the box.
     */
    static QPainterPath boxPath(const QRectF& rect, qreal cornerRadius,
                                const std::optional<QPointF>& tailTip = std::nullopt);

    static constexpr qreal kDefaultBoxWidth = 200.0;
    static constexpr qreal kDefaultBoxHeight = 100.0;
    static constexpr qreal kTailBaseWidth = 20.0;

private:
    void drawTextContent(QPainter& painter, const Layer& layer, const QRectF& box, qreal padding,
                         const RenderScale& scale, const RenderScale& shadowScale) const;
    void drawLine(QPainter& painter, const QVector<RichTextRun>& runs, const LineMetrics& line,
                  qreal lineX, qreal baselineY, const BaseStyle& base, const TextStyle& textStyle,
                  qreal scale) const;
    const ShadowRenderer& shadowRenderer() const;

    const ShadowRenderer* m_shadowRenderer = nullptr;
    ShadowRenderer m_defaultShadowRenderer;
};

#endif // TEXTBOXRENDERER_H
