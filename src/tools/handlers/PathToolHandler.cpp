#include "tools/handlers/PathToolHandler.h"
#include "tools/ToolContext.h"
#include "style/StyleStore.h"
#include "utils/ColorUtils.h"

#include <QLineF>
#include <QPainter>
#include <QPainterPath>

PathToolHandler::PathToolHandler(ToolContext* ctx)
    : m_context(ctx)
{
}

void PathToolHandler::onActivate(ToolContext* ctx)
{
    m_context = ctx;
    reset();
}

void PathToolHandler::onDeactivate(ToolContext* ctx)
{
    Q_UNUSED(ctx);
    // Switching tools abandons an unfinished path
    if (m_isDrawing) {
        cancel();
    }
}

void PathToolHandler::onMousePress(ToolContext* ctx, const QPointF& pos)
{
    m_context = ctx;
    handlePoint(pos);
}

bool PathToolHandler::handleEscape(ToolContext* ctx)
{
    Q_UNUSED(ctx);
    if (m_isDrawing) {
        cancel();
        return true;
    }
    return false;
}

void PathToolHandler::setCloseThreshold(qreal threshold)
{
    m_closeThreshold = qMax<qreal>(0.0, threshold);
}

bool PathToolHandler::handlePoint(const QPointF& point)
{
    if (m_points.isEmpty()) {
        m_isDrawing = true;
    }
    m_points.append(point);

    if (m_points.size() >= kMinClosedPoints
        && QLineF(point, m_points.first()).length() <= m_closeThreshold) {
        complete();
        return true;
    }

    renderPreview();
    return false;
}

void PathToolHandler::complete()
{
    if (m_points.size() >= kMinClosedPoints && m_context) {
        const ToolStyle style = m_context->styleStore ? m_context->styleStore->get()
                                                      : StyleStore::defaultStyle();
        Layer layer;
        layer.type = LayerType::Path;
        layer.points = m_points;
        layer.stroke = style.color;
        layer.strokeWidth = style.strokeWidth;
        layer.fill = style.fill;
        layer.closed = true;
        m_context->addLayerToHost(layer);
    }

    reset();
    if (m_context) {
        m_context->repaint();
    }
}

void PathToolHandler::renderPreview()
{
    if (!m_context) {
        return;
    }
    if (m_context->previewPainter) {
        drawPreview(*m_context->previewPainter);
    }
    m_context->repaint();
}

void PathToolHandler::drawPreview(QPainter& painter) const
{
    if (m_points.isEmpty()) {
        return;
    }

    const ToolStyle style = (m_context && m_context->styleStore) ? m_context->styleStore->get()
                                                                 : StyleStore::defaultStyle();
    QColor color = ColorUtils::parseColor(style.color);
    if (!color.isValid()) {
        color = Qt::black;
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    // Dash pattern is in pen widths: 5px on, 5px off
    const qreal dash = 5.0 / qMax<qreal>(style.strokeWidth, 0.5);
    QPen pen(color, style.strokeWidth);
    pen.setDashPattern({dash, dash});
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);

    QPainterPath polyline;
    polyline.moveTo(m_points.first());
    for (int i = 1; i < m_points.size(); ++i) {
        polyline.lineTo(m_points.at(i));
    }
    painter.drawPath(polyline);

    // Vertex markers
    painter.setPen(Qt::NoPen);
    painter.setBrush(color);
    for (const QPointF& point : m_points) {
        painter.drawEllipse(point, kMarkerRadius, kMarkerRadius);
    }

    painter.restore();
}

void PathToolHandler::cancel()
{
    reset();
    if (m_context) {
        m_context->repaint();
    }
}

void PathToolHandler::reset()
{
    m_points.clear();
    m_isDrawing = false;
}

void PathToolHandler::destroy()
{
    reset();
    m_context = nullptr;
}
