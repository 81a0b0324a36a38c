#include "tools/handlers/ShapeToolHandler.h"
#include "tools/ToolContext.h"
#include "render/LayerRenderer.h"

#include <QDebug>
#include <QPainter>
#include <QPainterPath>

ShapeToolHandler::ShapeToolHandler(const QString& toolName, LayerRenderer* previewRenderer)
    : m_toolName(toolName)
    , m_previewRenderer(previewRenderer)
{
}

bool ShapeToolHandler::isSupportedTool(const QString& toolName)
{
    static const QStringList kTools = {
        QStringLiteral("rectangle"), QStringLiteral("circle"), QStringLiteral("ellipse"),
        QStringLiteral("polygon"), QStringLiteral("star"), QStringLiteral("line"),
        QStringLiteral("arrow"), QStringLiteral("textbox"), QStringLiteral("callout")
    };
    return kTools.contains(toolName);
}

void ShapeToolHandler::onDeactivate(ToolContext* ctx) {
    if (m_isDrawing) {
        cancelDrawing();
        ctx->repaint();
    }
}

void ShapeToolHandler::onMousePress(ToolContext* ctx, const QPointF& pos) {
    const ShapeFactory factory(ctx->styleStore);
    m_currentLayer = factory.create(m_toolName, pos);
    if (!m_currentLayer) {
        qWarning() << "ShapeToolHandler: Cannot create layer for tool" << m_toolName;
        return;
    }

    m_isDrawing = true;
    m_startPoint = pos;
    ctx->repaint();
}

void ShapeToolHandler::onMouseMove(ToolContext* ctx, const QPointF& pos) {
    if (!m_isDrawing) {
        return;
    }

    updateCurrentLayer(pos);
    ctx->repaint();
}

void ShapeToolHandler::onMouseRelease(ToolContext* ctx, const QPointF& pos) {
    if (!m_isDrawing) {
        return;
    }

    updateCurrentLayer(pos);

    // Only add if the shape has some size
    if (m_currentLayer && ShapeFactory::hasValidSize(*m_currentLayer)) {
        m_currentLayer->id = ShapeFactory::generateId();
        ctx->addLayerToHost(*m_currentLayer);
    }

    // Reset state
    m_isDrawing = false;
    m_currentLayer.reset();

    ctx->repaint();
}

bool ShapeToolHandler::handleEscape(ToolContext* ctx) {
    if (!m_isDrawing) {
        return false;
    }
    cancelDrawing();
    ctx->repaint();
    return true;
}

void ShapeToolHandler::drawPreview(QPainter& painter) const {
    if (!m_isDrawing || !m_currentLayer) {
        return;
    }

    if (m_previewRenderer) {
        m_previewRenderer->renderLayer(painter, *m_currentLayer);
        return;
    }

    // Without a renderer, show a dashed outline of the geometry
    QPainterPath outline = LayerRenderer::shapePath(*m_currentLayer);
    const Layer& layer = *m_currentLayer;
    if (layer.type == LayerType::Line || layer.type == LayerType::Arrow) {
        outline.moveTo(layer.x1.value_or(0.0), layer.y1.value_or(0.0));
        outline.lineTo(layer.x2.value_or(0.0), layer.y2.value_or(0.0));
    } else if (layer.type == LayerType::TextBox || layer.type == LayerType::Callout) {
        outline.addRect(QRectF(layer.x, layer.y, layer.width.value_or(0.0), layer.height.value_or(0.0)));
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setPen(QPen(Qt::black, 1.0, Qt::DashLine));
    painter.setBrush(Qt::NoBrush);
    painter.drawPath(outline);
    painter.restore();
}

void ShapeToolHandler::cancelDrawing() {
    m_isDrawing = false;
    m_currentLayer.reset();
}

void ShapeToolHandler::updateCurrentLayer(const QPointF& pos) {
    if (!m_currentLayer) {
        return;
    }

    Layer& layer = *m_currentLayer;
    switch (layer.type) {
    case LayerType::Rectangle:
    case LayerType::TextBox:
        ShapeFactory::updateRectangle(layer, m_startPoint, pos);
        break;
    case LayerType::Callout:
        ShapeFactory::updateCallout(layer, m_startPoint, pos);
        break;
    case LayerType::Circle:
        ShapeFactory::updateCircle(layer, m_startPoint, pos);
        break;
    case LayerType::Ellipse:
        ShapeFactory::updateEllipse(layer, m_startPoint, pos);
        break;
    case LayerType::Polygon:
        ShapeFactory::updatePolygon(layer, m_startPoint, pos);
        break;
    case LayerType::Star:
        ShapeFactory::updateStar(layer, m_startPoint, pos);
        break;
    case LayerType::Line:
    case LayerType::Arrow:
        ShapeFactory::updateLine(layer, pos);
        break;
    default:
        break;
    }
}
