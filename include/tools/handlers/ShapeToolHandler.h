#ifndef SHAPETOOLHANDLER_H
#define SHAPETOOLHANDLER_H

#include "../IToolHandler.h"
#include "../ShapeFactory.h"

#include <QPointF>
#include <optional>

class LayerRenderer;

/**
 * @brief Tool handler for press-drag-release shapes.
 *
 * One instance serves one tool name (rectangle, circle, ellipse, polygon,
 * star, line, arrow, textbox or callout). Press creates the layer through
 * the ShapeFactory, move resizes it and release hands it to the host with
 * a generated id, unless ShapeFactory::hasValidSize() rejects it.
 */
class ShapeToolHandler : public IToolHandler {
public:
    explicit ShapeToolHandler(const QString& toolName, LayerRenderer* previewRenderer = nullptr);
    ~ShapeToolHandler() override = default;

    QString toolName() const override { return m_toolName; }

    void onDeactivate(ToolContext* ctx) override;
    void onMousePress(ToolContext* ctx, const QPointF& pos) override;
    void onMouseMove(ToolContext* ctx, const QPointF& pos) override;
    void onMouseRelease(ToolContext* ctx, const QPointF& pos) override;
    bool handleEscape(ToolContext* ctx) override;

    void drawPreview(QPainter& painter) const override;
    bool isDrawing() const override { return m_isDrawing; }
    void cancelDrawing() override;

    const std::optional<Layer>& currentLayer() const { return m_currentLayer; }

    /**
     * @brief Whether a handler exists for the named tool.
     */
    static bool isSupportedTool(const QString& toolName);

private:
    void updateCurrentLayer(const QPointF& pos);

    QString m_toolName;
    LayerRenderer* m_previewRenderer = nullptr;
    bool m_isDrawing = false;
    QPointF m_startPoint;
    std::optional<Layer> m_currentLayer;
};

#endif // SHAPETOOLHANDLER_H
