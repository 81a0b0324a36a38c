#ifndef PATHTOOLHANDLER_H
#define PATHTOOLHANDLER_H

#include "../IToolHandler.h"
#include "layers/LayerDefaults.h"

#include <QPointF>
#include <QVector>

/**
 * @brief Tool handler for click-by-click closed path drawing.
 *
 * Each press adds a vertex. Once the path has at least three points, a
 * click within closeThreshold() of the first point closes it and emits a
 * closed "path" layer through the context. Escape cancels.
 */
class PathToolHandler : public IToolHandler
{
public:
    explicit PathToolHandler(ToolContext* ctx = nullptr);
    ~PathToolHandler() override = default;

    QString toolName() const override { return QStringLiteral("path"); }

    void onActivate(ToolContext* ctx) override;
    void onDeactivate(ToolContext* ctx) override;
    void onMousePress(ToolContext* ctx, const QPointF& pos) override;
    bool handleEscape(ToolContext* ctx) override;

    void drawPreview(QPainter& painter) const override;
    bool isDrawing() const override { return m_isDrawing; }
    void cancelDrawing() override { reset(); }

    /**
     * @brief Add a vertex.
     * @return true if the point closed the path and a layer was emitted
     */
    bool handlePoint(const QPointF& point);

    /**
     * @brief Emit the current points as a closed path layer.
     *
     * Does nothing with fewer than three points. Drawing state is reset
     * either way.
     */
    void complete();

    /**
     * @brief Draw the preview on the context's preview surface, if any,
     * and request a redraw.
     */
    void renderPreview();

    // Discards the points and requests a redraw
    void cancel();
    void reset();

    /**
     * @brief Detach from the context and drop the points. Safe to repeat.
     */
    void destroy();

    QVector<QPointF> getPoints() const { return m_points; }
    bool isActive() const { return m_isDrawing && !m_points.isEmpty(); }
    int getPointCount() const { return m_points.size(); }

    qreal closeThreshold() const { return m_closeThreshold; }
    void setCloseThreshold(qreal threshold);

    static constexpr int kMinClosedPoints = 3;
    static constexpr qreal kMarkerRadius = 3.0;

private:
    ToolContext* m_context = nullptr;
    QVector<QPointF> m_points;
    bool m_isDrawing = false;
    qreal m_closeThreshold = LayerDefaults::kCloseThreshold;
};

#endif // PATHTOOLHANDLER_H
