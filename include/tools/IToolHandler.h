#ifndef ITOOLHANDLER_H
#define ITOOLHANDLER_H

#include <QCursor>
#include <QPointF>
#include <QString>

class QPainter;
class ToolContext;

/**
 * @brief Abstract interface for tool behavior handlers.
 *
 * Each tool implements this interface to define its specific
 * drawing behavior. The host dispatches pointer events to the
 * handler of the current tool.
 */
class IToolHandler {
public:
    virtual ~IToolHandler() = default;

    /**
     * @brief Get the registry name of the tool this handler implements.
     */
    virtual QString toolName() const = 0;

    /**
     * @brief Called when this tool becomes active.
     */
    virtual void onActivate(ToolContext* ctx) { Q_UNUSED(ctx); }

    /**
     * @brief Called when this tool is deactivated.
     */
    virtual void onDeactivate(ToolContext* ctx) { Q_UNUSED(ctx); }

    /**
     * @brief Called when mouse button is pressed.
     */
    virtual void onMousePress(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called when mouse is moved (while pressed or not).
     */
    virtual void onMouseMove(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called when mouse button is released.
     */
    virtual void onMouseRelease(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    virtual void onDoubleClick(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Handle the Escape key.
     * @return true if the key was consumed
     */
    virtual bool handleEscape(ToolContext* ctx) {
        Q_UNUSED(ctx);
        return false;
    }

    /**
     * @brief Draw the current in-progress layer preview.
     */
    virtual void drawPreview(QPainter& painter) const { Q_UNUSED(painter); }

    /**
     * @brief Check if currently drawing a layer.
     */
    virtual bool isDrawing() const { return false; }

    /**
     * @brief Cancel current drawing operation.
     */
    virtual void cancelDrawing() {}

    /**
     * @brief Get the cursor for this tool.
     */
    virtual QCursor cursor() const { return Qt::CrossCursor; }
};

#endif // ITOOLHANDLER_H
