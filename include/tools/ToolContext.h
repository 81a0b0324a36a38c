#ifndef TOOLCONTEXT_H
#define TOOLCONTEXT_H

#include <functional>

#include "layers/Layer.h"

class QPainter;
class StyleStore;

/**
 * @brief Shared context passed to tool handlers.
 *
 * Carries the style new layers are created with, the callbacks through
 * which handlers hand finished layers to the host and ask for a redraw,
 * and an optional surface for drawing in-progress previews.
 */
class ToolContext {
public:
    // Ambient drawing style (not owned)
    StyleStore* styleStore = nullptr;

    // Surface previews are drawn on outside the host's paint cycle (not owned)
    QPainter* previewPainter = nullptr;

    // Drawing state
    bool isDrawing = false;

    // Callbacks
    std::function<void()> requestRepaint;
    std::function<void(const Layer&)> addLayer;

    /**
     * @brief Hand a finished layer to the host.
     */
    void addLayerToHost(const Layer& layer) {
        if (addLayer) {
            addLayer(layer);
        }
    }

    /**
     * @brief Request a repaint of the canvas.
     */
    void repaint() {
        if (requestRepaint) {
            requestRepaint();
        }
    }
};

#endif // TOOLCONTEXT_H
