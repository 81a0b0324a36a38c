#ifndef LAYERRENDERER_H
#define LAYERRENDERER_H

#include <QPainterPath>
#include <QPolygonF>
#include <QVector>
#include <memory>

#include "layers/Layer.h"
#include "layers/LayerDefaults.h"
#include "render/ImageLayerRenderer.h"
#include "render/RenderTypes.h"
#include "render/ShadowRenderer.h"
#include "render/ShapeRenderer.h"
#include "render/TextBoxRenderer.h"

class QPainter;
class IShapeDataProvider;

struct LayerRenderOptions {
    RenderScale scale;
    RenderScale shadowScale;
};

/**
 * @brief Draws a whole layer list onto a QPainter.
 *
 * Layers are painted in list order (bottom to top) and never reordered.
 * Each layer type is dispatched to its renderer; a layer that cannot be
 * drawn is logged and skipped without affecting the rest of the frame.
 */
class LayerRenderer
{
public:
    explicit LayerRenderer(int pathCacheSize = LayerDefaults::kPathCacheSize,
                           int imageCacheSize = LayerDefaults::kMaxImageCacheSize);
    ~LayerRenderer();

    LayerRenderer(const LayerRenderer&) = delete;
    LayerRenderer& operator=(const LayerRenderer&) = delete;

    void renderLayers(QPainter& painter, const QVector<Layer>& layers,
                      const LayerRenderOptions& options = LayerRenderOptions());

    /**
     * @brief Draw one layer.
     * @return false when the layer was skipped because it could not be drawn
     */
    bool renderLayer(QPainter& painter, const Layer& layer,
                     const LayerRenderOptions& options = LayerRenderOptions());

    void setShapeDataProvider(const IShapeDataProvider* provider);

    ShapeRenderer& shapeRenderer() { return m_shapeRenderer; }
    ImageLayerRenderer& imageRenderer() { return *m_imageRenderer; }
    TextBoxRenderer& textBoxRenderer() { return m_textBoxRenderer; }
    const ShadowRenderer& shadowRenderer() const { return m_shadowRenderer; }

    /**
     * @brief Outline of a vector layer in canvas coordinates.
     *
     * Empty for types that are not drawn as a single outline (text, image,
     * customShape, group, line, arrow).
     */
    static QPainterPath shapePath(const Layer& layer);

    /**
     * @brief Triangular arrow head with its tip at @p tip, pointing away
     * from @p from, with 30 degree flanks of length @p size.
     */
    static QPolygonF arrowHead(const QPointF& from, const QPointF& tip, qreal size);

private:
    void drawVectorShape(QPainter& painter, const Layer& layer, const QPainterPath& path,
                         const LayerRenderOptions& options);
    void drawLine(QPainter& painter, const Layer& layer, const LayerRenderOptions& options);
    bool drawCustomShape(QPainter& painter, const Layer& layer, const LayerRenderOptions& options);

    ShadowRenderer m_shadowRenderer;
    ShapeRenderer m_shapeRenderer;
    TextBoxRenderer m_textBoxRenderer;
    std::unique_ptr<ImageLayerRenderer> m_imageRenderer;
    const IShapeDataProvider* m_shapeProvider = nullptr;
};

#endif // LAYERRENDERER_H
