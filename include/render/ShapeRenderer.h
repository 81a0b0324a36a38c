#ifndef SHAPERENDERER_H
#define SHAPERENDERER_H

#include <QPainterPath>
#include <QString>
#include <QTransform>
#include <memory>
#include <optional>

#include "layers/Layer.h"
#include "layers/LayerDefaults.h"
#include "render/RenderTypes.h"
#include "render/ShadowRenderer.h"
#include "render/ShapeDataProvider.h"
#include "utils/LruCache.h"

class QPainter;

/**
 * @brief Draws library shapes (customShape layers) from SVG path data.
 *
 * Parsed paths are kept in an LRU cache keyed by the path data string, so
 * repeated frames reuse the same QPainterPath instance. The shape's viewBox
 * is stretched onto the layer's width x height box.
 */
class ShapeRenderer
{
public:
    using PathPtr = std::shared_ptr<const QPainterPath>;

    explicit ShapeRenderer(int cacheSize = LayerDefaults::kPathCacheSize,
                           const ShadowRenderer* shadowRenderer = nullptr);

    /**
     * @brief Parsed path for @p pathData.
     *
     * A hit returns the cached instance and marks it most recently used; a
     * miss parses, caches, and evicts the least recently used entry when
     * the cache is full.
     */
    PathPtr getPath2D(const QString& pathData);

    /**
     * @brief Draw @p shapeData into the layer's box.
     *
     * Logs a warning and draws nothing when @p shapeData is null or has no
     * usable geometry.
     */
    void render(QPainter& painter, const ShapeData* shapeData, const Layer& layer,
                const RenderScale& scale = RenderScale());

    // render() preceded by the layer's drop shadow when it has one
    void renderWithEffects(QPainter& painter, const ShapeData* shapeData, const Layer& layer,
                           const RenderScale& scale = RenderScale(),
                           const RenderScale& shadowScale = RenderScale());

    /**
     * @brief Compose a specific opacity with the layer opacity.
     * @return 1 when neither is set, the set one when only one is, their
     * product otherwise
     */
    static qreal getOpacity(std::optional<qreal> specificOpacity, std::optional<qreal> layerOpacity);

    /**
     * @brief Whether canvas point (px, py) lies on the shape.
     *
     * Rejects points outside the layer's unrotated bounding box before
     * testing against the transformed path.
     */
    bool hitTest(const Layer& layer, const ShapeData* shapeData, qreal px, qreal py);

    void clearCache();
    int getCacheSize() const;
    int cacheCapacity() const;
    void setCacheCapacity(int capacity);

    void setShadowRenderer(const ShadowRenderer* shadowRenderer);

    /**
     * @brief Map from shape viewBox coordinates to device coordinates.
     */
    static QTransform shapeTransform(const Layer& layer, const QRectF& viewBox,
                                     const RenderScale& scale = RenderScale());

private:
    QPainterPath outlineFor(const ShapeData& shapeData);
    void drawSubPath(QPainter& painter, const QPainterPath& path, const std::optional<QString>& fill,
                     const std::optional<QString>& stroke, qreal strokeWidth, const Layer& layer,
                     bool strokeOnly);

    LruCache<QString, PathPtr> m_pathCache;
    const ShadowRenderer* m_shadowRenderer = nullptr;
    ShadowRenderer m_defaultShadowRenderer;
};

#endif // SHAPERENDERER_H
