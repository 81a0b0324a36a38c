#ifndef IMAGELAYERRENDERER_H
#define IMAGELAYERRENDERER_H

#include <QByteArray>
#include <QFutureWatcher>
#include <QHash>
#include <QImage>
#include <QObject>
#include <QString>
#include <functional>

#include "layers/Layer.h"
#include "layers/LayerDefaults.h"
#include "render/RenderTypes.h"
#include "utils/LruCache.h"

class QPainter;
class ShadowRenderer;

/**
 * @brief Draws image layers, decoding their sources off the GUI thread.
 *
 * The first draw of a source starts a decode on the global thread pool and
 * paints a dashed placeholder. When the decode finishes the entry is
 * marked ready (or failed), the redraw callback runs and imageLoaded is
 * emitted; later draws paint the bitmap. draw() never blocks.
 *
 * Decoded images live in an LRU cache keyed by layer id, or by a SHA-1 of
 * the source for layers without one. Changing a layer's src re-decodes.
 */
class ImageLayerRenderer : public QObject
{
    Q_OBJECT

public:
    using ImageDecoder = std::function<QImage(const QString& src)>;

    static constexpr int MAX_CACHE_SIZE = LayerDefaults::kMaxImageCacheSize;

    explicit ImageLayerRenderer(QObject* parent = nullptr);
    ~ImageLayerRenderer() override;

    void draw(QPainter& painter, const Layer& layer, const RenderScale& scale = RenderScale(),
              const RenderScale& shadowScale = RenderScale());

    bool isCached(const QString& key) const;
    int getCacheSize() const;
    int cacheCapacity() const;
    void setCacheCapacity(int capacity);
    void clearCache();

    /**
     * @brief Release the cache and collaborators.
     *
     * Decodes still running finish into nothing. Safe to call repeatedly.
     */
    void destroy();

    void setShadowRenderer(const ShadowRenderer* shadowRenderer);
    void setOnImageLoad(std::function<void()> callback);

    // Replaces the default decoder; runs on a worker thread
    void setDecoder(ImageDecoder decoder);

    /**
     * @brief Block until every started decode has been applied.
     *
     * For headless batch rendering only; interactive callers rely on the
     * redraw callback.
     */
    void waitForPendingDecodes();

    int pendingDecodeCount() const { return m_pending.size(); }

    static QString cacheKeyFor(const Layer& layer);

    /**
     * @brief Decode a data: URI, inline SVG markup or local file path.
     * @return A null image on failure
     */
    static QImage decodeSource(const QString& src);

signals:
    void imageLoaded(const QString& cacheKey, bool success);

private:
    enum class DecodeState {
        Pending,
        Ready,
        Failed
    };

    struct CacheEntry {
        QByteArray sourceHash;
        QString layerId;
        QImage image;
        DecodeState state = DecodeState::Pending;
        quint64 generation = 0;
    };

    struct PendingDecode {
        QString key;
        QFutureWatcher<QImage>* watcher = nullptr;
    };

    void startDecode(const QString& key, const Layer& layer, const QByteArray& sourceHash);
    void finishDecode(quint64 generation);
    void drawPlaceholder(QPainter& painter, const Layer& layer, const RenderScale& scale) const;
    void discardPending();

    LruCache<QString, CacheEntry> m_cache;
    QHash<quint64, PendingDecode> m_pending;
    quint64 m_nextGeneration = 1;

    const ShadowRenderer* m_shadowRenderer = nullptr;
    std::function<void()> m_onImageLoad;
    ImageDecoder m_decoder;
};

#endif // IMAGELAYERRENDERER_H
