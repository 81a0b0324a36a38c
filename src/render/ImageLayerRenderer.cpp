#include "render/ImageLayerRenderer.h"
#include "render/ShadowRenderer.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QPainter>
#include <QSvgRenderer>
#include <QUrl>
#include <QtConcurrent>

namespace {

QByteArray hashSource(const QString& src)
{
    return QCryptographicHash::hash(src.toUtf8(), QCryptographicHash::Sha1);
}

QImage renderSvg(const QByteArray& data)
{
    QSvgRenderer renderer(data);
    if (!renderer.isValid()) {
        return QImage();
    }
    QSize size = renderer.defaultSize();
    if (size.isEmpty()) {
        size = QSize(static_cast<int>(LayerDefaults::kShapeSize), static_cast<int>(LayerDefaults::kShapeSize));
    }

    QImage image(size, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    renderer.render(&painter);
    painter.end();
    return image;
}

QImage decodeDataUri(const QString& src)
{
    const int comma = src.indexOf(QLatin1Char(','));
    if (comma < 0) {
        return QImage();
    }
    const QString header = src.mid(5, comma - 5);
    const QString payload = src.mid(comma + 1);
    const bool isBase64 = header.endsWith(QLatin1String(";base64"));

    const QByteArray bytes = isBase64
        ? QByteArray::fromBase64(payload.toLatin1())
        : QUrl::fromPercentEncoding(payload.toUtf8()).toUtf8();

    if (header.startsWith(QLatin1String("image/svg+xml"))) {
        return renderSvg(bytes);
    }
    return QImage::fromData(bytes);
}

} // namespace

ImageLayerRenderer::ImageLayerRenderer(QObject* parent)
    : QObject(parent)
    , m_cache(MAX_CACHE_SIZE)
    , m_decoder(&ImageLayerRenderer::decodeSource)
{
}

ImageLayerRenderer::~ImageLayerRenderer()
{
    discardPending();
}

QString ImageLayerRenderer::cacheKeyFor(const Layer& layer)
{
    if (!layer.id.isEmpty()) {
        return layer.id;
    }
    return QStringLiteral("img_") + QString::fromLatin1(hashSource(layer.src).toHex());
}

QImage ImageLayerRenderer::decodeSource(const QString& src)
{
    const QString trimmed = src.trimmed();
    if (trimmed.startsWith(QLatin1String("data:"))) {
        return decodeDataUri(trimmed);
    }
    if (trimmed.startsWith(QLatin1String("<svg")) || trimmed.startsWith(QLatin1String("<?xml"))) {
        return renderSvg(trimmed.toUtf8());
    }

    QString path = trimmed;
    if (trimmed.startsWith(QLatin1String("file:"))) {
        path = QUrl(trimmed).toLocalFile();
    }
    if (QFileInfo(path).suffix().compare(QLatin1String("svg"), Qt::CaseInsensitive) == 0) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            return QImage();
        }
        return renderSvg(file.readAll());
    }
    return QImage(path);
}

void ImageLayerRenderer::draw(QPainter& painter, const Layer& layer, const RenderScale& scale,
                              const RenderScale& shadowScale)
{
    if (layer.src.isEmpty()) {
        drawPlaceholder(painter, layer, scale);
        return;
    }

    const QString key = cacheKeyFor(layer);
    const QByteArray sourceHash = hashSource(layer.src);

    CacheEntry* entry = m_cache.get(key);
    if (!entry || entry->sourceHash != sourceHash) {
        startDecode(key, layer, sourceHash);
        drawPlaceholder(painter, layer, scale);
        return;
    }
    if (entry->state != DecodeState::Ready) {
        drawPlaceholder(painter, layer, scale);
        return;
    }

    const QImage& image = entry->image;
    const QRectF target(layer.x * scale.sx, layer.y * scale.sy,
                        layer.width.value_or(image.width()) * scale.sx,
                        layer.height.value_or(image.height()) * scale.sy);

    painter.save();
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    if (layer.opacity) {
        painter.setOpacity(painter.opacity() * qBound(0.0, *layer.opacity, 1.0));
    }
    if (layer.rotation && *layer.rotation != 0.0) {
        const QPointF c = target.center();
        painter.translate(c);
        painter.rotate(*layer.rotation);
        painter.translate(-c);
    }

    if (m_shadowRenderer && ShadowRenderer::hasShadowEnabled(layer)) {
        m_shadowRenderer->drawRectShadow(painter, target, 0.0, m_shadowRenderer->resolve(layer, shadowScale));
    }

    painter.drawImage(target, image);

    if (m_shadowRenderer) {
        m_shadowRenderer->clearShadow(painter);
    }
    painter.restore();
}

void ImageLayerRenderer::startDecode(const QString& key, const Layer& layer, const QByteArray& sourceHash)
{
    const quint64 generation = m_nextGeneration++;

    CacheEntry entry;
    entry.sourceHash = sourceHash;
    entry.layerId = layer.id;
    entry.generation = generation;
    m_cache.put(key, entry);

    auto* watcher = new QFutureWatcher<QImage>(this);
    connect(watcher, &QFutureWatcher<QImage>::finished, this, [this, generation]() {
        finishDecode(generation);
    });
    m_pending.insert(generation, PendingDecode{ key, watcher });

    const ImageDecoder decoder = m_decoder;
    const QString src = layer.src;
    watcher->setFuture(QtConcurrent::run([decoder, src]() {
        return decoder(src);
    }));
}

void ImageLayerRenderer::finishDecode(quint64 generation)
{
    auto it = m_pending.find(generation);
    if (it == m_pending.end()) {
        return;
    }
    const PendingDecode pending = it.value();
    m_pending.erase(it);

    const QImage image = pending.watcher->future().result();
    pending.watcher->disconnect(this);
    pending.watcher->deleteLater();

    // Evicted or superseded by a newer src: nobody draws from this result
    CacheEntry* entry = m_cache.peek(pending.key);
    if (!entry || entry->generation != generation) {
        return;
    }

    const bool success = !image.isNull();
    if (success) {
        entry->image = image;
        entry->state = DecodeState::Ready;
    } else {
        entry->state = DecodeState::Failed;
        qWarning() << "ImageLayerRenderer: Failed to load image layer"
                   << (entry->layerId.isEmpty() ? pending.key : entry->layerId);
    }

    if (m_onImageLoad) {
        m_onImageLoad();
    }
    emit imageLoaded(pending.key, success);
}

void ImageLayerRenderer::waitForPendingDecodes()
{
    while (!m_pending.isEmpty()) {
        const quint64 generation = m_pending.begin().key();
        m_pending.begin().value().watcher->waitForFinished();
        finishDecode(generation);
    }
}

void ImageLayerRenderer::drawPlaceholder(QPainter& painter, const Layer& layer, const RenderScale& scale) const
{
    const QRectF rect(layer.x * scale.sx, layer.y * scale.sy,
                      layer.width.value_or(LayerDefaults::kShapeSize) * scale.sx,
                      layer.height.value_or(LayerDefaults::kShapeSize) * scale.sy);

    painter.save();
    QPen pen(QColor(0x88, 0x88, 0x88), 1.0);
    pen.setDashPattern({ 5.0, 5.0 });
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(rect);
    painter.drawLine(rect.topLeft(), rect.bottomRight());
    painter.drawLine(rect.topRight(), rect.bottomLeft());
    painter.restore();
}

bool ImageLayerRenderer::isCached(const QString& key) const
{
    return m_cache.contains(key);
}

int ImageLayerRenderer::getCacheSize() const
{
    return m_cache.size();
}

int ImageLayerRenderer::cacheCapacity() const
{
    return m_cache.capacity();
}

void ImageLayerRenderer::setCacheCapacity(int capacity)
{
    m_cache.setCapacity(capacity);
}

void ImageLayerRenderer::clearCache()
{
    m_cache.clear();
}

void ImageLayerRenderer::discardPending()
{
    for (const PendingDecode& pending : std::as_const(m_pending)) {
        pending.watcher->disconnect(this);
        pending.watcher->deleteLater();
    }
    m_pending.clear();
}

void ImageLayerRenderer::destroy()
{
    discardPending();
    m_cache.clear();
    m_shadowRenderer = nullptr;
    m_onImageLoad = nullptr;
}

void ImageLayerRenderer::setShadowRenderer(const ShadowRenderer* shadowRenderer)
{
    m_shadowRenderer = shadowRenderer;
}

void ImageLayerRenderer::setOnImageLoad(std::function<void()> callback)
{
    m_onImageLoad = std::move(callback);
}

void ImageLayerRenderer::setDecoder(ImageDecoder decoder)
{
    m_decoder = decoder ? std::move(decoder) : ImageDecoder(&ImageLayerRenderer::decodeSource);
}
