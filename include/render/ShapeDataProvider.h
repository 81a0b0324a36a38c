#ifndef SHAPEDATAPROVIDER_H
#define SHAPEDATAPROVIDER_H

#include <QRectF>
#include <QString>
#include <QVector>
#include <optional>

/**
 * @brief One sub-path of a multi-path shape with its own paint.
 *
 * Unset paint falls back to the layer's fill/stroke; "currentColor" is
 * replaced by the layer colour.
 */
struct ShapeSubPath {
    QString path;
    std::optional<QString> fill;
    std::optional<QString> stroke;
    std::optional<qreal> strokeWidth;
    std::optional<QString> fillRule;
};

/**
 * @brief Geometry of a library shape in its own viewBox coordinates.
 *
 * Single-path shapes use path; multi-path shapes leave path empty and
 * list their parts in paths.
 */
struct ShapeData {
    QString id;
    QString path;
    QRectF viewBox;
    std::optional<QString> fillRule;    // "nonzero" (default) or "evenodd"
    bool strokeOnly = false;
    QVector<ShapeSubPath> paths;

    bool isMultiPath() const { return !paths.isEmpty(); }
};

/**
 * @brief Shape library lookup supplied by the host.
 */
class IShapeDataProvider
{
public:
    virtual ~IShapeDataProvider() = default;

    virtual std::optional<ShapeData> getPathById(const QString& id) const = 0;
    virtual QVector<ShapeData> getByCategory(const QString& category) const = 0;
    virtual QVector<ShapeData> search(const QString& query) const = 0;
};

#endif // SHAPEDATAPROVIDER_H
