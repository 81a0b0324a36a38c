#ifndef POLYGONGEOMETRY_H
#define POLYGONGEOMETRY_H

#include <QPointF>
#include <QPolygonF>
#include <QRectF>

/**
 * @brief Vertex generation for regular polygons and stars.
 *
 * The first vertex always points straight up (-90 degrees) so shapes look
 * upright regardless of their vertex count.
 */
namespace PolygonGeometry {

inline constexpr int kMinSides = 3;
inline constexpr int kMaxSides = 20;

/**
 * @brief Vertices of a regular polygon centred on @p center.
 * @param sides Clamped to [kMinSides, kMaxSides]
 */
QPolygonF regularPolygon(const QPointF& center, qreal radius, int sides);

/**
 * @brief Vertices of a star alternating outer and inner radius.
 * @param points Number of tips, clamped to [kMinSides, kMaxSides]
 */
QPolygonF star(const QPointF& center, qreal outerRadius, qreal innerRadius, int points);

QRectF bounds(const QPolygonF& vertices);

// Even-odd (crossing number) containment test
bool containsPoint(const QPolygonF& vertices, const QPointF& point);

} // namespace PolygonGeometry

#endif // POLYGONGEOMETRY_H
