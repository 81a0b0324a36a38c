#include "utils/PolygonGeometry.h"

#include <QtMath>
#include <cmath>

namespace PolygonGeometry {

QPolygonF regularPolygon(const QPointF& center, qreal radius, int sides)
{
    const int n = qBound(kMinSides, sides, kMaxSides);
    QPolygonF vertices;
    vertices.reserve(n);

    const qreal step = 2.0 * M_PI / n;
    for (int i = 0; i < n; ++i) {
        const qreal angle = -M_PI / 2.0 + i * step;
        vertices.append(QPointF(center.x() + radius * std::cos(angle),
                                center.y() + radius * std::sin(angle)));
    }
    return vertices;
}

QPolygonF star(const QPointF& center, qreal outerRadius, qreal innerRadius, int points)
{
    const int n = qBound(kMinSides, points, kMaxSides);
    QPolygonF vertices;
    vertices.reserve(n * 2);

    const qreal step = M_PI / n;
    for (int i = 0; i < n * 2; ++i) {
        const qreal r = (i % 2 == 0) ? outerRadius : innerRadius;
        const qreal angle = -M_PI / 2.0 + i * step;
        vertices.append(QPointF(center.x() + r * std::cos(angle),
                                center.y() + r * std::sin(angle)));
    }
    return vertices;
}

QRectF bounds(const QPolygonF& vertices)
{
    if (vertices.isEmpty()) {
        return QRectF();
    }
    return vertices.boundingRect();
}

bool containsPoint(const QPolygonF& vertices, const QPointF& point)
{
    bool inside = false;
    const int n = vertices.size();
    for (int i = 0, j = n - 1; i < n; j = i++) {
        const QPointF& a = vertices.at(i);
        const QPointF& b = vertices.at(j);
        const bool crosses = (a.y() > point.y()) != (b.y() > point.y());
        if (crosses) {
            const qreal xAtY = (b.x() - a.x()) * (point.y() - a.y()) / (b.y() - a.y()) + a.x();
            if (point.x() < xAtY) {
                inside = !inside;
            }
        }
    }
    return inside;
}

} // namespace PolygonGeometry
