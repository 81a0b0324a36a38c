#ifndef RENDERTYPES_H
#define RENDERTYPES_H

#include <QtGlobal>

/**
 * @brief Canvas-to-device scale factors.
 *
 * avg is the uniform factor used for lengths that have no axis (stroke
 * widths, blur radii, font sizes).
 */
struct RenderScale {
    qreal sx = 1.0;
    qreal sy = 1.0;
    qreal avg = 1.0;

    static RenderScale uniform(qreal s) { return RenderScale{ s, s, s }; }
    static RenderScale of(qreal sx, qreal sy) { return RenderScale{ sx, sy, (sx + sy) / 2.0 }; }
};

#endif // RENDERTYPES_H
