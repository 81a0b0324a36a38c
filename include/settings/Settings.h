#pragma once

#include <QSettings>
#include "version.h"

namespace LayerCanvas {

inline constexpr const char* kOrganizationName = "LayerCanvas";
inline constexpr const char* kApplicationName = LAYERCANVAS_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace LayerCanvas
