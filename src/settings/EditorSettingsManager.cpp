#include "settings/EditorSettingsManager.h"
#include "settings/Settings.h"
#include <QSettings>

namespace {

qreal readReal(const QSettings& settings, const char* key, qreal defaultValue)
{
    bool ok = false;
    const qreal value = settings.value(key, defaultValue).toDouble(&ok);
    return ok ? value : defaultValue;
}

int readInt(const QSettings& settings, const char* key, int defaultValue)
{
    bool ok = false;
    const int value = settings.value(key, defaultValue).toInt(&ok);
    return ok ? value : defaultValue;
}

} // namespace

EditorSettingsManager& EditorSettingsManager::instance()
{
    static EditorSettingsManager instance;
    return instance;
}

ToolStyle EditorSettingsManager::loadStyle() const
{
    auto settings = LayerCanvas::getSettings();
    const ToolStyle defaults;

    ToolStyle style;
    style.color = settings.value(kSettingsKeyColor, defaults.color).toString();
    style.fill = settings.value(kSettingsKeyFill, defaults.fill).toString();
    style.fillOpacity = qBound<qreal>(0.0, readReal(settings, kSettingsKeyFillOpacity, defaults.fillOpacity), 1.0);
    style.strokeWidth = qMax(StyleStore::kMinStrokeWidth,
                             readReal(settings, kSettingsKeyStrokeWidth, defaults.strokeWidth));
    style.fontSize = qMax(StyleStore::kMinFontSize,
                          readReal(settings, kSettingsKeyFontSize, defaults.fontSize));
    style.fontFamily = settings.value(kSettingsKeyFontFamily, defaults.fontFamily).toString();
    style.arrowStyle = settings.value(kSettingsKeyArrowStyle, defaults.arrowStyle).toString();
    style.shadow = settings.value(kSettingsKeyShadow, defaults.shadow).toBool();
    style.shadowColor = settings.value(kSettingsKeyShadowColor, defaults.shadowColor).toString();
    style.shadowBlur = qMax<qreal>(0.0, readReal(settings, kSettingsKeyShadowBlur, defaults.shadowBlur));
    style.shadowOffsetX = readReal(settings, kSettingsKeyShadowOffsetX, defaults.shadowOffsetX);
    style.shadowOffsetY = readReal(settings, kSettingsKeyShadowOffsetY, defaults.shadowOffsetY);
    style.opacity = qBound<qreal>(0.0, readReal(settings, kSettingsKeyOpacity, defaults.opacity), 1.0);

    if (style.arrowStyle != QLatin1String("single") && style.arrowStyle != QLatin1String("double")
        && style.arrowStyle != QLatin1String("none")) {
        style.arrowStyle = defaults.arrowStyle;
    }
    return style;
}

void EditorSettingsManager::saveStyle(const ToolStyle& style)
{
    auto settings = LayerCanvas::getSettings();
    settings.setValue(kSettingsKeyColor, style.color);
    settings.setValue(kSettingsKeyFill, style.fill);
    settings.setValue(kSettingsKeyFillOpacity, style.fillOpacity);
    settings.setValue(kSettingsKeyStrokeWidth, style.strokeWidth);
    settings.setValue(kSettingsKeyFontSize, style.fontSize);
    settings.setValue(kSettingsKeyFontFamily, style.fontFamily);
    settings.setValue(kSettingsKeyArrowStyle, style.arrowStyle);
    settings.setValue(kSettingsKeyShadow, style.shadow);
    settings.setValue(kSettingsKeyShadowColor, style.shadowColor);
    settings.setValue(kSettingsKeyShadowBlur, style.shadowBlur);
    settings.setValue(kSettingsKeyShadowOffsetX, style.shadowOffsetX);
    settings.setValue(kSettingsKeyShadowOffsetY, style.shadowOffsetY);
    settings.setValue(kSettingsKeyOpacity, style.opacity);
}

int EditorSettingsManager::loadPathCacheSize() const
{
    auto settings = LayerCanvas::getSettings();
    return qBound(kMinCacheSize, readInt(settings, kSettingsKeyPathCacheSize, kDefaultPathCacheSize),
                  kMaxCacheSize);
}

void EditorSettingsManager::savePathCacheSize(int size)
{
    auto settings = LayerCanvas::getSettings();
    settings.setValue(kSettingsKeyPathCacheSize, qBound(kMinCacheSize, size, kMaxCacheSize));
}

int EditorSettingsManager::loadImageCacheSize() const
{
    auto settings = LayerCanvas::getSettings();
    return qBound(kMinCacheSize, readInt(settings, kSettingsKeyImageCacheSize, kDefaultImageCacheSize),
                  kMaxCacheSize);
}

void EditorSettingsManager::saveImageCacheSize(int size)
{
    auto settings = LayerCanvas::getSettings();
    settings.setValue(kSettingsKeyImageCacheSize, qBound(kMinCacheSize, size, kMaxCacheSize));
}

qreal EditorSettingsManager::loadCloseThreshold() const
{
    auto settings = LayerCanvas::getSettings();
    return qBound<qreal>(0.0, readReal(settings, kSettingsKeyCloseThreshold, kDefaultCloseThreshold),
                         kMaxCloseThreshold);
}

void EditorSettingsManager::saveCloseThreshold(qreal threshold)
{
    auto settings = LayerCanvas::getSettings();
    settings.setValue(kSettingsKeyCloseThreshold, qBound<qreal>(0.0, threshold, kMaxCloseThreshold));
}
