#ifndef EDITORSETTINGSMANAGER_H
#define EDITORSETTINGSMANAGER_H

#include "style/StyleStore.h"

/**
 * @brief Singleton class for managing editor settings.
 *
 * Persists the default tool style the Style Store is seeded with, the
 * render cache capacities and the path tool close threshold.
 */
class EditorSettingsManager
{
public:
    static EditorSettingsManager& instance();

    // Default tool style. Loaded values are clamped to the store minimums.
    ToolStyle loadStyle() const;
    void saveStyle(const ToolStyle& style);

    // Path2D cache capacity
    int loadPathCacheSize() const;
    void savePathCacheSize(int size);

    // Decoded image cache capacity
    int loadImageCacheSize() const;
    void saveImageCacheSize(int size);

    // Path tool auto-close distance
    qreal loadCloseThreshold() const;
    void saveCloseThreshold(qreal threshold);

    // Default values
    static constexpr int kDefaultPathCacheSize = 100;
    static constexpr int kDefaultImageCacheSize = 50;
    static constexpr qreal kDefaultCloseThreshold = 10.0;
    static constexpr int kMinCacheSize = 1;
    static constexpr int kMaxCacheSize = 10000;
    static constexpr qreal kMaxCloseThreshold = 200.0;

private:
    EditorSettingsManager() = default;
    EditorSettingsManager(const EditorSettingsManager&) = delete;
    EditorSettingsManager& operator=(const EditorSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyColor = "editor/style/color";
    static constexpr const char* kSettingsKeyFill = "editor/style/fill";
    static constexpr const char* kSettingsKeyFillOpacity = "editor/style/fillOpacity";
    static constexpr const char* kSettingsKeyStrokeWidth = "editor/style/strokeWidth";
    static constexpr const char* kSettingsKeyFontSize = "editor/style/fontSize";
    static constexpr const char* kSettingsKeyFontFamily = "editor/style/fontFamily";
    static constexpr const char* kSettingsKeyArrowStyle = "editor/style/arrowStyle";
    static constexpr const char* kSettingsKeyShadow = "editor/style/shadow";
    static constexpr const char* kSettingsKeyShadowColor = "editor/style/shadowColor";
    static constexpr const char* kSettingsKeyShadowBlur = "editor/style/shadowBlur";
    static constexpr const char* kSettingsKeyShadowOffsetX = "editor/style/shadowOffsetX";
    static constexpr const char* kSettingsKeyShadowOffsetY = "editor/style/shadowOffsetY";
    static constexpr const char* kSettingsKeyOpacity = "editor/style/opacity";
    static constexpr const char* kSettingsKeyPathCacheSize = "editor/render/pathCacheSize";
    static constexpr const char* kSettingsKeyImageCacheSize = "editor/render/imageCacheSize";
    static constexpr const char* kSettingsKeyCloseThreshold = "editor/tools/pathCloseThreshold";
};

#endif // EDITORSETTINGSMANAGER_H
