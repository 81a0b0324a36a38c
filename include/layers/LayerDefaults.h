#ifndef LAYERDEFAULTS_H
#define LAYERDEFAULTS_H

#include <QtGlobal>

/**
 * @brief Shared default values for layer rendering and creation.
 */
namespace LayerDefaults {

// Text
inline constexpr qreal kFontSize = 16.0;
inline constexpr const char* kFontFamily = "Arial, sans-serif";
inline constexpr const char* kFontWeight = "normal";
inline constexpr const char* kFontStyle = "normal";
inline constexpr const char* kTextColor = "#000000";
inline constexpr qreal kLineHeight = 1.2;
inline constexpr qreal kTextBoxPadding = 8.0;

// Text effects
inline constexpr const char* kTextShadowColor = "rgba(0,0,0,0.5)";
inline constexpr qreal kTextShadowBlur = 4.0;
inline constexpr qreal kTextShadowOffsetX = 2.0;
inline constexpr qreal kTextShadowOffsetY = 2.0;
inline constexpr const char* kTextStrokeColor = "#000000";
inline constexpr qreal kTextStrokeWidth = 0.0;

// Stroke
inline constexpr qreal kStrokeWidth = 2.0;
inline constexpr const char* kStrokeColor = "#000000";
inline constexpr qreal kMinStrokeWidth = 0.5;
inline constexpr qreal kMaxStrokeWidth = 50.0;

// Fill
inline constexpr const char* kFillColor = "transparent";

// Shadow
inline constexpr const char* kShadowColor = "#000000";
inline constexpr const char* kRenderShadowColor = "rgba(0,0,0,0.4)";
inline constexpr qreal kShadowBlur = 8.0;
inline constexpr qreal kShadowOffsetX = 2.0;
inline constexpr qreal kShadowOffsetY = 2.0;
inline constexpr qreal kMaxShadowBlur = 64.0;

// Font size floor enforced by the style store
inline constexpr qreal kMinFontSize = 8.0;

// Arrow
inline constexpr const char* kArrowStyle = "single";
inline constexpr qreal kArrowSize = 15.0;

// Polygon / star
inline constexpr int kPolygonSides = 6;
inline constexpr int kStarPoints = 5;
inline constexpr qreal kStarInnerRatio = 0.4;

// Custom shapes and images without explicit size
inline constexpr qreal kShapeSize = 100.0;

// Caches
inline constexpr int kPathCacheSize = 100;
inline constexpr int kMaxImageCacheSize = 50;

// Path tool
inline constexpr qreal kCloseThreshold = 10.0;

} // namespace LayerDefaults

#endif // LAYERDEFAULTS_H
