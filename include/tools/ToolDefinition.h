#ifndef TOOLDEFINITION_H
#define TOOLDEFINITION_H

#include <QString>

/**
 * @brief Tool category names.
 *
 * Categories are open-ended strings so hosts can register their own;
 * these are the ones the built-in tools use.
 */
namespace ToolCategory {
inline constexpr const char* kSelection = "selection";
inline constexpr const char* kNavigation = "navigation";
inline constexpr const char* kDrawing = "drawing";
inline constexpr const char* kShape = "shape";
inline constexpr const char* kLine = "line";
inline constexpr const char* kAnnotation = "annotation";
inline constexpr const char* kUtility = "utility";
inline constexpr const char* kOther = "other";
}

/**
 * @brief Metadata structure for tool definitions.
 */
struct ToolDefinition {
    QString name;
    QString cursor = QStringLiteral("default");
    QString category = QString::fromLatin1(ToolCategory::kOther);
    bool createsLayer = true;

    bool isValid() const { return !name.isEmpty(); }
};

#endif // TOOLDEFINITION_H
