#ifndef TOOLREGISTRY_H
#define TOOLREGISTRY_H

#include <QHash>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>

#include "ToolDefinition.h"

/**
 * @brief Registry for tool definitions.
 *
 * Maps tool names to cursor, category and whether the tool creates
 * layers, with a category index kept in sync. A process-wide instance()
 * exists, but registries can also be constructed independently.
 * Tool and category order is registration order.
 */
class ToolRegistry {
public:
    /**
     * @brief Get the process-wide instance.
     */
    static ToolRegistry& instance();

    /**
     * @brief Create a registry pre-populated with the built-in tools.
     */
    ToolRegistry();
    ~ToolRegistry() = default;

    // Disable copy and move
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /**
     * @brief Register or replace a tool.
     *
     * An empty cursor becomes "default" and an empty category "other".
     */
    void registerTool(const QString& name, const ToolDefinition& definition);

    /**
     * @brief Remove a tool.
     * @return false if the tool was not registered
     */
    bool unregisterTool(const QString& name);

    /**
     * @brief Get the definition for a specific tool.
     */
    std::optional<ToolDefinition> get(const QString& name) const;

    bool has(const QString& name) const;

    /**
     * @brief Cursor name for a tool, "default" for unknown tools.
     */
    QString getCursor(const QString& name) const;

    /**
     * @brief Human readable tool name (the name, capitalised).
     */
    QString getDisplayName(const QString& name) const;

    QStringList getToolNames() const;
    QStringList getToolsByCategory(const QString& category) const;
    QStringList getCategories() const;

    /**
     * @brief Whether using the tool adds a layer. False for unknown tools.
     */
    bool createsLayer(const QString& name) const;

    /**
     * @brief Check if a tool is a drawing tool.
     *
     * Drawing tools are those in the drawing, shape, line and annotation
     * categories.
     */
    bool isDrawingTool(const QString& name) const;

    bool isSelectionTool(const QString& name) const;
    bool isShapeTool(const QString& name) const;

    QMap<QString, QString> getCursorMap() const;

    /**
     * @brief Remove every tool, built-in ones included.
     */
    void clear();

    /**
     * @brief Restore the built-in tool set.
     */
    void reset();

    /**
     * @brief Qt cursor shape for a cursor name ("crosshair", "grab", ...).
     */
    static Qt::CursorShape cursorShape(const QString& cursorName);

private:
    void registerTools();
    void registerTool(const char* name, const char* cursor, const char* category, bool createsLayer);
    bool hasCategory(const QString& name, const char* category) const;

    QHash<QString, ToolDefinition> m_definitions;
    QStringList m_toolOrder;
    QStringList m_categoryOrder;
    QHash<QString, QStringList> m_categories;
};

#endif // TOOLREGISTRY_H
