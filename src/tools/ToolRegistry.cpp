#include "tools/ToolRegistry.h"

ToolRegistry& ToolRegistry::instance() {
    static ToolRegistry registry;
    return registry;
}

ToolRegistry::ToolRegistry() {
    registerTools();
}

void ToolRegistry::registerTools() {
    // Selection tools
    registerTool("pointer", "default", ToolCategory::kSelection, false);
    registerTool("pan", "grab", ToolCategory::kNavigation, false);

    // Drawing tools
    registerTool("pen", "crosshair", ToolCategory::kDrawing, true);
    registerTool("path", "crosshair", ToolCategory::kDrawing, true);

    // Shape tools
    registerTool("rectangle", "crosshair", ToolCategory::kShape, true);
    registerTool("circle", "crosshair", ToolCategory::kShape, true);
    registerTool("ellipse", "crosshair", ToolCategory::kShape, true);
    registerTool("polygon", "crosshair", ToolCategory::kShape, true);
    registerTool("star", "crosshair", ToolCategory::kShape, true);

    // Line tools
    registerTool("line", "crosshair", ToolCategory::kLine, true);
    registerTool("arrow", "crosshair", ToolCategory::kLine, true);

    // Annotation tools
    registerTool("text", "text", ToolCategory::kAnnotation, true);
    registerTool("textbox", "crosshair", ToolCategory::kAnnotation, true);
    registerTool("callout", "crosshair", ToolCategory::kAnnotation, true);

    // Utility tools
    registerTool("eyedropper", "crosshair", ToolCategory::kUtility, false);
}

void ToolRegistry::registerTool(const char* name, const char* cursor, const char* category,
                                bool createsLayer) {
    ToolDefinition def;
    def.cursor = QString::fromLatin1(cursor);
    def.category = QString::fromLatin1(category);
    def.createsLayer = createsLayer;
    registerTool(QString::fromLatin1(name), def);
}

void ToolRegistry::registerTool(const QString& name, const ToolDefinition& definition) {
    if (name.isEmpty()) {
        return;
    }

    ToolDefinition def = definition;
    def.name = name;
    if (def.cursor.isEmpty()) {
        def.cursor = QStringLiteral("default");
    }
    if (def.category.isEmpty()) {
        def.category = QString::fromLatin1(ToolCategory::kOther);
    }

    // Re-registering under another category moves the tool
    auto existing = m_definitions.constFind(name);
    if (existing != m_definitions.constEnd() && existing->category != def.category) {
        unregisterTool(name);
    }

    if (!m_definitions.contains(name)) {
        m_toolOrder.append(name);
    }
    m_definitions.insert(name, def);

    if (!m_categories.contains(def.category)) {
        m_categoryOrder.append(def.category);
    }
    QStringList& categoryTools = m_categories[def.category];
    if (!categoryTools.contains(name)) {
        categoryTools.append(name);
    }
}

bool ToolRegistry::unregisterTool(const QString& name) {
    auto it = m_definitions.find(name);
    if (it == m_definitions.end()) {
        return false;
    }

    const QString category = it->category;
    m_definitions.erase(it);
    m_toolOrder.removeAll(name);

    auto catIt = m_categories.find(category);
    if (catIt != m_categories.end()) {
        catIt->removeAll(name);
        if (catIt->isEmpty()) {
            m_categories.erase(catIt);
            m_categoryOrder.removeAll(category);
        }
    }
    return true;
}

std::optional<ToolDefinition> ToolRegistry::get(const QString& name) const {
    auto it = m_definitions.constFind(name);
    if (it != m_definitions.constEnd()) {
        return it.value();
    }
    return std::nullopt;
}

bool ToolRegistry::has(const QString& name) const {
    return m_definitions.contains(name);
}

QString ToolRegistry::getCursor(const QString& name) const {
    auto it = m_definitions.constFind(name);
    if (it != m_definitions.constEnd() && !it->cursor.isEmpty()) {
        return it->cursor;
    }
    return QStringLiteral("default");
}

QString ToolRegistry::getDisplayName(const QString& name) const {
    if (name.isEmpty()) {
        return name;
    }
    return name.at(0).toUpper() + name.mid(1);
}

QStringList ToolRegistry::getToolNames() const {
    return m_toolOrder;
}

QStringList ToolRegistry::getToolsByCategory(const QString& category) const {
    return m_categories.value(category);
}

QStringList ToolRegistry::getCategories() const {
    return m_categoryOrder;
}

bool ToolRegistry::createsLayer(const QString& name) const {
    auto it = m_definitions.constFind(name);
    return it != m_definitions.constEnd() && it->createsLayer;
}

bool ToolRegistry::hasCategory(const QString& name, const char* category) const {
    auto it = m_definitions.constFind(name);
    return it != m_definitions.constEnd() && it->category == QLatin1String(category);
}

bool ToolRegistry::isDrawingTool(const QString& name) const {
    return hasCategory(name, ToolCategory::kDrawing)
        || hasCategory(name, ToolCategory::kShape)
        || hasCategory(name, ToolCategory::kLine)
        || hasCategory(name, ToolCategory::kAnnotation);
}

bool ToolRegistry::isSelectionTool(const QString& name) const {
    return hasCategory(name, ToolCategory::kSelection);
}

bool ToolRegistry::isShapeTool(const QString& name) const {
    return hasCategory(name, ToolCategory::kShape);
}

QMap<QString, QString> ToolRegistry::getCursorMap() const {
    QMap<QString, QString> map;
    for (auto it = m_definitions.constBegin(); it != m_definitions.constEnd(); ++it) {
        map.insert(it.key(), it->cursor);
    }
    return map;
}

void ToolRegistry::clear() {
    m_definitions.clear();
    m_toolOrder.clear();
    m_categories.clear();
    m_categoryOrder.clear();
}

void ToolRegistry::reset() {
    clear();
    registerTools();
}

Qt::CursorShape ToolRegistry::cursorShape(const QString& cursorName) {
    if (cursorName == QLatin1String("crosshair")) {
        return Qt::CrossCursor;
    }
    if (cursorName == QLatin1String("grab")) {
        return Qt::OpenHandCursor;
    }
    if (cursorName == QLatin1String("grabbing")) {
        return Qt::ClosedHandCursor;
    }
    if (cursorName == QLatin1String("text")) {
        return Qt::IBeamCursor;
    }
    if (cursorName == QLatin1String("pointer")) {
        return Qt::PointingHandCursor;
    }
    if (cursorName == QLatin1String("move")) {
        return Qt::SizeAllCursor;
    }
    return Qt::ArrowCursor;
}
