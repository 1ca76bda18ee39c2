#pragma once

// ============================================================================
// ToolType - Available canvas tools
// ============================================================================
// Part of the ExamInk drawing engine
// Freehand, shape and text tools produce committed objects; Pan only moves
// the view.
// ============================================================================

#include <QString>

/**
 * @brief Available drawing and navigation tools.
 */
enum class ToolType {
    Pencil,     ///< Freehand ink
    Eraser,     ///< Freehand ink tagged as eraser (consumer paints background)
    Line,       ///< Straight line shape
    Rectangle,  ///< Axis-aligned rectangle shape
    Ellipse,    ///< Ellipse inscribed in the drag rectangle
    Text,       ///< Text annotation box
    Pan         ///< Navigation only, never produces ink
};

inline bool isFreehandTool(ToolType tool)
{
    return tool == ToolType::Pencil || tool == ToolType::Eraser;
}

inline bool isShapeTool(ToolType tool)
{
    return tool == ToolType::Line || tool == ToolType::Rectangle || tool == ToolType::Ellipse;
}

/**
 * @brief Stable string name, used in snapshots and settings.
 */
inline QString toolTypeName(ToolType tool)
{
    switch (tool) {
        case ToolType::Pencil:    return QStringLiteral("pencil");
        case ToolType::Eraser:    return QStringLiteral("eraser");
        case ToolType::Line:      return QStringLiteral("line");
        case ToolType::Rectangle: return QStringLiteral("rectangle");
        case ToolType::Ellipse:   return QStringLiteral("ellipse");
        case ToolType::Text:      return QStringLiteral("text");
        case ToolType::Pan:       return QStringLiteral("pan");
    }
    return QStringLiteral("pencil");
}

/**
 * @brief Parse a tool name.
 * @param name Name as produced by toolTypeName().
 * @param fallback Returned for unknown names.
 */
inline ToolType toolTypeFromName(const QString& name, ToolType fallback = ToolType::Pencil)
{
    if (name == QLatin1String("pencil"))    return ToolType::Pencil;
    if (name == QLatin1String("eraser"))    return ToolType::Eraser;
    if (name == QLatin1String("line"))      return ToolType::Line;
    if (name == QLatin1String("rectangle")) return ToolType::Rectangle;
    if (name == QLatin1String("ellipse"))   return ToolType::Ellipse;
    if (name == QLatin1String("text"))      return ToolType::Text;
    if (name == QLatin1String("pan"))       return ToolType::Pan;
    return fallback;
}
