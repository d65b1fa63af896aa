#pragma once

// ============================================================================
// ToolType - Ink tools available on an annotation surface
// ============================================================================

#include <QString>

/**
 * @brief Available ink tools.
 *
 * The tool decides compositing, alpha and width rules at render time
 * (see StrokeRenderer). It is stored with every path so replay does not
 * depend on the tool that is currently selected.
 */
enum class ToolType {
    Pen,         ///< Pressure-sensitive pen, calligraphic when tilted
    Marker,      ///< Wide semi-transparent marker
    Highlighter, ///< Multiply-blended highlighter, pressure ignored
    Eraser       ///< Subtractive stroke (destination-out)
};

/**
 * @brief Name used in the serialized format ("pen", "marker", ...).
 */
inline QString toolName(ToolType tool)
{
    switch (tool) {
        case ToolType::Pen:         return QStringLiteral("pen");
        case ToolType::Marker:      return QStringLiteral("marker");
        case ToolType::Highlighter: return QStringLiteral("highlighter");
        case ToolType::Eraser:      return QStringLiteral("eraser");
    }
    return QStringLiteral("pen");
}

/**
 * @brief Parse a serialized tool name.
 * @param name Tool name as written by toolName().
 * @param ok Set to false for an unknown name (Pen is returned).
 */
inline ToolType toolFromName(const QString& name, bool* ok = nullptr)
{
    if (ok) *ok = true;
    if (name == QLatin1String("pen"))         return ToolType::Pen;
    if (name == QLatin1String("marker"))      return ToolType::Marker;
    if (name == QLatin1String("highlighter")) return ToolType::Highlighter;
    if (name == QLatin1String("eraser"))      return ToolType::Eraser;
    if (ok) *ok = false;
    return ToolType::Pen;
}
