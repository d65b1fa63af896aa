#pragma once

// ============================================================================
// ToolState - Tool, color and size applied to the next stroke
// ============================================================================
// Shared by pointer between every mounted surface (e.g. mirrored language
// panels) so a change made through one toolbar shows up on the other.
// Stroke sessions sample it when a stroke starts; later changes never touch
// strokes that are already in progress or completed.
// ============================================================================

#include "ToolType.h"

#include <QObject>
#include <QString>

class ToolState : public QObject {
    Q_OBJECT

public:
    explicit ToolState(QObject* parent = nullptr);
    ToolState(ToolType tool, const QString& color, qreal size, QObject* parent = nullptr);

    ToolType tool() const { return m_tool; }
    QString color() const { return m_color; }
    qreal size() const { return m_size; }

    void setTool(ToolType tool);
    void setColor(const QString& color);

    /**
     * @brief Set the base stroke width.
     * Non-positive sizes are rejected (logged, state unchanged).
     */
    void setSize(qreal size);

signals:
    /**
     * @brief Emitted after any of tool, color or size changed.
     */
    void changed();

private:
    ToolType m_tool = ToolType::Pen;
    QString m_color = QStringLiteral("#000000");
    qreal m_size = 2.0;
};
