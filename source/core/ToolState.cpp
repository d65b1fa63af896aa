#include "ToolState.h"

#include <QDebug>

ToolState::ToolState(QObject* parent)
    : QObject(parent)
{
}

ToolState::ToolState(ToolType tool, const QString& color, qreal size, QObject* parent)
    : QObject(parent)
    , m_tool(tool)
    , m_color(color)
    , m_size(size > 0 ? size : 2.0)
{
}

void ToolState::setTool(ToolType tool)
{
    if (m_tool == tool) {
        return;
    }
    m_tool = tool;
    emit changed();
}

void ToolState::setColor(const QString& color)
{
    if (m_color == color) {
        return;
    }
    m_color = color;
    emit changed();
}

void ToolState::setSize(qreal size)
{
    if (size <= 0) {
        qWarning() << "ToolState: ignoring non-positive size" << size;
        return;
    }
    if (qFuzzyCompare(m_size, size)) {
        return;
    }
    m_size = size;
    emit changed();
}
