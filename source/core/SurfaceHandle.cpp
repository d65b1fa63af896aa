#include "SurfaceHandle.h"
#include "SurfaceController.h"

SurfaceHandle::SurfaceHandle(SurfaceController* controller)
    : m_controller(controller)
{
}

bool SurfaceHandle::undo()
{
    return m_controller ? m_controller->undo() : false;
}

void SurfaceHandle::clear()
{
    if (m_controller) {
        m_controller->clear();
    }
}

bool SurfaceHandle::clearAll()
{
    return m_controller ? m_controller->clearAll() : false;
}

void SurfaceHandle::setTool(ToolType tool)
{
    if (m_controller) {
        m_controller->setTool(tool);
    }
}

void SurfaceHandle::setColor(const QString& color)
{
    if (m_controller) {
        m_controller->setColor(color);
    }
}

void SurfaceHandle::setSize(qreal size)
{
    if (m_controller) {
        m_controller->setSize(size);
    }
}

void SurfaceHandle::loadPaths(const QVector<InkPath>& paths)
{
    if (m_controller) {
        m_controller->loadPaths(paths);
    }
}

QString SurfaceHandle::serializedData() const
{
    return m_controller ? m_controller->serializedData() : QString();
}
