#pragma once

// ============================================================================
// SurfaceHandle - Imperative interface the host uses to drive a surface
// ============================================================================
// A small value object handed out by SurfaceController::handle(). It stays
// safe to call after the controller is gone (calls become no-ops), so toolbar
// actions can hold one without tracking surface lifetimes.
// ============================================================================

#include "ToolType.h"
#include "../strokes/InkPath.h"

#include <QPointer>
#include <QString>
#include <QVector>

class SurfaceController;

class SurfaceHandle {
public:
    SurfaceHandle() = default;
    explicit SurfaceHandle(SurfaceController* controller);

    bool isValid() const { return !m_controller.isNull(); }

    bool undo();
    void clear();
    bool clearAll();
    void setTool(ToolType tool);
    void setColor(const QString& color);
    void setSize(qreal size);
    void loadPaths(const QVector<InkPath>& paths);

    /**
     * @brief Serialized path sequence; empty string if the controller is gone.
     */
    QString serializedData() const;

private:
    QPointer<SurfaceController> m_controller;
};
