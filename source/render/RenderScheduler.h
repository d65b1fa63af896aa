#pragma once

// ============================================================================
// RenderScheduler - Frame-paced painting of one surface's raster
// ============================================================================
// Two distinct paths onto the InkCanvas:
//  - Incremental: while a stroke is being drawn, at most one paint per frame
//    tick, covering only the segments appended since the previous tick.
//  - Full replay: after a structural change (load, undo, clear, resize,
//    cancel, tool push while inactive) the raster is cleared and the whole
//    PathStore is repainted.
// The frame timer only runs while there is something to paint.
// ============================================================================

#include <QObject>
#include <QTimer>

class InkCanvas;
class PathStore;
class StrokeSession;
struct InkPath;

class RenderScheduler : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_FRAME_INTERVAL_MS = 16;

    /**
     * @param canvas Raster to paint on (not owned).
     * @param store Committed paths (not owned).
     * @param session Source of the live stroke (not owned).
     */
    RenderScheduler(InkCanvas* canvas, const PathStore* store, const StrokeSession* session,
                    QObject* parent = nullptr);

    /**
     * @brief New points were appended to the live stroke.
     */
    void markDirty();

    /**
     * @brief Schedule a full replay on the next frame tick.
     */
    void requestFullReplay();

    /**
     * @brief The live stroke was committed: paint its remaining segments and
     *        final half-segment now.
     *
     * Skipped when a full replay is already pending (the replay covers it).
     */
    void commitLive(const InkPath& path);

    void setFrameInterval(int ms);
    int frameInterval() const { return m_frameTimer.interval(); }

    bool hasPendingWork() const { return m_dirty || m_replayPending; }
    bool isReplayPending() const { return m_replayPending; }
    bool isTimerActive() const { return m_frameTimer.isActive(); }

    // Diagnostics
    int incrementalPaintCount() const { return m_incrementalPaints; }
    int fullReplayCount() const { return m_fullReplays; }
    void resetCounters() { m_incrementalPaints = 0; m_fullReplays = 0; }

public slots:
    /**
     * @brief Process pending work immediately instead of waiting for the tick.
     */
    void flush();

signals:
    /**
     * @brief The raster changed and should be presented.
     */
    void painted();

private:
    void ensureTimer();

    InkCanvas* m_canvas;
    const PathStore* m_store;
    const StrokeSession* m_session;

    QTimer m_frameTimer;
    bool m_dirty = false;
    bool m_replayPending = false;

    int m_incrementalPaints = 0;
    int m_fullReplays = 0;
};
