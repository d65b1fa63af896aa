#include "RenderScheduler.h"
#include "InkCanvas.h"
#include "../core/PathStore.h"
#include "../core/StrokeSession.h"

#include <QDebug>

RenderScheduler::RenderScheduler(InkCanvas* canvas, const PathStore* store,
                                 const StrokeSession* session, QObject* parent)
    : QObject(parent)
    , m_canvas(canvas)
    , m_store(store)
    , m_session(session)
{
    m_frameTimer.setTimerType(Qt::PreciseTimer);
    m_frameTimer.setInterval(DEFAULT_FRAME_INTERVAL_MS);
    connect(&m_frameTimer, &QTimer::timeout, this, &RenderScheduler::flush);
}

void RenderScheduler::setFrameInterval(int ms)
{
    if (ms <= 0) {
        qWarning() << "RenderScheduler: ignoring invalid frame interval" << ms;
        return;
    }
    m_frameTimer.setInterval(ms);
}

void RenderScheduler::markDirty()
{
    m_dirty = true;
    ensureTimer();
}

void RenderScheduler::requestFullReplay()
{
    m_replayPending = true;
    ensureTimer();
}

void RenderScheduler::commitLive(const InkPath& path)
{
    m_dirty = false;
    if (m_replayPending) {
        m_canvas->resetLive();
        return;
    }

    m_canvas->finishLive(path);
    ++m_incrementalPaints;
    emit painted();

    if (!hasPendingWork()) {
        m_frameTimer.stop();
    }
}

void RenderScheduler::flush()
{
    if (m_replayPending) {
        const InkPath* live = m_session->isDrawing() ? &m_session->currentPath() : nullptr;
        m_canvas->replay(m_store->paths(), live);
        m_replayPending = false;
        m_dirty = false;
        ++m_fullReplays;
#if VERSEINK_DEBUG
        qDebug() << "RenderScheduler: full replay of" << m_store->count() << "paths";
#endif
        emit painted();
    } else if (m_dirty) {
        m_dirty = false;
        if (m_session->isDrawing() && m_canvas->paintIncremental(m_session->currentPath()) > 0) {
            ++m_incrementalPaints;
            emit painted();
        }
    }

    if (!hasPendingWork()) {
        m_frameTimer.stop();
    }
}

void RenderScheduler::ensureTimer()
{
    if (!m_frameTimer.isActive()) {
        m_frameTimer.start();
    }
}
