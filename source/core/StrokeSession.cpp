#include "StrokeSession.h"
#include "ToolState.h"
#include "../input/PointNormalizer.h"

#include <QDebug>

StrokeSession::StrokeSession(ToolState* toolState, QObject* parent)
    : QObject(parent)
    , m_toolState(toolState)
{
    // A tool chosen by the host replaces the gesture toggle
    connect(m_toolState, &ToolState::changed, this, [this]() {
        m_hasToolOverride = false;
    });
}

StrokeSession::State StrokeSession::state() const
{
    if (m_drawing) {
        return State::Drawing;
    }
    if (m_hasToolOverride && m_toolOverride == ToolType::Eraser) {
        return State::EraserToggled;
    }
    return State::Idle;
}

ToolType StrokeSession::effectiveTool() const
{
    return m_hasToolOverride ? m_toolOverride : m_toolState->tool();
}

void StrokeSession::setEnabled(bool enabled)
{
    if (m_enabled == enabled) {
        return;
    }
    if (!enabled) {
        cancel();
    }
    m_enabled = enabled;
}

bool StrokeSession::handleSample(const PointerSample& sample)
{
    switch (sample.phase) {
        case PointerSample::Press:
            return handlePress(sample);
        case PointerSample::Move:
            return handleMove(sample);
        case PointerSample::Release:
            return handleRelease(sample);
        case PointerSample::Cancel:
            if (m_drawing && sample.channel == m_channel) {
                return cancel();
            }
            return false;
    }
    return false;
}

bool StrokeSession::handlePress(const PointerSample& sample)
{
    if (!m_enabled) {
        return false;
    }

    if (m_drawing) {
        // Only one stroke at a time: the other channel's copy of this
        // interaction, or a second finger, is swallowed
        return true;
    }

    if (sample.contactCount > 1) {
        return false;
    }

    if (sample.device == PointerSample::Stylus) {
        const qint64 sinceLast = sample.timestamp - m_lastStylusDown;
        if (m_lastStylusDown >= 0 && sinceLast > DOUBLE_TAP_MIN_MS && sinceLast < DOUBLE_TAP_MAX_MS) {
            m_toolOverride = (effectiveTool() == ToolType::Eraser) ? ToolType::Pen : ToolType::Eraser;
            m_hasToolOverride = true;
            m_lastStylusDown = -1;  // A third tap starts a new pair
#if VERSEINK_DEBUG
            qDebug() << "StrokeSession: double-tap toggled tool to" << toolName(m_toolOverride);
#endif
            emit toolToggled(m_toolOverride);
            return true;
        }
        m_lastStylusDown = sample.timestamp;
    }

    startStroke(sample);
    return true;
}

bool StrokeSession::handleMove(const PointerSample& sample)
{
    if (!m_drawing) {
        return false;
    }
    if (sample.channel != m_channel) {
        return true;    // Duplicate delivery from the other channel
    }
    if (sample.contactCount > 1) {
        return true;    // Multi-touch does not draw, but does not abort either
    }

    m_current.points.append(PointNormalizer::normalize(sample));
    emit pointsAppended();
    return true;
}

bool StrokeSession::handleRelease(const PointerSample& sample)
{
    if (!m_drawing) {
        return false;
    }
    if (sample.channel != m_channel) {
        return true;
    }

    InkPath finished = m_current;
    resetStroke();

    // A tap (single point) leaves no ink
    if (finished.isValid()) {
        emit strokeCommitted(finished);
    }
    return true;
}

bool StrokeSession::cancel()
{
    if (!m_drawing) {
        return false;
    }
    resetStroke();
    emit strokeCancelled();
    return true;
}

void StrokeSession::startStroke(const PointerSample& sample)
{
    // Tool state is sampled once, here; changes mid-stroke do not apply
    m_current = InkPath();
    m_current.tool = effectiveTool();
    m_current.color = m_toolState->color();
    m_current.size = m_toolState->size();
    m_current.points = PointNormalizer::normalize(sample);

    m_drawing = true;
    m_channel = sample.channel;

    emit strokeStarted();
    emit pointsAppended();
}

void StrokeSession::resetStroke()
{
    m_drawing = false;
    m_current = InkPath();
}
