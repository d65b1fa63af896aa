#pragma once

// ============================================================================
// StrokeSession - Lifecycle of the in-progress stroke on one surface
// ============================================================================
// State machine: Idle -> Drawing -> Idle, plus an eraser toggle reached by a
// stylus double-tap. Owns the input-channel selection: once a stroke starts
// on the touch channel, pointer-channel events are ignored until it ends
// (and vice versa), so dual delivery of one interaction draws once.
// ============================================================================

#include "ToolType.h"
#include "../input/PointerSample.h"
#include "../strokes/InkPath.h"

#include <QObject>

class ToolState;

class StrokeSession : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,           ///< No stroke; next press starts one
        Drawing,        ///< A stroke is being captured
        EraserToggled   ///< Idle with the double-tap eraser toggle engaged
    };

    /// Double-tap window, exclusive on both ends (milliseconds between stylus-downs)
    static constexpr qint64 DOUBLE_TAP_MIN_MS = 50;
    static constexpr qint64 DOUBLE_TAP_MAX_MS = 300;

    /**
     * @param toolState Shared tool configuration (not owned).
     */
    explicit StrokeSession(ToolState* toolState, QObject* parent = nullptr);

    /**
     * @brief Route one input sample through the state machine.
     * @return True if the sample was consumed (drew, toggled, or was
     *         swallowed as a duplicate from the other channel).
     */
    bool handleSample(const PointerSample& sample);

    /**
     * @brief Enable or disable stroke capture (surface active mode).
     *
     * Disabling while drawing cancels the stroke.
     */
    void setEnabled(bool enabled);
    bool isEnabled() const { return m_enabled; }

    /**
     * @brief Abort the in-progress stroke without committing it.
     * @return True if a stroke was in progress.
     */
    bool cancel();

    State state() const;
    bool isDrawing() const { return m_drawing; }

    /**
     * @brief Channel the current stroke is bound to (meaningful while drawing).
     */
    PointerSample::Channel activeChannel() const { return m_channel; }

    /**
     * @brief The stroke being captured; empty points when idle.
     */
    const InkPath& currentPath() const { return m_current; }

    /**
     * @brief Tool the next stroke will use (shared tool, or the toggle override).
     */
    ToolType effectiveTool() const;

signals:
    void strokeStarted();
    void pointsAppended();

    /**
     * @brief A released stroke with at least 2 points.
     */
    void strokeCommitted(const InkPath& path);

    /**
     * @brief The stroke was aborted; partially painted ink must be discarded.
     */
    void strokeCancelled();

    void toolToggled(ToolType tool);

private:
    bool handlePress(const PointerSample& sample);
    bool handleMove(const PointerSample& sample);
    bool handleRelease(const PointerSample& sample);
    void startStroke(const PointerSample& sample);
    void resetStroke();

    ToolState* m_toolState;     ///< Not owned
    bool m_enabled = false;
    bool m_drawing = false;
    PointerSample::Channel m_channel = PointerSample::Pointer;
    InkPath m_current;

    // Double-tap tool toggle
    qint64 m_lastStylusDown = -1;
    bool m_hasToolOverride = false;
    ToolType m_toolOverride = ToolType::Pen;
};
