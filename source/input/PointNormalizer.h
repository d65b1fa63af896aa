#pragma once

// ============================================================================
// PointNormalizer - Raw input samples to InkPoints
// ============================================================================
// Converts Qt tablet, mouse and touch events into PointerSamples and
// PointerSamples into ordered InkPoints. Has no side effects on rendering
// or storage state.
// ============================================================================

#include "PointerSample.h"
#include "../strokes/InkPoint.h"

#include <QVector>

class QMouseEvent;
class QTabletEvent;
class QTouchEvent;

class PointNormalizer {
public:
    /// Pressure used when the device reports none (finger without force sensor, mouse).
    static constexpr qreal DEFAULT_PRESSURE = 0.5;

    /**
     * @brief Normalize one raw sample.
     *
     * Pressure is clamped to [0, 1] and defaults to DEFAULT_PRESSURE;
     * tilt defaults to 0.
     */
    static InkPoint normalize(const RawSample& sample);

    /**
     * @brief Normalize an event: coalesced sub-samples first, then the primary.
     * @return One point per sample, in temporal order.
     */
    static QVector<InkPoint> normalize(const PointerSample& sample);

    // ===== Qt event conversion =====

    /**
     * @brief Convert a tablet event (pointer channel, stylus class).
     * @param sample Receives the converted sample.
     * @return False for event types that are not press/move/release.
     */
    static bool fromTabletEvent(const QTabletEvent* event, PointerSample& sample);

    /**
     * @brief Convert a mouse event (pointer channel, mouse class).
     * @return False for mouse events synthesized from touch; the touch
     *         channel already delivers that interaction.
     */
    static bool fromMouseEvent(const QMouseEvent* event, PointerSample& sample);

    /**
     * @brief Convert a touch event (touch channel).
     *
     * The first touch point is the primary sample; contactCount carries the
     * number of points down.
     * @return False for unsupported event types or events without points.
     */
    static bool fromTouchEvent(const QTouchEvent* event, PointerSample& sample);
};
