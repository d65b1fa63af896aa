#pragma once

// ============================================================================
// PointerSample - Platform-neutral raw input sample
// ============================================================================
// Abstracts tablet, mouse and touch input into one format before it reaches
// the PointNormalizer. Multi-touch contact count is carried along so the
// stroke session can refuse to draw with more than one finger down.
// ============================================================================

#include <QPointF>
#include <QVector>

/**
 * @brief One physical sample as reported by the platform.
 */
struct RawSample {
    QPointF pos;                ///< Position in surface coordinates
    qreal pressure = 0.0;       ///< Raw pressure, only meaningful if hasPressure
    bool hasPressure = false;   ///< False for mice and fingers without force sensor
    qreal tiltX = 0.0;          ///< Tilt X in degrees, only meaningful if hasTilt
    qreal tiltY = 0.0;          ///< Tilt Y in degrees, only meaningful if hasTilt
    bool hasTilt = false;       ///< False when the device reports no tilt
};

/**
 * @brief An input event carrying a primary sample plus coalesced sub-samples.
 */
struct PointerSample {
    enum Phase { Press, Move, Release, Cancel };

    /// Two physically distinct delivery channels for the same interaction.
    enum Channel { Touch, Pointer };

    /// Device class; only Stylus takes part in the double-tap gesture.
    enum Device { Stylus, Finger, Mouse };

    Phase phase = Move;
    Channel channel = Pointer;
    Device device = Mouse;

    RawSample primary;              ///< The sample the event is reported at
    QVector<RawSample> coalesced;   ///< Earlier sub-samples batched into this event, oldest first

    qint64 timestamp = 0;           ///< Event time in milliseconds
    int contactCount = 1;           ///< Simultaneous contacts (touch channel)
};
