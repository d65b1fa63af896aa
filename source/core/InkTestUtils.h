#ifndef INKTESTUTILS_H
#define INKTESTUTILS_H

// ============================================================================
// InkTestUtils - Builders shared by the ink engine tests
// ============================================================================

#include "../input/PointerSample.h"
#include "../strokes/InkPath.h"

namespace InkTestUtils {

inline PointerSample sample(PointerSample::Phase phase, const QPointF& pos, qint64 timestamp,
                            PointerSample::Device device = PointerSample::Mouse,
                            PointerSample::Channel channel = PointerSample::Pointer)
{
    PointerSample s;
    s.phase = phase;
    s.channel = channel;
    s.device = device;
    s.primary.pos = pos;
    s.timestamp = timestamp;
    if (device == PointerSample::Stylus) {
        s.primary.pressure = 0.8;
        s.primary.hasPressure = true;
    }
    return s;
}

inline PointerSample stylus(PointerSample::Phase phase, const QPointF& pos, qint64 timestamp)
{
    return sample(phase, pos, timestamp, PointerSample::Stylus, PointerSample::Pointer);
}

inline PointerSample finger(PointerSample::Phase phase, const QPointF& pos, qint64 timestamp)
{
    return sample(phase, pos, timestamp, PointerSample::Finger, PointerSample::Touch);
}

/**
 * Straight path from `from` to `to` with `count` evenly spaced points.
 */
inline InkPath line(const QPointF& from, const QPointF& to, int count = 5,
                    ToolType tool = ToolType::Pen, const QString& color = QStringLiteral("#000000"),
                    qreal size = 4.0)
{
    InkPath path;
    path.tool = tool;
    path.color = color;
    path.size = size;
    for (int i = 0; i < count; ++i) {
        const qreal t = count > 1 ? qreal(i) / (count - 1) : 0.0;
        InkPoint pt;
        pt.pos = from + (to - from) * t;
        pt.pressure = 0.5;
        path.points.append(pt);
    }
    return path;
}

} // namespace InkTestUtils

#endif // INKTESTUTILS_H
