#include "PointNormalizer.h"

#include <QMouseEvent>
#include <QTabletEvent>
#include <QTouchEvent>
#include <QInputDevice>
#include <QPointingDevice>

InkPoint PointNormalizer::normalize(const RawSample& sample)
{
    InkPoint pt;
    pt.pos = sample.pos;
    pt.pressure = sample.hasPressure ? qBound(0.0, sample.pressure, 1.0) : DEFAULT_PRESSURE;
    pt.tiltX = sample.hasTilt ? sample.tiltX : 0.0;
    pt.tiltY = sample.hasTilt ? sample.tiltY : 0.0;
    return pt;
}

QVector<InkPoint> PointNormalizer::normalize(const PointerSample& sample)
{
    QVector<InkPoint> points;
    points.reserve(sample.coalesced.size() + 1);
    for (const auto& sub : sample.coalesced) {
        points.append(normalize(sub));
    }
    points.append(normalize(sample.primary));
    return points;
}

bool PointNormalizer::fromTabletEvent(const QTabletEvent* event, PointerSample& sample)
{
    switch (event->type()) {
        case QEvent::TabletPress:
            sample.phase = PointerSample::Press;
            break;
        case QEvent::TabletMove:
            sample.phase = PointerSample::Move;
            break;
        case QEvent::TabletRelease:
            sample.phase = PointerSample::Release;
            break;
        default:
            return false;
    }

    sample.channel = PointerSample::Pointer;
    sample.device = PointerSample::Stylus;
    sample.primary = RawSample();
    sample.primary.pos = event->position();
    sample.primary.pressure = event->pressure();
    sample.primary.hasPressure = true;
    sample.primary.tiltX = event->xTilt();
    sample.primary.tiltY = event->yTilt();
    sample.primary.hasTilt = true;
    sample.coalesced.clear();
    sample.timestamp = static_cast<qint64>(event->timestamp());
    sample.contactCount = 1;
    return true;
}

bool PointNormalizer::fromMouseEvent(const QMouseEvent* event, PointerSample& sample)
{
    // CRITICAL: Reject touch-synthesized mouse events
    if (event->source() == Qt::MouseEventSynthesizedBySystem ||
        event->source() == Qt::MouseEventSynthesizedByQt) {
        return false;
    }

    switch (event->type()) {
        case QEvent::MouseButtonPress:
            sample.phase = PointerSample::Press;
            break;
        case QEvent::MouseMove:
            sample.phase = PointerSample::Move;
            break;
        case QEvent::MouseButtonRelease:
            sample.phase = PointerSample::Release;
            break;
        default:
            return false;
    }

    sample.channel = PointerSample::Pointer;
    sample.device = PointerSample::Mouse;
    sample.primary = RawSample();
    sample.primary.pos = event->position();
    sample.coalesced.clear();
    sample.timestamp = static_cast<qint64>(event->timestamp());
    sample.contactCount = 1;
    return true;
}

bool PointNormalizer::fromTouchEvent(const QTouchEvent* event, PointerSample& sample)
{
    switch (event->type()) {
        case QEvent::TouchBegin:
            sample.phase = PointerSample::Press;
            break;
        case QEvent::TouchUpdate:
            sample.phase = PointerSample::Move;
            break;
        case QEvent::TouchEnd:
            sample.phase = PointerSample::Release;
            break;
        case QEvent::TouchCancel:
            sample.phase = PointerSample::Cancel;
            break;
        default:
            return false;
    }

    const auto& points = event->points();
    if (points.isEmpty() && sample.phase != PointerSample::Cancel) {
        return false;
    }

    const QPointingDevice* device = event->pointingDevice();
    const bool isPen = device && device->pointerType() == QPointingDevice::PointerType::Pen;
    const bool hasPressure = device &&
        device->capabilities().testFlag(QInputDevice::Capability::Pressure);

    sample.channel = PointerSample::Touch;
    sample.device = isPen ? PointerSample::Stylus : PointerSample::Finger;
    sample.primary = RawSample();
    if (!points.isEmpty()) {
        const QEventPoint& point = points.first();
        sample.primary.pos = point.position();
        sample.primary.pressure = point.pressure();
        sample.primary.hasPressure = hasPressure;
    }
    sample.coalesced.clear();
    sample.timestamp = static_cast<qint64>(event->timestamp());
    sample.contactCount = points.size();
    return true;
}
