#pragma once

// ============================================================================
// InkPoint - A single sampled point of an ink stroke
// ============================================================================
// Produced once per input sample by the PointNormalizer and never modified
// afterwards. Coordinates are surface-local pixels.
// ============================================================================

#include <QPointF>
#include <QJsonObject>
#include <QJsonValue>

/**
 * @brief A single point in a stroke with position, pressure and tilt.
 *
 * Pressure drives the rendered width of pen and marker strokes.
 * Tilt is only consulted by the pen tool (calligraphic nib).
 */
struct InkPoint {
    QPointF pos;            ///< Position in surface coordinates
    qreal pressure = 0.5;   ///< Pen pressure, 0.0 to 1.0
    qreal tiltX = 0.0;      ///< Stylus tilt X in degrees
    qreal tiltY = 0.0;      ///< Stylus tilt Y in degrees

    bool operator==(const InkPoint& other) const {
        return pos == other.pos && pressure == other.pressure &&
               tiltX == other.tiltX && tiltY == other.tiltY;
    }
    bool operator!=(const InkPoint& other) const { return !(*this == other); }

    /**
     * @brief Serialize to JSON.
     * @return JSON object with x, y, pressure, tiltX and tiltY fields.
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["x"] = pos.x();
        obj["y"] = pos.y();
        obj["pressure"] = pressure;
        obj["tiltX"] = tiltX;
        obj["tiltY"] = tiltY;
        return obj;
    }

    /**
     * @brief Deserialize from JSON.
     * @param obj JSON object with x, y and optional pressure/tilt fields.
     * @param ok Set to false if x or y is missing or not a number.
     */
    static InkPoint fromJson(const QJsonObject& obj, bool* ok = nullptr) {
        InkPoint pt;
        const QJsonValue x = obj.value("x");
        const QJsonValue y = obj.value("y");
        if (ok) {
            *ok = x.isDouble() && y.isDouble();
        }
        pt.pos = QPointF(x.toDouble(), y.toDouble());
        pt.pressure = obj.value("pressure").toDouble(0.5);  // No force sensor
        pt.tiltX = obj.value("tiltX").toDouble(0.0);
        pt.tiltY = obj.value("tiltY").toDouble(0.0);
        return pt;
    }
};
