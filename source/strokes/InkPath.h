#pragma once

// ============================================================================
// InkPath - One completed stroke (press to release)
// ============================================================================
// The serialized form of a stroke. Once appended to a PathStore a path is
// never modified; undo removes whole paths.
// ============================================================================

#include "InkPoint.h"
#include "../core/ToolType.h"

#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>
#include <QMetaType>

/**
 * @brief A complete ink stroke with the tool, color and size it was drawn with.
 */
struct InkPath {
    ToolType tool = ToolType::Pen;  ///< Tool the stroke was drawn with
    QString color;                  ///< CSS-style color string, kept verbatim
    qreal size = 2.0;               ///< Base stroke width before pressure scaling
    QVector<InkPoint> points;       ///< Sampled points in draw order

    /**
     * @brief A path needs at least two points to produce visible ink.
     */
    bool isValid() const { return points.size() >= 2; }

    bool operator==(const InkPath& other) const {
        return tool == other.tool && color == other.color &&
               size == other.size && points == other.points;
    }
    bool operator!=(const InkPath& other) const { return !(*this == other); }

    /**
     * @brief Serialize to JSON.
     * @return JSON object containing tool, color, size and points.
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["tool"] = toolName(tool);
        obj["color"] = color;
        obj["size"] = size;
        QJsonArray pointsArray;
        for (const auto& pt : points) {
            pointsArray.append(pt.toJson());
        }
        obj["points"] = pointsArray;
        return obj;
    }

    /**
     * @brief Deserialize from JSON.
     * @param obj JSON object containing path data.
     * @param ok Set to false if the object is structurally invalid
     *           (unknown tool, missing color/size, non-array points, bad point).
     */
    static InkPath fromJson(const QJsonObject& obj, bool* ok = nullptr) {
        InkPath path;
        bool toolOk = false;
        path.tool = toolFromName(obj.value("tool").toString(), &toolOk);
        if (ok) *ok = false;
        if (!toolOk || !obj.value("color").isString() || !obj.value("size").isDouble() ||
            !obj.value("points").isArray()) {
            return path;
        }

        path.color = obj.value("color").toString();
        path.size = obj.value("size").toDouble();

        const QJsonArray pointsArray = obj.value("points").toArray();
        path.points.reserve(pointsArray.size());
        for (const auto& val : pointsArray) {
            bool pointOk = false;
            InkPoint pt = InkPoint::fromJson(val.toObject(), &pointOk);
            if (!val.isObject() || !pointOk) {
                return path;
            }
            path.points.append(pt);
        }
        if (ok) *ok = true;
        return path;
    }
};

Q_DECLARE_METATYPE(InkPath)
