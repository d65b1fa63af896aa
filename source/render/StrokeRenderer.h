#pragma once

// ============================================================================
// StrokeRenderer - Tool-dependent painting of ink segments and paths
// ============================================================================
// Shared by incremental painting (newest segments of the live stroke) and
// full replay (every path in store order). Both go through paintSegment()
// so a replayed path looks the same as when it was drawn live.
// ============================================================================

#include "../strokes/InkPath.h"

#include <QPainter>
#include <QColor>
#include <QImage>
#include <QVector>

class StrokeRenderer {
public:
    // ===== Width and compositing rules =====

    static constexpr qreal PRESSURE_FLOOR = 0.1;        ///< Width factor at pressure 0
    static constexpr qreal PRESSURE_RANGE = 1.8;        ///< Added width factor at pressure 1
    static constexpr qreal TILT_THRESHOLD = 15.0;       ///< Degrees before the pen turns calligraphic
    static constexpr qreal MARKER_WIDTH_FACTOR = 2.5;
    static constexpr qreal HIGHLIGHTER_WIDTH_FACTOR = 5.0;
    static constexpr qreal ERASER_WIDTH_FACTOR = 4.0;
    static constexpr qreal MARKER_ALPHA = 0.7;
    static constexpr qreal HIGHLIGHTER_ALPHA = 0.25;

    /**
     * @brief Pressure-scaled width: size * (0.1 + pressure * 1.8).
     */
    static qreal pressureWidth(qreal size, qreal pressure);

    /**
     * @brief Width of ink laid down at a point for the given tool.
     *
     * | tool        | width                                   |
     * |-------------|-----------------------------------------|
     * | pen         | pressureWidth, tilt-scaled above 15 deg |
     * | marker      | 2.5 x pressureWidth                     |
     * | highlighter | 5 x size (pressure ignored)             |
     * | eraser      | 4 x size                                |
     */
    static qreal effectiveWidth(ToolType tool, qreal size, const InkPoint& point);

    static QPainter::CompositionMode compositionMode(ToolType tool);
    static qreal toolAlpha(ToolType tool);

    /**
     * @brief Parse a CSS-style color ("#rgb", "#rrggbb", "rgb(r, g, b)",
     *        "rgba(r, g, b, a)" or a named color).
     * @param ok Set to false if the string is unparsable.
     * @return The color, or opaque black (with a warning) if unparsable.
     */
    static QColor parseColor(const QString& color, bool* ok = nullptr);

    /**
     * @brief Color a path is painted with: its parsed color at the tool's
     *        alpha. Parse once per path and pass it to the paint calls.
     */
    static QColor inkColor(const InkPath& path);

    // ===== Painting =====

    /**
     * @brief Paint the segment ending at path.points[index].
     * @param index Index of the segment's end point, >= 1.
     *
     * The segment is a quadratic curve from the midpoint of the previous
     * segment through points[index - 1] to the midpoint of this segment.
     * The half-segment up to the final point is painted by paintTail().
     */
    static void paintSegment(QPainter& painter, const InkPath& path, int index, const QColor& ink);

    /**
     * @brief Paint the last half-segment of a path, up to its final point.
     */
    static void paintTail(QPainter& painter, const InkPath& path, const QColor& ink);

    /**
     * @brief Paint a complete path (all segments plus the tail).
     */
    static void paintPath(QPainter& painter, const InkPath& path);

    /**
     * @brief Clear the image and repaint every path in order.
     *
     * Replaying the same paths twice yields the same image.
     */
    static void replay(QImage& image, const QVector<InkPath>& paths);

private:
    static void applyBrush(QPainter& painter, ToolType tool, const QColor& ink, qreal width);
};
