#pragma once

// ============================================================================
// InkCanvas - Raster surface the ink of one annotation surface is painted on
// ============================================================================
// Holds the ARGB image plus the incremental-rendering cursor of the live
// stroke. Resizing discards the raster content; the owner must replay.
// ============================================================================

#include "../strokes/InkPath.h"

#include <QColor>
#include <QImage>
#include <QSize>
#include <QVector>

class InkCanvas {
public:
    InkCanvas() = default;

    /**
     * @brief Resize the raster.
     * @param logicalSize Size in surface pixels.
     * @param dpr Device pixel ratio for high DPI support.
     * @return True if the raster was reallocated (content is lost).
     */
    bool resize(const QSize& logicalSize, qreal dpr = 1.0);

    QSize logicalSize() const { return m_logicalSize; }
    qreal devicePixelRatio() const { return m_dpr; }

    /**
     * @brief Clear the raster and repaint every committed path, then the
     *        live stroke's segments painted so far (if any).
     */
    void replay(const QVector<InkPath>& paths, const InkPath* live);

    /**
     * @brief Paint the live stroke's segments that were appended since the
     *        last call.
     * @return Number of segments painted.
     */
    int paintIncremental(const InkPath& live);

    /**
     * @brief Finish the live stroke: paint any remaining segments and the
     *        tail up to its final point, then reset the cursor.
     */
    void finishLive(const InkPath& live);

    /**
     * @brief Forget the live stroke without painting (next stroke starts fresh).
     */
    void resetLive();

    int livePaintedPoints() const { return m_livePainted; }

    const QImage& image() const { return m_image; }
    bool isNull() const { return m_image.isNull(); }

private:
    const QColor& liveInk(const InkPath& live);

    QImage m_image;
    QSize m_logicalSize;
    qreal m_dpr = 1.0;
    int m_livePainted = 0;  ///< Points of the live stroke already on the raster
    QColor m_liveInk;       ///< Parsed once per live stroke
    bool m_hasLiveInk = false;
};
