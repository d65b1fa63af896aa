#include "InkCanvas.h"
#include "StrokeRenderer.h"

#include <QPainter>
#include <QtMath>

bool InkCanvas::resize(const QSize& logicalSize, qreal dpr)
{
    if (logicalSize == m_logicalSize && qFuzzyCompare(m_dpr, dpr) && !m_image.isNull()) {
        return false;
    }

    m_logicalSize = logicalSize;
    m_dpr = dpr;

    if (logicalSize.isEmpty()) {
        m_image = QImage();
        return true;
    }

    // Create the image at physical pixel size, not logical size
    QSize physicalSize(qCeil(logicalSize.width() * dpr), qCeil(logicalSize.height() * dpr));
    m_image = QImage(physicalSize, QImage::Format_ARGB32_Premultiplied);
    m_image.setDevicePixelRatio(dpr);
    m_image.fill(Qt::transparent);
    return true;
}

void InkCanvas::replay(const QVector<InkPath>& paths, const InkPath* live)
{
    m_livePainted = 0;
    m_hasLiveInk = false;
    if (m_image.isNull()) {
        return;
    }

    StrokeRenderer::replay(m_image, paths);
    if (live) {
        paintIncremental(*live);
    }
}

int InkCanvas::paintIncremental(const InkPath& live)
{
    const int n = live.points.size();
    if (m_image.isNull() || n < 2 || n <= m_livePainted) {
        return 0;
    }

    QPainter painter(&m_image);
    const int startIdx = qMax(1, m_livePainted);
    for (int i = startIdx; i < n; ++i) {
        StrokeRenderer::paintSegment(painter, live, i, liveInk(live));
    }
    m_livePainted = n;
    return n - startIdx;
}

void InkCanvas::finishLive(const InkPath& live)
{
    if (!m_image.isNull() && live.points.size() >= 2) {
        paintIncremental(live);
        QPainter painter(&m_image);
        StrokeRenderer::paintTail(painter, live, liveInk(live));
    }
    resetLive();
}

void InkCanvas::resetLive()
{
    m_livePainted = 0;
    m_hasLiveInk = false;
}

const QColor& InkCanvas::liveInk(const InkPath& live)
{
    if (!m_hasLiveInk) {
        m_liveInk = StrokeRenderer::inkColor(live);
        m_hasLiveInk = true;
    }
    return m_liveInk;
}
