#include "StrokeRenderer.h"

#include <QPainterPath>
#include <QRegularExpression>
#include <QDebug>
#include <QtMath>

namespace {

QPointF midpoint(const QPointF& a, const QPointF& b)
{
    return QPointF((a.x() + b.x()) / 2.0, (a.y() + b.y()) / 2.0);
}

// Width sampled halfway between two points
InkPoint averagePoint(const InkPoint& a, const InkPoint& b)
{
    InkPoint avg;
    avg.pos = midpoint(a.pos, b.pos);
    avg.pressure = (a.pressure + b.pressure) / 2.0;
    avg.tiltX = (a.tiltX + b.tiltX) / 2.0;
    avg.tiltY = (a.tiltY + b.tiltY) / 2.0;
    return avg;
}

} // namespace

qreal StrokeRenderer::pressureWidth(qreal size, qreal pressure)
{
    return size * (PRESSURE_FLOOR + pressure * PRESSURE_RANGE);
}

qreal StrokeRenderer::effectiveWidth(ToolType tool, qreal size, const InkPoint& point)
{
    switch (tool) {
        case ToolType::Pen: {
            qreal width = pressureWidth(size, point.pressure);
            // Calligraphic nib when the stylus leans over
            if (qAbs(point.tiltX) > TILT_THRESHOLD || qAbs(point.tiltY) > TILT_THRESHOLD) {
                width *= 1.0 + (qAbs(point.tiltX) + qAbs(point.tiltY)) / 180.0;
            }
            return width;
        }
        case ToolType::Marker:
            return pressureWidth(size, point.pressure) * MARKER_WIDTH_FACTOR;
        case ToolType::Highlighter:
            return size * HIGHLIGHTER_WIDTH_FACTOR;
        case ToolType::Eraser:
            return size * ERASER_WIDTH_FACTOR;
    }
    return size;
}

QPainter::CompositionMode StrokeRenderer::compositionMode(ToolType tool)
{
    switch (tool) {
        case ToolType::Highlighter:
            return QPainter::CompositionMode_Multiply;
        case ToolType::Eraser:
            return QPainter::CompositionMode_DestinationOut;
        case ToolType::Pen:
        case ToolType::Marker:
            break;
    }
    return QPainter::CompositionMode_SourceOver;
}

qreal StrokeRenderer::toolAlpha(ToolType tool)
{
    switch (tool) {
        case ToolType::Marker:      return MARKER_ALPHA;
        case ToolType::Highlighter: return HIGHLIGHTER_ALPHA;
        case ToolType::Pen:
        case ToolType::Eraser:
            break;
    }
    return 1.0;
}

QColor StrokeRenderer::parseColor(const QString& color, bool* ok)
{
    if (ok) {
        *ok = true;
    }
    const QString trimmed = color.trimmed();

    // QColor understands #rgb, #rrggbb, #aarrggbb and SVG names but not rgb()
    static const QRegularExpression rgbPattern(
        QStringLiteral("^rgba?\\(\\s*(\\d{1,3})\\s*,\\s*(\\d{1,3})\\s*,\\s*(\\d{1,3})\\s*(?:,\\s*([0-9.]+)\\s*)?\\)$"),
        QRegularExpression::CaseInsensitiveOption);

    QRegularExpressionMatch match = rgbPattern.match(trimmed);
    if (match.hasMatch()) {
        QColor result(qBound(0, match.captured(1).toInt(), 255),
                      qBound(0, match.captured(2).toInt(), 255),
                      qBound(0, match.captured(3).toInt(), 255));
        if (!match.captured(4).isEmpty()) {
            result.setAlphaF(qBound(0.0, match.captured(4).toDouble(), 1.0));
        }
        return result;
    }

    QColor result(trimmed);
    if (!result.isValid()) {
        if (ok) {
            *ok = false;
        }
        qWarning() << "StrokeRenderer: unparsable color" << color << "- using black";
        return QColor(Qt::black);
    }
    return result;
}

QColor StrokeRenderer::inkColor(const InkPath& path)
{
    QColor color = parseColor(path.color);
    color.setAlphaF(color.alphaF() * toolAlpha(path.tool));
    return color;
}

void StrokeRenderer::applyBrush(QPainter& painter, ToolType tool, const QColor& ink, qreal width)
{
    QPen pen(ink, width, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.setCompositionMode(compositionMode(tool));
}

void StrokeRenderer::paintSegment(QPainter& painter, const InkPath& path, int index, const QColor& ink)
{
    if (index < 1 || index >= path.points.size()) {
        return;
    }

    const InkPoint& a = path.points[index - 1];
    const InkPoint& b = path.points[index];
    const QPointF start = (index >= 2) ? midpoint(path.points[index - 2].pos, a.pos) : a.pos;
    const QPointF end = midpoint(a.pos, b.pos);

    QPainterPath curve(start);
    curve.quadTo(a.pos, end);

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    applyBrush(painter, path.tool, ink, effectiveWidth(path.tool, path.size, averagePoint(a, b)));
    painter.drawPath(curve);
    painter.restore();
}

void StrokeRenderer::paintTail(QPainter& painter, const InkPath& path, const QColor& ink)
{
    const int n = path.points.size();
    if (n < 2) {
        return;
    }

    const InkPoint& a = path.points[n - 2];
    const InkPoint& b = path.points[n - 1];

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    applyBrush(painter, path.tool, ink, effectiveWidth(path.tool, path.size, averagePoint(a, b)));
    painter.drawLine(midpoint(a.pos, b.pos), b.pos);
    painter.restore();
}

void StrokeRenderer::paintPath(QPainter& painter, const InkPath& path)
{
    if (path.points.size() < 2) {
        return;
    }
    const QColor ink = inkColor(path);
    for (int i = 1; i < path.points.size(); ++i) {
        paintSegment(painter, path, i, ink);
    }
    paintTail(painter, path, ink);
}

void StrokeRenderer::replay(QImage& image, const QVector<InkPath>& paths)
{
    image.fill(Qt::transparent);
    if (paths.isEmpty()) {
        return;
    }

    QPainter painter(&image);
    for (const auto& path : paths) {
        paintPath(painter, path);
    }
}
