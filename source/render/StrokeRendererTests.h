#ifndef STROKERENDERERTESTS_H
#define STROKERENDERERTESTS_H

#include <QObject>
#include <QTest>
#include "StrokeRenderer.h"
#include "InkCanvas.h"
#include "../core/InkTestUtils.h"

/**
 * Unit tests for StrokeRenderer width/compositing rules and InkCanvas painting.
 */
class StrokeRendererTests : public QObject {
    Q_OBJECT

private:
    static InkPoint pointWith(qreal pressure, qreal tiltX = 0, qreal tiltY = 0) {
        InkPoint pt;
        pt.pressure = pressure;
        pt.tiltX = tiltX;
        pt.tiltY = tiltY;
        return pt;
    }

    static QImage blankImage() {
        QImage image(120, 80, QImage::Format_ARGB32_Premultiplied);
        image.fill(Qt::transparent);
        return image;
    }

private slots:
    void testPressureFloorKeepsPenVisible() {
        const qreal width = StrokeRenderer::effectiveWidth(ToolType::Pen, 10.0, pointWith(0.0));
        QVERIFY(width > 0.0);
        QCOMPARE(width, 1.0);   // 0.1 x size
    }

    void testFullPressureWidth() {
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Pen, 10.0, pointWith(1.0)), 19.0);
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Pen, 10.0, pointWith(0.5)), 10.0);
    }

    void testPenTiltScaling() {
        // 15 degrees is not "exceeding" the threshold
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Pen, 10.0, pointWith(0.5, 15, 15)), 10.0);

        // 30 + 15 degrees: x (1 + 45/180)
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Pen, 10.0, pointWith(0.5, -30, 15)), 12.5);

        // Tilt does not affect the marker
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Marker, 10.0, pointWith(0.5, 60, 60)), 25.0);
    }

    void testToolWidths() {
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Marker, 4.0, pointWith(1.0)), 4.0 * 1.9 * 2.5);
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Highlighter, 4.0, pointWith(0.0)), 20.0);
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Highlighter, 4.0, pointWith(1.0)), 20.0);
        QCOMPARE(StrokeRenderer::effectiveWidth(ToolType::Eraser, 4.0, pointWith(0.3)), 16.0);
    }

    void testCompositionAndAlpha() {
        QVERIFY(StrokeRenderer::compositionMode(ToolType::Pen) == QPainter::CompositionMode_SourceOver);
        QVERIFY(StrokeRenderer::compositionMode(ToolType::Marker) == QPainter::CompositionMode_SourceOver);
        QVERIFY(StrokeRenderer::compositionMode(ToolType::Highlighter) == QPainter::CompositionMode_Multiply);
        QVERIFY(StrokeRenderer::compositionMode(ToolType::Eraser) == QPainter::CompositionMode_DestinationOut);

        QCOMPARE(StrokeRenderer::toolAlpha(ToolType::Pen), 1.0);
        QCOMPARE(StrokeRenderer::toolAlpha(ToolType::Marker), 0.7);
        QCOMPARE(StrokeRenderer::toolAlpha(ToolType::Highlighter), 0.25);
        QCOMPARE(StrokeRenderer::toolAlpha(ToolType::Eraser), 1.0);
    }

    void testParseColor() {
        QCOMPARE(StrokeRenderer::parseColor("#ff0000"), QColor(255, 0, 0));
        QCOMPARE(StrokeRenderer::parseColor("rgb(0, 128, 255)"), QColor(0, 128, 255));

        QColor translucent = StrokeRenderer::parseColor("rgba(10,20,30,0.5)");
        QCOMPARE(translucent.red(), 10);
        QVERIFY(qAbs(translucent.alphaF() - 0.5) < 0.01);

        QCOMPARE(StrokeRenderer::parseColor("definitely not a color"), QColor(Qt::black));
    }

    void testReplayIsIdempotent() {
        QVector<InkPath> paths;
        paths.append(InkTestUtils::line(QPointF(10, 10), QPointF(110, 70), 9, ToolType::Pen, "#3050c0", 3));
        paths.append(InkTestUtils::line(QPointF(10, 70), QPointF(110, 10), 6, ToolType::Marker, "#e04000", 2));
        paths.append(InkTestUtils::line(QPointF(60, 0), QPointF(60, 80), 4, ToolType::Eraser, "#000", 2));

        QImage image = blankImage();
        StrokeRenderer::replay(image, paths);
        const QImage first = image.copy();

        StrokeRenderer::replay(image, paths);
        QCOMPARE(image, first);
        QVERIFY(first != blankImage());
    }

    void testEraserSubtracts() {
        QVector<InkPath> paths;
        paths.append(InkTestUtils::line(QPointF(0, 40), QPointF(120, 40), 13, ToolType::Pen, "#000000", 10));

        QImage image = blankImage();
        StrokeRenderer::replay(image, paths);
        QVERIFY(qAlpha(image.pixel(60, 40)) > 0);

        paths.append(InkTestUtils::line(QPointF(60, 0), QPointF(60, 80), 9, ToolType::Eraser, "#000000", 5));
        StrokeRenderer::replay(image, paths);
        QCOMPARE(qAlpha(image.pixel(60, 40)), 0);
        QVERIFY(qAlpha(image.pixel(20, 40)) > 0);
    }

    void testSinglePointPathPaintsNothing() {
        QVector<InkPath> paths;
        paths.append(InkTestUtils::line(QPointF(50, 50), QPointF(50, 50), 1, ToolType::Pen, "#000", 20));

        QImage image = blankImage();
        StrokeRenderer::replay(image, paths);
        QCOMPARE(image, blankImage());
    }

    void testIncrementalMatchesReplay() {
        const InkPath path = InkTestUtils::line(QPointF(5, 5), QPointF(115, 75), 12, ToolType::Pen, "#108020", 3);

        // Live: points arrive a few at a time, then the stroke is finished
        InkCanvas live;
        live.resize(QSize(120, 80));
        InkPath growing = path;
        growing.points.clear();
        for (int i = 0; i < path.points.size(); ++i) {
            growing.points.append(path.points[i]);
            if (i % 3 == 2) {
                live.paintIncremental(growing);
            }
        }
        live.finishLive(growing);

        InkCanvas replayed;
        replayed.resize(QSize(120, 80));
        replayed.replay(QVector<InkPath>{ path }, nullptr);

        QCOMPARE(live.image(), replayed.image());
    }

    void testUnparsableColorWarnsOncePerPath() {
        static int colorWarnings = 0;
        colorWarnings = 0;
        QtMessageHandler previous = qInstallMessageHandler(
            [](QtMsgType type, const QMessageLogContext&, const QString& message) {
                if (type == QtWarningMsg && message.contains(QLatin1String("unparsable color"))) {
                    ++colorWarnings;
                }
            });

        InkPath path = InkTestUtils::line(QPointF(0, 10), QPointF(110, 70), 40);
        path.color = QStringLiteral("not-a-color");

        QImage image = blankImage();
        StrokeRenderer::replay(image, QVector<InkPath>{ path });
        const int afterReplay = colorWarnings;

        InkCanvas canvas;
        canvas.resize(QSize(120, 80));
        InkPath growing = path;
        growing.points.clear();
        for (const InkPoint& pt : path.points) {
            growing.points.append(pt);
            canvas.paintIncremental(growing);
        }
        canvas.finishLive(growing);

        qInstallMessageHandler(previous);
        QCOMPARE(afterReplay, 1);
        QCOMPARE(colorWarnings, 2);
    }

    void testCanvasResizeReportsReallocation() {
        InkCanvas canvas;
        QVERIFY(canvas.resize(QSize(100, 50), 2.0));
        QCOMPARE(canvas.image().size(), QSize(200, 100));
        QCOMPARE(canvas.image().devicePixelRatio(), 2.0);
        QVERIFY(!canvas.resize(QSize(100, 50), 2.0));
        QVERIFY(canvas.resize(QSize(100, 60), 2.0));
    }
};

inline int runStrokeRendererTests() {
    StrokeRendererTests tests;
    return QTest::qExec(&tests);
}

#endif // STROKERENDERERTESTS_H
