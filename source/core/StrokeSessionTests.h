#ifndef STROKESESSIONTESTS_H
#define STROKESESSIONTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "StrokeSession.h"
#include "ToolState.h"
#include "InkTestUtils.h"

using namespace InkTestUtils;

/**
 * Unit tests for the StrokeSession state machine.
 */
class StrokeSessionTests : public QObject {
    Q_OBJECT

private slots:
    void testPressMoveReleaseCommits() {
        ToolState tools(ToolType::Marker, "#ff0000", 3.0);
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy committed(&session, &StrokeSession::strokeCommitted);

        QVERIFY(session.handleSample(sample(PointerSample::Press, QPointF(0, 0), 1000)));
        QVERIFY(session.state() == StrokeSession::State::Drawing);
        session.handleSample(sample(PointerSample::Move, QPointF(5, 0), 1010));
        session.handleSample(sample(PointerSample::Move, QPointF(10, 0), 1020));
        session.handleSample(sample(PointerSample::Release, QPointF(10, 0), 1030));

        QVERIFY(session.state() == StrokeSession::State::Idle);
        QCOMPARE(committed.count(), 1);
        InkPath path = committed.takeFirst().at(0).value<InkPath>();
        QCOMPARE(path.points.size(), 3);   // Release adds no point
        QVERIFY(path.tool == ToolType::Marker);
        QCOMPARE(path.color, QString("#ff0000"));
        QCOMPARE(path.size, 3.0);
    }

    void testTapIsNotCommitted() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy committed(&session, &StrokeSession::strokeCommitted);

        session.handleSample(sample(PointerSample::Press, QPointF(3, 3), 1000));
        session.handleSample(sample(PointerSample::Release, QPointF(3, 3), 1040));

        QCOMPARE(committed.count(), 0);
        QVERIFY(!session.isDrawing());
    }

    void testDisabledSessionIgnoresInput() {
        ToolState tools;
        StrokeSession session(&tools);
        QVERIFY(!session.handleSample(sample(PointerSample::Press, QPointF(0, 0), 1000)));
        QVERIFY(!session.isDrawing());
    }

    void testDoubleTapTogglesEraser() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy toggled(&session, &StrokeSession::toolToggled);
        QSignalSpy started(&session, &StrokeSession::strokeStarted);

        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1000));
        session.handleSample(stylus(PointerSample::Release, QPointF(0, 0), 1020));
        QCOMPARE(started.count(), 1);

        // Second stylus-down 100 ms later: toggle, no stroke
        QVERIFY(session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1100)));
        QCOMPARE(started.count(), 1);
        QCOMPARE(toggled.count(), 1);
        QVERIFY(!session.isDrawing());
        QVERIFY(session.effectiveTool() == ToolType::Eraser);
        QVERIFY(session.state() == StrokeSession::State::EraserToggled);
        QVERIFY(tools.tool() == ToolType::Pen);   // Shared state untouched

        // Next stroke uses the eraser
        QSignalSpy committed(&session, &StrokeSession::strokeCommitted);
        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 2000));
        session.handleSample(stylus(PointerSample::Move, QPointF(8, 8), 2010));
        session.handleSample(stylus(PointerSample::Release, QPointF(8, 8), 2020));
        QCOMPARE(committed.count(), 1);
        QVERIFY(committed.first().at(0).value<InkPath>().tool == ToolType::Eraser);
    }

    void testSlowSecondTapStartsStroke() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy toggled(&session, &StrokeSession::toolToggled);
        QSignalSpy started(&session, &StrokeSession::strokeStarted);

        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1000));
        session.handleSample(stylus(PointerSample::Release, QPointF(0, 0), 1020));
        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1400));

        QCOMPARE(toggled.count(), 0);
        QCOMPARE(started.count(), 2);
        QVERIFY(session.effectiveTool() == ToolType::Pen);
    }

    void testDoubleTapWindowBoundsAreExclusive() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy toggled(&session, &StrokeSession::toolToggled);

        // Exactly 50 ms: too fast, counts as re-contact
        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1000));
        session.handleSample(stylus(PointerSample::Release, QPointF(0, 0), 1010));
        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1050));
        session.handleSample(stylus(PointerSample::Release, QPointF(0, 0), 1060));
        QCOMPARE(toggled.count(), 0);

        // Exactly 300 ms after the previous down: too slow
        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1350));
        session.handleSample(stylus(PointerSample::Release, QPointF(0, 0), 1360));
        QCOMPARE(toggled.count(), 0);
    }

    void testMouseNeverToggles() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy toggled(&session, &StrokeSession::toolToggled);

        session.handleSample(sample(PointerSample::Press, QPointF(0, 0), 1000));
        session.handleSample(sample(PointerSample::Release, QPointF(0, 0), 1010));
        session.handleSample(sample(PointerSample::Press, QPointF(0, 0), 1100));
        QCOMPARE(toggled.count(), 0);
        QVERIFY(session.isDrawing());
    }

    void testToolStateChangeClearsToggle() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);

        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1000));
        session.handleSample(stylus(PointerSample::Release, QPointF(0, 0), 1010));
        session.handleSample(stylus(PointerSample::Press, QPointF(0, 0), 1100));
        QVERIFY(session.effectiveTool() == ToolType::Eraser);

        tools.setTool(ToolType::Highlighter);
        QVERIFY(session.effectiveTool() == ToolType::Highlighter);
    }

    void testChannelLock() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy committed(&session, &StrokeSession::strokeCommitted);

        session.handleSample(finger(PointerSample::Press, QPointF(0, 0), 1000));
        QVERIFY(session.activeChannel() == PointerSample::Touch);

        // Pointer-channel copies of the same interaction are swallowed
        QVERIFY(session.handleSample(sample(PointerSample::Press, QPointF(0, 0), 1000)));
        QVERIFY(session.handleSample(sample(PointerSample::Move, QPointF(99, 99), 1005)));
        QVERIFY(session.handleSample(sample(PointerSample::Release, QPointF(99, 99), 1006)));
        QVERIFY(session.isDrawing());

        session.handleSample(finger(PointerSample::Move, QPointF(5, 5), 1010));
        session.handleSample(finger(PointerSample::Release, QPointF(5, 5), 1020));

        QCOMPARE(committed.count(), 1);
        const InkPath path = committed.first().at(0).value<InkPath>();
        QCOMPARE(path.points.size(), 2);
        QCOMPARE(path.points[1].pos, QPointF(5, 5));
    }

    void testMultiTouchIgnoredWhileDrawing() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy started(&session, &StrokeSession::strokeStarted);
        QSignalSpy cancelled(&session, &StrokeSession::strokeCancelled);

        session.handleSample(finger(PointerSample::Press, QPointF(0, 0), 1000));

        PointerSample twoFingers = finger(PointerSample::Move, QPointF(40, 40), 1010);
        twoFingers.contactCount = 2;
        session.handleSample(twoFingers);

        QVERIFY(session.isDrawing());
        QCOMPARE(session.currentPath().points.size(), 1);
        QCOMPARE(started.count(), 1);
        QCOMPARE(cancelled.count(), 0);
    }

    void testCancelDiscardsStroke() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy committed(&session, &StrokeSession::strokeCommitted);
        QSignalSpy cancelled(&session, &StrokeSession::strokeCancelled);

        session.handleSample(finger(PointerSample::Press, QPointF(0, 0), 1000));
        session.handleSample(finger(PointerSample::Move, QPointF(5, 5), 1010));
        session.handleSample(finger(PointerSample::Cancel, QPointF(5, 5), 1020));

        QCOMPARE(committed.count(), 0);
        QCOMPARE(cancelled.count(), 1);
        QVERIFY(!session.isDrawing());
        QVERIFY(session.currentPath().points.isEmpty());
    }

    void testToolSampledAtStrokeStart() {
        ToolState tools(ToolType::Pen, "#000000", 2.0);
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy committed(&session, &StrokeSession::strokeCommitted);

        session.handleSample(sample(PointerSample::Press, QPointF(0, 0), 1000));
        tools.setTool(ToolType::Highlighter);
        tools.setColor("#00ff00");
        tools.setSize(9.0);
        session.handleSample(sample(PointerSample::Move, QPointF(5, 5), 1010));
        session.handleSample(sample(PointerSample::Release, QPointF(5, 5), 1020));

        const InkPath path = committed.first().at(0).value<InkPath>();
        QVERIFY(path.tool == ToolType::Pen);
        QCOMPARE(path.color, QString("#000000"));
        QCOMPARE(path.size, 2.0);
    }

    void testDisablingCancelsStroke() {
        ToolState tools;
        StrokeSession session(&tools);
        session.setEnabled(true);
        QSignalSpy cancelled(&session, &StrokeSession::strokeCancelled);

        session.handleSample(sample(PointerSample::Press, QPointF(0, 0), 1000));
        session.setEnabled(false);

        QCOMPARE(cancelled.count(), 1);
        QVERIFY(!session.isDrawing());
    }
};

inline int runStrokeSessionTests() {
    StrokeSessionTests tests;
    return QTest::qExec(&tests);
}

#endif // STROKESESSIONTESTS_H
