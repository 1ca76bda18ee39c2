#ifndef INPUTDISPATCHERTESTS_H
#define INPUTDISPATCHERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <limits>
#include "InputDispatcher.h"
#include "../core/GestureStateMachine.h"
#include "../strokes/StrokeBuilder.h"

/**
 * Unit tests for InputDispatcher touch classification and routing.
 * Run with: examink --test-dispatcher
 */
class InputDispatcherTests : public QObject {
    Q_OBJECT

private:
    struct Fixture {
        GestureStateMachine gestures;
        StrokeBuilder builder;
        InputDispatcher dispatcher;

        explicit Fixture(ToolType tool = ToolType::Pencil)
            : dispatcher(&gestures, &builder)
        {
            gestures.setViewportSize(QSizeF(800, 600));
            ToolStyle style;
            style.tool = tool;
            style.color = Qt::black;
            style.thickness = 4;
            dispatcher.setStyle(style);
        }

        bool touch(TouchSample::Phase phase, const QPointF& pos, int fingers = 1,
                   qint64 t = 0, qreal spread = 0) {
            return dispatcher.handleTouch(TouchSample::make(phase, pos, fingers, t, spread));
        }
    };

private slots:
    void initTestCase() {
        qRegisterMetaType<CanvasLine>("CanvasLine");
        qRegisterMetaType<QPainterPath>("QPainterPath");
    }

    // ===== Freehand routing =====

    void testFreehandStrokeFinished() {
        Fixture f;
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);

        QVERIFY(f.touch(TouchSample::Start, QPointF(10, 10)));
        QCOMPARE(f.gestures.state(), GestureState::Drawing);
        f.touch(TouchSample::Move, QPointF(20, 20));
        f.touch(TouchSample::Move, QPointF(30, 30));
        QVERIFY(f.touch(TouchSample::End, QPointF(40, 40), 0));

        QCOMPARE(lineSpy.count(), 1);
        const CanvasLine line = lineSpy.at(0).at(0).value<CanvasLine>();
        QCOMPARE(line.points.size(), 4);
        QCOMPARE(line.points.first(), QPointF(10, 10));
        QCOMPARE(line.points.last(), QPointF(40, 40));
        QCOMPARE(f.gestures.state(), GestureState::Idle);
        QVERIFY(!f.dispatcher.isEpisodeActive());
    }

    void testPointsUseInverseTransform() {
        Fixture f;
        f.gestures.setTransform(2.0, QPointF(-100, -100));

        f.touch(TouchSample::Start, QPointF(100, 100));
        QCOMPARE(f.builder.freehandDraft().points.first(), QPointF(100, 100));
        f.touch(TouchSample::Move, QPointF(300, 100));
        QCOMPARE(f.builder.freehandDraft().points.last(), QPointF(200, 100));
    }

    void testTapWithInkToolMakesDot() {
        Fixture f;
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);

        f.touch(TouchSample::Start, QPointF(50, 50));
        f.touch(TouchSample::End, QPointF(50, 50), 0);
        QCOMPARE(lineSpy.count(), 1);
        QCOMPARE(lineSpy.at(0).at(0).value<CanvasLine>().points.size(), 1);
    }

    // ===== Multi-touch =====

    void testTwoFingerStartCancelsStroke() {
        Fixture f;
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);
        QSignalSpy cancelSpy(&f.dispatcher, &InputDispatcher::draftCancelled);

        f.touch(TouchSample::Start, QPointF(100, 100));
        f.touch(TouchSample::Move, QPointF(120, 110));
        QVERIFY(f.builder.hasFreehandDraft());

        f.touch(TouchSample::Move, QPointF(150, 150), 2, 0, 80);
        QCOMPARE(cancelSpy.count(), 1);
        QVERIFY(!f.builder.hasFreehandDraft());
        QVERIFY(f.dispatcher.isMultiTouchEpisode());
        QCOMPARE(f.gestures.state(), GestureState::Panning);

        f.touch(TouchSample::End, QPointF(150, 150), 0);
        QCOMPARE(lineSpy.count(), 0);
    }

    void testInkStaysGatedAfterFingerLift() {
        Fixture f;
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);

        f.touch(TouchSample::Start, QPointF(100, 100), 2, 0, 100);
        f.touch(TouchSample::Move, QPointF(110, 100), 2, 0, 100);
        QCOMPARE(f.gestures.pan(), QPointF(10, 0));

        // One finger lifted: still the same multi-touch episode
        QVERIFY(f.touch(TouchSample::Move, QPointF(300, 300), 1));
        f.touch(TouchSample::Move, QPointF(320, 300), 1);
        QVERIFY(!f.builder.hasFreehandDraft());
        QCOMPARE(f.gestures.pan(), QPointF(10, 0));

        f.touch(TouchSample::End, QPointF(320, 300), 0);
        QCOMPARE(lineSpy.count(), 0);
    }

    void testThirdFingerDoesNotJumpView() {
        Fixture f;
        f.touch(TouchSample::Start, QPointF(100, 100), 2, 0, 100);
        f.touch(TouchSample::Move, QPointF(110, 100), 2, 0, 100);
        QCOMPARE(f.gestures.pan(), QPointF(10, 0));

        // Third finger: centroid and spread jump, the view stays
        f.touch(TouchSample::Move, QPointF(200, 150), 3, 0, 60);
        QCOMPARE(f.gestures.pan(), QPointF(10, 0));
        QCOMPARE(f.gestures.zoom(), 1.0);

        f.touch(TouchSample::Move, QPointF(205, 150), 3, 0, 60);
        QCOMPARE(f.gestures.pan(), QPointF(15, 0));

        // Back to two fingers
        f.touch(TouchSample::Move, QPointF(130, 100), 2, 0, 100);
        QCOMPARE(f.gestures.pan(), QPointF(15, 0));
        QCOMPARE(f.gestures.zoom(), 1.0);

        f.touch(TouchSample::End, QPointF(130, 100), 0);
        QCOMPARE(f.gestures.state(), GestureState::Idle);
    }

    void testRegrippingDoesNotJumpView() {
        Fixture f;
        f.touch(TouchSample::Start, QPointF(100, 100), 2, 0, 100);
        f.touch(TouchSample::Move, QPointF(120, 100), 2, 0, 100);
        QCOMPARE(f.gestures.pan(), QPointF(20, 0));

        // Lift one finger and put it down somewhere else
        f.touch(TouchSample::Move, QPointF(300, 300), 1);
        f.touch(TouchSample::Move, QPointF(400, 400), 2, 0, 50);
        QCOMPARE(f.gestures.pan(), QPointF(20, 0));
        QCOMPARE(f.gestures.zoom(), 1.0);

        f.touch(TouchSample::Move, QPointF(410, 400), 2, 0, 50);
        QCOMPARE(f.gestures.pan(), QPointF(30, 0));
        QCOMPARE(f.gestures.zoom(), 1.0);
        QCOMPARE(f.gestures.state(), GestureState::Panning);
    }

    void testPinchZoomThroughDispatcher() {
        Fixture f;
        f.touch(TouchSample::Start, QPointF(400, 300), 2, 0, 100);
        f.touch(TouchSample::Move, QPointF(400, 300), 2, 0, 200);
        QCOMPARE(f.gestures.zoom(), 2.0);
        QCOMPARE(f.gestures.state(), GestureState::Zooming);
        f.touch(TouchSample::End, QPointF(400, 300), 0);
        QCOMPARE(f.gestures.state(), GestureState::Idle);
    }

    // ===== Pan tool =====

    void testPanToolNeverInks() {
        Fixture f(ToolType::Pan);
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);

        f.touch(TouchSample::Start, QPointF(100, 100));
        f.touch(TouchSample::Move, QPointF(103, 100));
        QCOMPARE(f.gestures.pan(), QPointF(0, 0));
        QVERIFY(!f.builder.hasFreehandDraft());

        f.touch(TouchSample::Move, QPointF(130, 120));
        QCOMPARE(f.gestures.pan(), QPointF(30, 20));

        f.touch(TouchSample::End, QPointF(130, 120), 0);
        QCOMPARE(lineSpy.count(), 0);
    }

    void testToolCapturedAtStart() {
        Fixture f(ToolType::Pencil);
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);

        f.touch(TouchSample::Start, QPointF(0, 0));
        ToolStyle changed = f.dispatcher.style();
        changed.tool = ToolType::Rectangle;
        f.dispatcher.setStyle(changed);
        QCOMPARE(f.dispatcher.capturedTool(), ToolType::Pencil);

        f.touch(TouchSample::Move, QPointF(50, 50));
        f.touch(TouchSample::End, QPointF(60, 60), 0);

        QCOMPARE(lineSpy.count(), 1);
        const CanvasLine line = lineSpy.at(0).at(0).value<CanvasLine>();
        QCOMPARE(line.tool, ToolType::Pencil);
        QVERIFY(!line.isShape());

        // The next episode picks up the new tool
        f.touch(TouchSample::Start, QPointF(0, 0));
        QCOMPARE(f.dispatcher.capturedTool(), ToolType::Rectangle);
        QVERIFY(f.builder.hasShapeDraft());
    }

    // ===== Sample validation =====

    void testInvalidSamplesDropped() {
        Fixture f;
        const qreal nan = std::numeric_limits<qreal>::quiet_NaN();
        const qreal inf = std::numeric_limits<qreal>::infinity();

        QVERIFY(!f.touch(TouchSample::Start, QPointF(nan, 10)));
        QVERIFY(!f.dispatcher.isEpisodeActive());

        f.touch(TouchSample::Start, QPointF(10, 10));
        QVERIFY(!f.touch(TouchSample::Move, QPointF(inf, 10)));
        QVERIFY(!f.touch(TouchSample::Move, QPointF(20, 20), 2, 0, nan));
        QVERIFY(!f.touch(TouchSample::Move, QPointF(20, 20), -1));
        QCOMPARE(f.builder.freehandDraft().points.size(), 1);
        QVERIFY(!f.dispatcher.isMultiTouchEpisode());
    }

    void testStaleSamplesIgnored() {
        Fixture f;
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);

        QVERIFY(!f.touch(TouchSample::Move, QPointF(10, 10)));
        QVERIFY(!f.touch(TouchSample::End, QPointF(10, 10), 0));
        QVERIFY(!f.touch(TouchSample::Cancel, QPointF(10, 10), 0));
        QVERIFY(!f.builder.hasFreehandDraft());
        QCOMPARE(lineSpy.count(), 0);
    }

    void testCancelDiscardsAndEndsEpisode() {
        Fixture f;
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);
        QSignalSpy cancelSpy(&f.dispatcher, &InputDispatcher::draftCancelled);

        f.touch(TouchSample::Start, QPointF(10, 10));
        f.touch(TouchSample::Move, QPointF(30, 30));
        QVERIFY(f.touch(TouchSample::Cancel, QPointF(30, 30), 0));
        QCOMPARE(cancelSpy.count(), 1);

        // Late samples of the cancelled episode do nothing
        QVERIFY(!f.touch(TouchSample::Move, QPointF(40, 40)));
        QVERIFY(!f.touch(TouchSample::End, QPointF(40, 40), 0));
        QCOMPARE(lineSpy.count(), 0);
    }

    void testCancelEpisodeFromHost() {
        Fixture f;
        f.touch(TouchSample::Start, QPointF(10, 10));
        QVERIFY(f.dispatcher.cancelEpisode());
        QVERIFY(!f.builder.hasFreehandDraft());
        QVERIFY(!f.touch(TouchSample::Move, QPointF(40, 40)));
        QVERIFY(!f.dispatcher.cancelEpisode());
    }

    // ===== Shapes and text =====

    void testShapeGesture() {
        Fixture f(ToolType::Rectangle);
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);

        f.touch(TouchSample::Start, QPointF(0, 0));
        QCOMPARE(f.gestures.state(), GestureState::ShapeDraft);
        f.touch(TouchSample::Move, QPointF(25, 25));
        QCOMPARE(f.builder.shapePreview().current, QPointF(25, 25));
        f.touch(TouchSample::End, QPointF(50, 40), 0);

        QCOMPARE(lineSpy.count(), 1);
        const CanvasLine line = lineSpy.at(0).at(0).value<CanvasLine>();
        QCOMPARE(line.shapeKind, ShapeKind::Rectangle);
        QCOMPARE(line.bounds, (LineBounds{0, 0, 50, 40}));
    }

    void testSmallShapeReportsCancel() {
        Fixture f(ToolType::Ellipse);
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);
        QSignalSpy cancelSpy(&f.dispatcher, &InputDispatcher::draftCancelled);

        f.touch(TouchSample::Start, QPointF(0, 0));
        f.touch(TouchSample::End, QPointF(2, 2), 0);
        QCOMPARE(lineSpy.count(), 0);
        QCOMPARE(cancelSpy.count(), 1);
    }

    void testTextDragRequestsInput() {
        Fixture f(ToolType::Text);
        QSignalSpy textSpy(&f.dispatcher, &InputDispatcher::textInputRequested);

        f.touch(TouchSample::Start, QPointF(10, 10));
        QCOMPARE(f.gestures.state(), GestureState::TextDraft);
        f.touch(TouchSample::Move, QPointF(100, 50));
        f.touch(TouchSample::End, QPointF(200, 100), 0);

        QCOMPARE(textSpy.count(), 1);
        QCOMPARE(textSpy.at(0).at(0).toRectF(), QRectF(10, 10, 190, 90));
        QVERIFY(f.builder.isAwaitingText());
    }

    void testNewGestureDiscardsPendingText() {
        Fixture f(ToolType::Text);
        QSignalSpy cancelSpy(&f.dispatcher, &InputDispatcher::draftCancelled);

        f.touch(TouchSample::Start, QPointF(10, 10));
        f.touch(TouchSample::End, QPointF(200, 100), 0);
        QVERIFY(f.builder.isAwaitingText());

        f.touch(TouchSample::Start, QPointF(300, 300));
        QCOMPARE(cancelSpy.count(), 1);
        // The new episode starts a fresh text draft
        QVERIFY(f.builder.hasTextDraft());
        QVERIFY(!f.builder.isAwaitingText());
    }

    // ===== Double tap =====

    void testDoubleTapResetsView() {
        Fixture f(ToolType::Pan);
        f.gestures.setTransform(3.0, QPointF(-500, -500));
        QSignalSpy tapSpy(&f.dispatcher, &InputDispatcher::doubleTapRecognized);

        f.touch(TouchSample::Start, QPointF(200, 200), 1, 1000);
        f.touch(TouchSample::End, QPointF(201, 200), 0, 1100);
        f.touch(TouchSample::Start, QPointF(205, 202), 1, 1250);
        f.touch(TouchSample::End, QPointF(205, 202), 0, 1320);

        QCOMPARE(tapSpy.count(), 1);
        f.gestures.finishAnimation();
        QCOMPARE(f.gestures.zoom(), 1.0);
        QCOMPARE(f.gestures.pan(), QPointF(0, 0));
    }

    void testSlowOrDistantTapsIgnored() {
        Fixture f(ToolType::Pan);
        QSignalSpy tapSpy(&f.dispatcher, &InputDispatcher::doubleTapRecognized);

        // Too far apart in time
        f.touch(TouchSample::Start, QPointF(200, 200), 1, 0);
        f.touch(TouchSample::End, QPointF(200, 200), 0, 100);
        f.touch(TouchSample::Start, QPointF(200, 200), 1, 900);
        f.touch(TouchSample::End, QPointF(200, 200), 0, 950);

        // Too far apart in space
        f.touch(TouchSample::Start, QPointF(400, 400), 1, 1100);
        f.touch(TouchSample::End, QPointF(400, 400), 0, 1150);

        // Held too long
        f.touch(TouchSample::Start, QPointF(400, 400), 1, 1200);
        f.touch(TouchSample::End, QPointF(400, 400), 0, 1600);

        QCOMPARE(tapSpy.count(), 0);
    }

    void testPencilDoubleTapResetsView() {
        Fixture f(ToolType::Pencil);
        f.gestures.setTransform(3.0, QPointF(-500, -500));
        QSignalSpy tapSpy(&f.dispatcher, &InputDispatcher::doubleTapRecognized);
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);
        QSignalSpy cancelSpy(&f.dispatcher, &InputDispatcher::draftCancelled);

        f.touch(TouchSample::Start, QPointF(200, 200), 1, 0);
        f.touch(TouchSample::End, QPointF(200, 200), 0, 50);
        QCOMPARE(lineSpy.count(), 1);
        const QString dotId = lineSpy.at(0).at(0).value<CanvasLine>().id;

        // Second tap: its own dot is discarded and the first one is named for retraction
        f.touch(TouchSample::Start, QPointF(202, 201), 1, 100);
        f.touch(TouchSample::End, QPointF(202, 201), 0, 150);
        QCOMPARE(lineSpy.count(), 1);
        QCOMPARE(cancelSpy.count(), 1);
        QCOMPARE(tapSpy.count(), 1);
        QCOMPARE(tapSpy.at(0).at(0).toString(), dotId);
        QVERIFY(!f.builder.hasFreehandDraft());

        f.gestures.finishAnimation();
        QCOMPARE(f.gestures.zoom(), 1.0);
        QCOMPARE(f.gestures.pan(), QPointF(0, 0));

        // A third quick tap starts over and draws a dot
        f.touch(TouchSample::Start, QPointF(200, 200), 1, 200);
        f.touch(TouchSample::End, QPointF(200, 200), 0, 250);
        QCOMPARE(tapSpy.count(), 1);
        QCOMPARE(lineSpy.count(), 2);
    }

    void testShapeDoubleTapHasNothingToRetract() {
        Fixture f(ToolType::Rectangle);
        f.gestures.setTransform(2.0, QPointF(-100, -100));
        QSignalSpy tapSpy(&f.dispatcher, &InputDispatcher::doubleTapRecognized);
        QSignalSpy lineSpy(&f.dispatcher, &InputDispatcher::lineFinished);

        f.touch(TouchSample::Start, QPointF(300, 300), 1, 0);
        f.touch(TouchSample::End, QPointF(300, 300), 0, 60);
        f.touch(TouchSample::Start, QPointF(300, 300), 1, 120);
        f.touch(TouchSample::End, QPointF(300, 300), 0, 180);

        QCOMPARE(lineSpy.count(), 0);
        QCOMPARE(tapSpy.count(), 1);
        QVERIFY(tapSpy.at(0).at(0).toString().isEmpty());
        QVERIFY(!f.builder.hasShapeDraft());
        f.gestures.finishAnimation();
        QCOMPARE(f.gestures.zoom(), 1.0);
    }

    void testStartInterruptsAnimation() {
        Fixture f(ToolType::Pan);
        f.gestures.setTransform(3.0, QPointF(-500, -500));
        f.gestures.resetView();
        QVERIFY(f.gestures.isAnimating());

        f.touch(TouchSample::Start, QPointF(100, 100));
        QVERIFY(!f.gestures.isAnimating());
    }
};

#endif // INPUTDISPATCHERTESTS_H
