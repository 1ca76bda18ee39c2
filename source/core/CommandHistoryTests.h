#ifndef COMMANDHISTORYTESTS_H
#define COMMANDHISTORYTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "CommandHistory.h"

/**
 * Unit tests for CommandHistory.
 * Run with: examink --test-history
 */
class CommandHistoryTests : public QObject {
    Q_OBJECT

private:
    static CanvasLine makeLine(const QString& id, qreal x = 0) {
        CanvasLine line;
        line.id = id;
        line.color = Qt::black;
        line.points = {QPointF(x, 0), QPointF(x + 10, 10)};
        return line;
    }

    static TextAnnotation makeText(const QString& id) {
        TextAnnotation text = TextAnnotation::fromDrag(QPointF(0, 0), QPointF(200, 80));
        text.id = id;
        text.text = "answer";
        return text;
    }

private slots:
    void testCommitAppendsAtTail() {
        CommandHistory history;
        history.commit(CanvasObject::fromLine(makeLine("a")));
        history.commit(CanvasObject::fromText(makeText("t")));
        history.commit(CanvasObject::fromLine(makeLine("b")));

        QCOMPARE(history.committedCount(), 3);
        QCOMPARE(history.committed().last().id(), QString("b"));
        QCOMPARE(history.lines().size(), 2);
        QCOMPARE(history.textAnnotations().size(), 1);
    }

    void testUndoThenRedoRestoresExactList() {
        CommandHistory history;
        history.commit(CanvasObject::fromLine(makeLine("a", 0)));
        history.commit(CanvasObject::fromLine(makeLine("b", 50)));
        history.commit(CanvasObject::fromText(makeText("t")));
        const QVector<CanvasObject> before = history.committed();

        QVERIFY(history.undo());
        QCOMPARE(history.committedCount(), 2);
        QCOMPARE(history.undoneCount(), 1);

        QVERIFY(history.redo());
        QCOMPARE(history.committed(), before);
        QCOMPARE(history.undoneCount(), 0);
    }

    void testUndoIsLifo() {
        CommandHistory history;
        history.commit(CanvasObject::fromLine(makeLine("a")));
        history.commit(CanvasObject::fromLine(makeLine("b")));

        history.undo();
        history.undo();
        QVERIFY(history.isEmpty());

        history.redo();
        QCOMPARE(history.committed().last().id(), QString("a"));
        history.redo();
        QCOMPARE(history.committed().last().id(), QString("b"));
    }

    void testCommitAfterUndoDiscardsRedo() {
        CommandHistory history;
        history.commit(CanvasObject::fromLine(makeLine("a")));
        history.commit(CanvasObject::fromLine(makeLine("b")));
        history.undo();
        QVERIFY(history.canRedo());

        history.commit(CanvasObject::fromLine(makeLine("c")));
        QVERIFY(!history.canRedo());

        // Redo is now a no-op
        const QVector<CanvasObject> before = history.committed();
        QVERIFY(!history.redo());
        QCOMPARE(history.committed(), before);
    }

    void testEmptyStacksAreNoOps() {
        CommandHistory history;
        QSignalSpy changedSpy(&history, &CommandHistory::historyChanged);

        QVERIFY(!history.undo());
        QVERIFY(!history.redo());
        history.clear();

        QCOMPARE(changedSpy.count(), 0);
        QVERIFY(history.isEmpty());
    }

    void testClearEmptiesBothStacks() {
        CommandHistory history;
        history.commit(CanvasObject::fromLine(makeLine("a")));
        history.commit(CanvasObject::fromLine(makeLine("b")));
        history.undo();

        history.clear();
        QVERIFY(!history.canUndo());
        QVERIFY(!history.canRedo());
        QCOMPARE(history.committedCount(), 0);
    }

    void testAvailabilitySignals() {
        CommandHistory history;
        QSignalSpy undoSpy(&history, &CommandHistory::undoAvailableChanged);
        QSignalSpy redoSpy(&history, &CommandHistory::redoAvailableChanged);
        QSignalSpy clearSpy(&history, &CommandHistory::clearAvailableChanged);

        history.commit(CanvasObject::fromLine(makeLine("a")));
        QCOMPARE(undoSpy.count(), 1);
        QCOMPARE(undoSpy.last().at(0).toBool(), true);
        QCOMPARE(clearSpy.count(), 1);

        // Second commit does not change availability
        history.commit(CanvasObject::fromLine(makeLine("b")));
        QCOMPARE(undoSpy.count(), 1);

        history.undo();
        QCOMPARE(redoSpy.count(), 1);
        QCOMPARE(redoSpy.last().at(0).toBool(), true);

        history.undo();
        QCOMPARE(undoSpy.count(), 2);
        QCOMPARE(undoSpy.last().at(0).toBool(), false);
        QCOMPARE(clearSpy.last().at(0).toBool(), false);
    }

    void testObjectRemovedReportsIds() {
        CommandHistory history;
        history.commit(CanvasObject::fromLine(makeLine("a")));
        history.commit(CanvasObject::fromText(makeText("t")));
        QSignalSpy removedSpy(&history, &CommandHistory::objectRemoved);

        history.undo();
        QCOMPARE(removedSpy.count(), 1);
        QCOMPARE(removedSpy.at(0).at(0).toString(), QString("t"));

        history.clear();
        QCOMPARE(removedSpy.count(), 2);
        QCOMPARE(removedSpy.at(1).at(0).toString(), QString("a"));
    }

    void testRetractLastOnlyDropsMatchingTail() {
        CommandHistory history;
        history.commit(CanvasObject::fromLine(makeLine("a")));
        history.commit(CanvasObject::fromLine(makeLine("dot")));
        QSignalSpy removedSpy(&history, &CommandHistory::objectRemoved);

        QVERIFY(!history.retractLast("a"));
        QVERIFY(!history.retractLast(QString()));
        QCOMPARE(history.committedCount(), 2);

        QVERIFY(history.retractLast("dot"));
        QCOMPARE(history.committedCount(), 1);
        QCOMPARE(history.committed().last().id(), QString("a"));
        QCOMPARE(removedSpy.count(), 1);
        QCOMPARE(removedSpy.at(0).at(0).toString(), QString("dot"));

        // Retracted content is gone for good, not redoable
        QVERIFY(!history.canRedo());
        history.undo();
        history.redo();
        QCOMPARE(history.committedCount(), 1);
    }

    void testResetReplacesContent() {
        CommandHistory history;
        history.commit(CanvasObject::fromLine(makeLine("old")));
        history.commit(CanvasObject::fromLine(makeLine("old2")));
        history.undo();

        history.reset({makeLine("x"), makeLine("y")}, {makeText("t")});
        QCOMPARE(history.committedCount(), 3);
        QVERIFY(!history.canRedo());
        QCOMPARE(history.committed().at(0).id(), QString("x"));
        QCOMPARE(history.committed().at(2).kind, CanvasObject::Text);
    }
};

#endif // COMMANDHISTORYTESTS_H
