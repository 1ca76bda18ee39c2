#pragma once

// ============================================================================
// CommandHistory - Committed drawing objects plus the undone stack
// ============================================================================
// Part of the ExamInk drawing engine
//
// Every stroke, shape and text box is one undo step. The committed list only
// grows at its tail; undo moves the tail onto the undone stack and redo moves
// it back. Any new commit clears the undone stack.
// ============================================================================

#include "../strokes/CanvasLine.h"
#include "../strokes/TextAnnotation.h"

#include <QObject>
#include <QStack>
#include <QVector>

/**
 * @brief One committed entry: a line (stroke or shape) or a text annotation.
 */
struct CanvasObject {
    enum Kind {
        Line,
        Text
    };

    Kind kind = Line;
    CanvasLine line;            ///< Valid when kind == Line
    TextAnnotation text;        ///< Valid when kind == Text

    static CanvasObject fromLine(const CanvasLine& l) {
        CanvasObject obj;
        obj.kind = Line;
        obj.line = l;
        return obj;
    }

    static CanvasObject fromText(const TextAnnotation& t) {
        CanvasObject obj;
        obj.kind = Text;
        obj.text = t;
        return obj;
    }

    QString id() const { return kind == Line ? line.id : text.id; }

    bool operator==(const CanvasObject& other) const {
        if (kind != other.kind) {
            return false;
        }
        return kind == Line ? line == other.line : text == other.text;
    }
    bool operator!=(const CanvasObject& other) const { return !(*this == other); }
};

/**
 * @brief Session-scoped undo/redo history of committed objects.
 */
class CommandHistory : public QObject
{
    Q_OBJECT

public:
    explicit CommandHistory(QObject* parent = nullptr);

    /**
     * @brief Append an object to the committed list and clear the undone stack.
     */
    void commit(const CanvasObject& object);

    /**
     * @brief Move the last committed object onto the undone stack.
     * @return False if there was nothing to undo.
     */
    bool undo();

    /**
     * @brief Move the top of the undone stack back to the committed list.
     * @return False if there was nothing to redo.
     */
    bool redo();

    /**
     * @brief Empty both the committed list and the undone stack.
     */
    void clear();

    /**
     * @brief Drop the last committed object if its id matches, without
     *        putting it on the undone stack.
     * @return False if the tail has a different id (or nothing is committed).
     */
    bool retractLast(const QString& id);

    /**
     * @brief Replace the committed content and drop the undone stack.
     *
     * Used for initial content; lines come before text annotations.
     */
    void reset(const QVector<CanvasLine>& lines, const QVector<TextAnnotation>& texts);

    bool canUndo() const { return !m_committed.isEmpty(); }
    bool canRedo() const { return !m_undone.isEmpty(); }
    bool isEmpty() const { return m_committed.isEmpty(); }

    const QVector<CanvasObject>& committed() const { return m_committed; }
    int committedCount() const { return m_committed.size(); }
    int undoneCount() const { return m_undone.size(); }

    /**
     * @brief Committed lines in commit order.
     */
    QVector<CanvasLine> lines() const;

    /**
     * @brief Committed text annotations in commit order.
     */
    QVector<TextAnnotation> textAnnotations() const;

signals:
    /**
     * @brief Emitted whenever the committed list changes.
     */
    void historyChanged();

    void undoAvailableChanged(bool available);
    void redoAvailableChanged(bool available);
    void clearAvailableChanged(bool available);

    /**
     * @brief Emitted with the id of an object that left the committed list.
     */
    void objectRemoved(const QString& id);

private:
    void emitAvailability(bool hadUndo, bool hadRedo);

    QVector<CanvasObject> m_committed;
    QStack<CanvasObject> m_undone;
};
