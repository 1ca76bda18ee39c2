#include "CommandHistory.h"

CommandHistory::CommandHistory(QObject* parent)
    : QObject(parent)
{
}

void CommandHistory::commit(const CanvasObject& object)
{
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();

    m_committed.append(object);
    m_undone.clear();

    emit historyChanged();
    emitAvailability(hadUndo, hadRedo);
}

bool CommandHistory::undo()
{
    if (m_committed.isEmpty()) {
        return false;
    }
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();

    const CanvasObject object = m_committed.takeLast();
    m_undone.push(object);

    emit objectRemoved(object.id());
    emit historyChanged();
    emitAvailability(hadUndo, hadRedo);
    return true;
}

bool CommandHistory::redo()
{
    if (m_undone.isEmpty()) {
        return false;
    }
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();

    m_committed.append(m_undone.pop());

    emit historyChanged();
    emitAvailability(hadUndo, hadRedo);
    return true;
}

void CommandHistory::clear()
{
    if (m_committed.isEmpty() && m_undone.isEmpty()) {
        return;
    }
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();

    const QVector<CanvasObject> removed = m_committed;
    m_committed.clear();
    m_undone.clear();

    for (const CanvasObject& object : removed) {
        emit objectRemoved(object.id());
    }
    emit historyChanged();
    emitAvailability(hadUndo, hadRedo);
}

bool CommandHistory::retractLast(const QString& id)
{
    if (m_committed.isEmpty() || id.isEmpty() || m_committed.last().id() != id) {
        return false;
    }
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();

    m_committed.removeLast();

    emit objectRemoved(id);
    emit historyChanged();
    emitAvailability(hadUndo, hadRedo);
    return true;
}

void CommandHistory::reset(const QVector<CanvasLine>& lines, const QVector<TextAnnotation>& texts)
{
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();

    for (const CanvasObject& object : m_committed) {
        emit objectRemoved(object.id());
    }
    m_committed.clear();
    m_undone.clear();

    m_committed.reserve(lines.size() + texts.size());
    for (const CanvasLine& line : lines) {
        m_committed.append(CanvasObject::fromLine(line));
    }
    for (const TextAnnotation& text : texts) {
        m_committed.append(CanvasObject::fromText(text));
    }

    emit historyChanged();
    emitAvailability(hadUndo, hadRedo);
}

QVector<CanvasLine> CommandHistory::lines() const
{
    QVector<CanvasLine> result;
    for (const CanvasObject& object : m_committed) {
        if (object.kind == CanvasObject::Line) {
            result.append(object.line);
        }
    }
    return result;
}

QVector<TextAnnotation> CommandHistory::textAnnotations() const
{
    QVector<TextAnnotation> result;
    for (const CanvasObject& object : m_committed) {
        if (object.kind == CanvasObject::Text) {
            result.append(object.text);
        }
    }
    return result;
}

void CommandHistory::emitAvailability(bool hadUndo, bool hadRedo)
{
    if (hadUndo != canUndo()) {
        emit undoAvailableChanged(canUndo());
        // Clear is available exactly when there is committed content
        emit clearAvailableChanged(canUndo());
    }
    if (hadRedo != canRedo()) {
        emit redoAvailableChanged(canRedo());
    }
}
