#include "DrawingEngine.h"

#include <QDebug>
#include <cmath>

// ===== Constructor =====

DrawingEngine::DrawingEngine(const EngineConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config.normalized())
{
    m_gestures = new GestureStateMachine(this);
    m_dispatcher = new InputDispatcher(m_gestures, &m_builder, this);
    m_history = new CommandHistory(this);
    m_sync = new SnapshotSync(this);

    ToolStyle style;
    style.tool = m_config.initialTool;
    style.color = m_config.initialColor;
    style.thickness = qBound(MIN_THICKNESS, m_config.initialThickness, MAX_THICKNESS);
    m_dispatcher->setStyle(style);
    m_textFontSize = qBound(MIN_FONT_SIZE, m_config.initialTextFontSize, MAX_FONT_SIZE);

    m_history->reset(m_config.initialLines, m_config.initialTextAnnotations);

    connectComponents();
}

DrawingEngine::~DrawingEngine()
{
    if (!hasExited()) {
        exit();
    }
}

void DrawingEngine::connectComponents()
{
    // Input -> drafts and commits
    connect(m_dispatcher, &InputDispatcher::lineFinished, this, &DrawingEngine::onLineFinished);
    connect(m_dispatcher, &InputDispatcher::draftCancelled, this, &DrawingEngine::onDraftCancelled);
    connect(m_dispatcher, &InputDispatcher::textInputRequested, this, &DrawingEngine::textInputRequested);
    connect(m_dispatcher, &InputDispatcher::draftChanged, this, [this](quint64 gestureId) {
        m_sync->schedulePreviewFrame(gestureId);
        emit interactionUpdated();
    });

    // The first tap of a double tap already committed a dot
    connect(m_dispatcher, &InputDispatcher::doubleTapRecognized, this, [this](const QString& discardedLineId) {
        if (!discardedLineId.isEmpty() && !m_history->retractLast(discardedLineId)) {
            qWarning() << "[Engine] Double tap: dot" << discardedLineId << "is no longer the last object";
        }
    });

    // Transform: immediate for the interaction tier, coalesced for the view state
    connect(m_gestures, &GestureStateMachine::transformChanged, this, [this](const CanvasTransform& t) {
        m_sync->scheduleViewState(t);
        emit interactionUpdated();
    });

    // History -> path cache, availability and snapshot
    connect(m_history, &CommandHistory::objectRemoved, this, [this](const QString& id) {
        m_pathCache.invalidate(id);
    });
    connect(m_history, &CommandHistory::historyChanged, this, &DrawingEngine::scheduleSnapshot);
    connect(m_history, &CommandHistory::undoAvailableChanged, this, &DrawingEngine::undoAvailableChanged);
    connect(m_history, &CommandHistory::redoAvailableChanged, this, &DrawingEngine::redoAvailableChanged);
    connect(m_history, &CommandHistory::clearAvailableChanged, this, &DrawingEngine::clearAvailableChanged);

    // Commit tier delivery
    connect(m_sync, &SnapshotSync::snapshotReady, this, [this](const CanvasSnapshot& snapshot) {
        if (m_config.onChange) {
            m_config.onChange(snapshot);
        }
        emit snapshotChanged(snapshot);
    });
    connect(m_sync, &SnapshotSync::viewStateReady, this, &DrawingEngine::viewStateChanged);
    connect(m_sync, &SnapshotSync::previewFrameReady, this, [this](quint64 gestureId) {
        // A frame for a draft that no longer exists is stale
        if (gestureId != 0 && gestureId == m_builder.activeGestureId()) {
            emit previewFrameReady();
        }
    });
    connect(m_sync, &SnapshotSync::exitSnapshotReady, this, [this](const CanvasSnapshot& snapshot) {
        if (m_config.onExit) {
            m_config.onExit(snapshot);
        }
        emit exited(snapshot);
    });
}

// ===== Input =====

bool DrawingEngine::handleTouch(const TouchSample& sample)
{
    if (hasExited()) {
        return false;
    }
    return m_dispatcher->handleTouch(sample);
}

void DrawingEngine::setViewportSize(const QSizeF& size)
{
    const QSizeF oldLogical = m_gestures->logicalSize();
    m_gestures->setViewportSize(size);
    if (m_gestures->logicalSize() != oldLogical) {
        scheduleSnapshot();
    }
}

void DrawingEngine::setLogicalSize(const QSizeF& size)
{
    const QSizeF oldLogical = m_gestures->logicalSize();
    m_gestures->setLogicalSize(size);
    if (m_gestures->logicalSize() != oldLogical) {
        scheduleSnapshot();
    }
}

// ===== Style =====

void DrawingEngine::setTool(ToolType tool)
{
    if (hasExited()) {
        return;
    }
    ToolStyle style = m_dispatcher->style();
    if (style.tool == tool) {
        return;
    }

    // Pan never produces content, so anything being drawn is dropped
    if (tool == ToolType::Pan) {
        discardAllDrafts();
    }

    style.tool = tool;
    updateStyle(style);
    emit toolChanged(tool);
}

void DrawingEngine::setColor(const QColor& color)
{
    if (hasExited()) {
        return;
    }
    if (!color.isValid()) {
        qWarning() << "[Engine] setColor: ignoring invalid color";
        return;
    }
    ToolStyle style = m_dispatcher->style();
    if (style.color == color) {
        return;
    }
    style.color = color;
    updateStyle(style);
}

void DrawingEngine::setThickness(qreal thickness)
{
    if (hasExited()) {
        return;
    }
    if (!std::isfinite(thickness)) {
        qWarning() << "[Engine] setThickness: ignoring non-finite value";
        return;
    }
    ToolStyle style = m_dispatcher->style();
    const qreal clamped = qBound(MIN_THICKNESS, thickness, MAX_THICKNESS);
    if (qFuzzyCompare(style.thickness, clamped)) {
        return;
    }
    style.thickness = clamped;
    updateStyle(style);
}

void DrawingEngine::setTextFontSize(qreal size)
{
    if (hasExited()) {
        return;
    }
    if (!std::isfinite(size)) {
        return;
    }
    m_textFontSize = qBound(MIN_FONT_SIZE, size, MAX_FONT_SIZE);
}

void DrawingEngine::updateStyle(const ToolStyle& style)
{
    m_dispatcher->setStyle(style);
    emit styleChanged();
    scheduleSnapshot();
}

// ===== History =====

void DrawingEngine::undo()
{
    if (hasExited()) {
        return;
    }
    m_history->undo();
}

void DrawingEngine::redo()
{
    if (hasExited()) {
        return;
    }
    m_history->redo();
}

void DrawingEngine::clear()
{
    if (hasExited()) {
        return;
    }
    m_history->clear();
    m_pathCache.clear();
}

void DrawingEngine::setContent(const QVector<CanvasLine>& lines, const QVector<TextAnnotation>& texts)
{
    if (hasExited()) {
        return;
    }
    discardAllDrafts();
    m_history->reset(lines, texts);
    m_pathCache.clear();
}

// ===== View =====

void DrawingEngine::zoomBy(qreal multiplier)
{
    if (hasExited()) {
        return;
    }
    m_gestures->zoomBy(multiplier, true);
}

void DrawingEngine::resetView(bool animated)
{
    if (hasExited()) {
        return;
    }
    m_gestures->resetView(animated);
}

QString DrawingEngine::zoomPercentLabel() const
{
    return QStringLiteral("%1%").arg(qRound(m_gestures->zoom() * 100.0));
}

// ===== Text =====

bool DrawingEngine::submitTextDraft(const QString& text)
{
    if (hasExited()) {
        return false;
    }
    if (!m_builder.isAwaitingText()) {
        qWarning() << "[Engine] submitTextDraft: no text draft is waiting";
        return false;
    }

    TextAnnotation annotation;
    const bool accepted = m_builder.submitText(text, m_textFontSize, color(), annotation);
    m_sync->cancelPreviewFrame();
    emit interactionUpdated();
    if (!accepted) {
        return false;
    }
    m_history->commit(CanvasObject::fromText(annotation));
    return true;
}

void DrawingEngine::cancelTextDraft()
{
    if (m_builder.cancelText()) {
        m_sync->cancelPreviewFrame();
        emit interactionUpdated();
    }
}

// ===== Exit =====

void DrawingEngine::exit()
{
    if (hasExited()) {
        return;
    }
    discardAllDrafts();
    m_gestures->stopAnimation();
    m_sync->exit(snapshot());
}

// ===== Snapshot =====

CanvasSnapshot DrawingEngine::snapshot() const
{
    CanvasSnapshot snap;
    snap.lines = m_history->lines();
    snap.textAnnotations = m_history->textAnnotations();
    const ToolStyle& style = m_dispatcher->style();
    snap.tool = style.tool;
    snap.color = style.color;
    snap.thickness = style.thickness;
    snap.canvasWidth = m_gestures->logicalSize().width();
    snap.canvasHeight = m_gestures->logicalSize().height();
    return snap;
}

void DrawingEngine::scheduleSnapshot()
{
    m_sync->scheduleSnapshot(snapshot());
}

// ===== Private =====

void DrawingEngine::onLineFinished(const CanvasLine& line, const QPainterPath& smoothedPath)
{
    if (!line.isShape() && !smoothedPath.isEmpty()) {
        m_pathCache.store(line, smoothedPath);
    }
    m_sync->cancelPreviewFrame();
    m_history->commit(CanvasObject::fromLine(line));
    emit interactionUpdated();
}

void DrawingEngine::onDraftCancelled()
{
    m_sync->cancelPreviewFrame();
    emit interactionUpdated();
}

void DrawingEngine::discardAllDrafts()
{
    const bool episodeCancelled = m_dispatcher->cancelEpisode();
    const bool draftDiscarded = m_builder.cancelAll();
    if (episodeCancelled || draftDiscarded) {
        m_sync->cancelPreviewFrame();
        emit interactionUpdated();
    }
}
