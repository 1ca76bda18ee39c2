#pragma once

// ============================================================================
// DrawingEngine - Facade over input, gestures, drafts, history and sync
// ============================================================================
// Part of the ExamInk drawing engine
//
// Data flow:
//   TouchSample -> InputDispatcher -> GestureStateMachine (transform)
//                                  -> StrokeBuilder (drafts)
//   finished drafts -> CommandHistory -> SnapshotSync -> onChange/onExit
//
// Two tiers of state:
// - Interaction tier: transform(), previewPath(), shapePreview() and
//   textDraftRect() are updated synchronously with every sample;
//   interactionUpdated() fires right away.
// - Commit tier: snapshotChanged() and viewStateChanged() are coalesced to
//   at most one delivery per frame (last value wins).
// ============================================================================

#include "CanvasTransform.h"
#include "CommandHistory.h"
#include "EngineConfig.h"
#include "GestureStateMachine.h"
#include "ToolType.h"
#include "../input/InputDispatcher.h"
#include "../input/TouchSample.h"
#include "../strokes/StrokeBuilder.h"
#include "../strokes/StrokePath.h"
#include "../sync/CanvasSnapshot.h"
#include "../sync/SnapshotSync.h"

#include <QObject>
#include <QColor>
#include <QPainterPath>
#include <QRectF>
#include <QSizeF>

class DrawingEngine : public QObject
{
    Q_OBJECT

public:
    explicit DrawingEngine(const EngineConfig& config = EngineConfig(), QObject* parent = nullptr);

    /**
     * @brief Delivers the exit snapshot if exit() was never called.
     */
    ~DrawingEngine() override;

    // ===== Input =====

    /**
     * @brief Feed one touch sample (viewport coordinates).
     * @return True if the sample was consumed.
     */
    bool handleTouch(const TouchSample& sample);

    /**
     * @brief Set the widget size; the first size also becomes the logical
     *        canvas size unless one was set explicitly.
     */
    void setViewportSize(const QSizeF& size);
    QSizeF viewportSize() const { return m_gestures->viewportSize(); }

    void setLogicalSize(const QSizeF& size);
    QSizeF logicalSize() const { return m_gestures->logicalSize(); }

    // ===== Commands =====

    /**
     * @brief Select the tool for the next gesture.
     *
     * A gesture already in progress keeps the tool it started with.
     * Switching to Pan cancels every draft.
     */
    void setTool(ToolType tool);
    ToolType tool() const { return m_dispatcher->style().tool; }

    /**
     * @brief Set the ink color; invalid colors are ignored.
     */
    void setColor(const QColor& color);
    QColor color() const { return m_dispatcher->style().color; }

    /**
     * @brief Set the stroke thickness, clamped to [MIN_THICKNESS, MAX_THICKNESS].
     */
    void setThickness(qreal thickness);
    qreal thickness() const { return m_dispatcher->style().thickness; }

    /**
     * @brief Font size for new text annotations, clamped to [MIN_FONT_SIZE, MAX_FONT_SIZE].
     */
    void setTextFontSize(qreal size);
    qreal textFontSize() const { return m_textFontSize; }

    void undo();
    void redo();
    void clear();

    /**
     * @brief Replace all content with the given lines and texts.
     *
     * History (including the undone stack) and the path cache are reset.
     */
    void setContent(const QVector<CanvasLine>& lines, const QVector<TextAnnotation>& texts);

    void zoomBy(qreal multiplier);
    void zoomIn() { zoomBy(GestureStateMachine::ZOOM_STEP); }
    void zoomOut() { zoomBy(1.0 / GestureStateMachine::ZOOM_STEP); }
    void resetView(bool animated = true);

    /**
     * @brief Commit the text draft that is waiting for content.
     * @return True if an annotation was committed; empty text discards.
     */
    bool submitTextDraft(const QString& text);
    void cancelTextDraft();

    /**
     * @brief Tear down: cancel drafts, flush nothing further and deliver
     *        onExit(snapshot) exactly once.
     */
    void exit();
    bool hasExited() const { return m_sync->hasExited(); }

    // ===== Interaction tier =====

    const CanvasTransform& transform() const { return m_gestures->transform(); }
    GestureState gestureState() const { return m_gestures->state(); }

    /**
     * @brief Zoom as a percentage label, e.g. "120%".
     */
    QString zoomPercentLabel() const;

    const StrokeBuilder& builder() const { return m_builder; }
    const QPainterPath& previewPath() const { return m_builder.previewPath(); }
    bool hasActiveStroke() const { return m_builder.hasFreehandDraft(); }
    const CanvasLine& activeStroke() const { return m_builder.freehandDraft(); }
    const ShapePreview& shapePreview() const { return m_builder.shapePreview(); }
    QPainterPath shapePreviewPath() const { return m_builder.shapePreviewPath(); }
    QRectF textDraftRect() const { return m_builder.textDraftRect(); }
    bool isAwaitingText() const { return m_builder.isAwaitingText(); }

    // ===== Commit tier =====

    /**
     * @brief Build a snapshot of the current committed state and style.
     */
    CanvasSnapshot snapshot() const;

    const QVector<CanvasObject>& committed() const { return m_history->committed(); }
    QVector<CanvasLine> lines() const { return m_history->lines(); }
    QVector<TextAnnotation> textAnnotations() const { return m_history->textAnnotations(); }

    bool canUndo() const { return m_history->canUndo(); }
    bool canRedo() const { return m_history->canRedo(); }
    bool canClear() const { return !m_history->isEmpty(); }

    /**
     * @brief Rendered path of a committed line, cached by id and version.
     */
    const QPainterPath& pathForLine(const CanvasLine& line) { return m_pathCache.pathFor(line); }
    const LinePathCache& pathCache() const { return m_pathCache; }

    const QVector<QColor>& colorPalette() const { return m_config.colorPalette; }
    const QVector<qreal>& thicknessOptions() const { return m_config.thicknessOptions; }

    // ===== Components =====

    GestureStateMachine* gestures() const { return m_gestures; }
    InputDispatcher* dispatcher() const { return m_dispatcher; }
    CommandHistory* history() const { return m_history; }
    SnapshotSync* sync() const { return m_sync; }

    // ===== Constants =====
    static constexpr qreal MIN_THICKNESS = 0.5;
    static constexpr qreal MAX_THICKNESS = 100.0;
    static constexpr qreal MIN_FONT_SIZE = 8.0;
    static constexpr qreal MAX_FONT_SIZE = 96.0;

signals:
    /**
     * @brief Interaction tier changed (transform or a draft); repaint now.
     */
    void interactionUpdated();

    /**
     * @brief Coalesced repaint request for the live preview.
     */
    void previewFrameReady();

    void snapshotChanged(const CanvasSnapshot& snapshot);
    void viewStateChanged(const CanvasTransform& transform);
    void exited(const CanvasSnapshot& snapshot);

    void undoAvailableChanged(bool available);
    void redoAvailableChanged(bool available);
    void clearAvailableChanged(bool available);

    /**
     * @brief A text box was dragged; the host should collect its content and
     *        call submitTextDraft() or cancelTextDraft().
     * @param canvasRect Draft rectangle in canvas coordinates.
     */
    void textInputRequested(const QRectF& canvasRect);

    void toolChanged(ToolType tool);
    void styleChanged();

private:
    void connectComponents();
    void onLineFinished(const CanvasLine& line, const QPainterPath& smoothedPath);
    void onDraftCancelled();
    void discardAllDrafts();
    void scheduleSnapshot();
    void updateStyle(const ToolStyle& style);

    EngineConfig m_config;
    qreal m_textFontSize = 24.0;

    StrokeBuilder m_builder;
    LinePathCache m_pathCache;

    // QObject children
    GestureStateMachine* m_gestures = nullptr;
    InputDispatcher* m_dispatcher = nullptr;
    CommandHistory* m_history = nullptr;
    SnapshotSync* m_sync = nullptr;
};
