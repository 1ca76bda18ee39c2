#pragma once

// ============================================================================
// StrokeBuilder - Accumulates drafts into committed drawing objects
// ============================================================================
// Part of the ExamInk drawing engine
//
// One draft at a time: a freehand stroke, a shape drag or a text box drag.
// Every draft is tagged with the gesture id that created it; calls carrying
// any other id are ignored so that samples from a cancelled episode can
// never mutate a newer draft.
// ============================================================================

#include "CanvasLine.h"
#include "TextAnnotation.h"
#include "../core/ToolType.h"

#include <QPainterPath>
#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QVector>

/**
 * @brief Live state of a shape drag.
 */
struct ShapePreview {
    ShapeKind kind = ShapeKind::None;
    QPointF start;
    QPointF current;

    bool isValid() const { return kind != ShapeKind::None; }
};

/**
 * @brief Builds freehand strokes, shapes and text annotations from gestures.
 *
 * The builder never touches history; finish*() hands the result back to
 * the caller which decides whether to commit it.
 */
class StrokeBuilder {
public:
    StrokeBuilder() = default;

    // ===== Freehand (pencil / eraser) =====

    /**
     * @brief Start a freehand stroke with its first point.
     * @return False if the tool is not a freehand tool.
     */
    bool beginFreehand(quint64 gestureId, ToolType tool, const QPointF& point,
                       const QColor& color, qreal thickness);

    /**
     * @brief Append a point to the active stroke.
     * @return True if the point was retained (far enough from the last one).
     *
     * Points closer than MIN_DRAW_DISTANCE to the last retained point are
     * dropped. The preview path is rebuilt from the trailing window.
     */
    bool appendFreehandPoint(quint64 gestureId, const QPointF& point);

    /**
     * @brief Finish the active stroke.
     * @param outLine Receives the finished line.
     * @param outSmoothedPath Optional; receives the smoothed path built
     *        once from the complete point list.
     * @return False if there was no stroke for this gesture.
     */
    bool finishFreehand(quint64 gestureId, CanvasLine& outLine, QPainterPath* outSmoothedPath = nullptr);

    bool hasFreehandDraft() const { return m_freehandActive; }
    const CanvasLine& freehandDraft() const { return m_freehand; }

    /**
     * @brief Preview polyline over the last StrokePath::PREVIEW_WINDOW_SIZE points.
     */
    const QPainterPath& previewPath() const { return m_previewPath; }

    /**
     * @brief Polyline over the points that have left the preview window.
     *
     * Ends on the first point of previewPath(). Grows by appending only, so a
     * frame never has to walk the whole stroke. Empty until the stroke has
     * more than PREVIEW_WINDOW_SIZE points.
     */
    const QPainterPath& frozenPath() const { return m_frozenPath; }

    // ===== Shapes (line / rectangle / ellipse) =====

    bool beginShape(quint64 gestureId, ToolType tool, const QPointF& point,
                    const QColor& color, qreal thickness);
    bool updateShape(quint64 gestureId, const QPointF& point);

    /**
     * @brief Finish the shape drag.
     * @return True if a shape line was produced. Drags shorter than
     *         MIN_SHAPE_DISTANCE are discarded and return false.
     */
    bool finishShape(quint64 gestureId, CanvasLine& outLine);

    bool hasShapeDraft() const { return m_shapeActive; }
    const ShapePreview& shapePreview() const { return m_shape; }
    QColor shapeColor() const { return m_shapeColor; }
    qreal shapeThickness() const { return m_shapeThickness; }
    QPainterPath shapePreviewPath() const;

    // ===== Text =====

    bool beginText(quint64 gestureId, const QPointF& point);
    bool updateText(quint64 gestureId, const QPointF& point);

    /**
     * @brief End the text drag; the draft then waits for content.
     * @return True if a draft is now awaiting text.
     */
    bool endTextDrag(quint64 gestureId);

    /**
     * @brief Supply the text for a draft awaiting content.
     * @param text Raw input; surrounding whitespace is trimmed.
     * @param outText Receives the annotation on success.
     * @return False (draft discarded) if no draft is waiting or the trimmed
     *         text is empty.
     */
    bool submitText(const QString& text, qreal fontSize, const QColor& color, TextAnnotation& outText);

    /**
     * @brief Discard the text draft, whether dragging or awaiting content.
     * @return True if a draft was discarded.
     */
    bool cancelText();

    bool hasTextDraft() const { return m_textActive; }
    bool isAwaitingText() const { return m_textActive && m_textAwaitingContent; }

    /**
     * @brief Current text draft rectangle (normalized, without minimum size).
     */
    QRectF textDraftRect() const;

    // ===== Cancellation =====

    /**
     * @brief Discard every in-progress draft without producing anything.
     * @return True if something was discarded.
     */
    bool cancelAll();

    /**
     * @brief Discard drafts that are still being dragged.
     *
     * A text draft already awaiting content is kept.
     */
    bool cancelInteractive();

    /**
     * @brief Gesture id owning the current draft, 0 if none.
     */
    quint64 activeGestureId() const { return m_gestureId; }

    // ===== Constants =====
    static constexpr qreal MIN_DRAW_DISTANCE = 0.75;   ///< Logical px between retained points
    static constexpr qreal MIN_SHAPE_DISTANCE = 5.0;   ///< Shorter drags are discarded

private:
    bool ownsGesture(quint64 gestureId) const { return gestureId != 0 && gestureId == m_gestureId; }
    void resetFreehand();
    void extendFrozenPath();
    void resetShape();
    void resetText();

    quint64 m_gestureId = 0;

    // Freehand
    bool m_freehandActive = false;
    CanvasLine m_freehand;
    QPainterPath m_previewPath;
    QPainterPath m_frozenPath;
    int m_frozenCount = 0;          ///< Stroke points already in m_frozenPath

    // Shape
    bool m_shapeActive = false;
    ShapePreview m_shape;
    ToolType m_shapeTool = ToolType::Line;
    QColor m_shapeColor;
    qreal m_shapeThickness = 0;

    // Text
    bool m_textActive = false;
    bool m_textAwaitingContent = false;
    QPointF m_textStart;
    QPointF m_textEnd;
};
