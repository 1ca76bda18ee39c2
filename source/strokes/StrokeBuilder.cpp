#include "StrokeBuilder.h"
#include "StrokePath.h"

#include <QDebug>
#include <cmath>

// ===== Freehand =====

bool StrokeBuilder::beginFreehand(quint64 gestureId, ToolType tool, const QPointF& point,
                                  const QColor& color, qreal thickness)
{
    if (!isFreehandTool(tool) || gestureId == 0) {
        return false;
    }

    // A new episode replaces any previous draft
    cancelAll();

    m_gestureId = gestureId;
    m_freehandActive = true;
    m_freehand = CanvasLine();
    m_freehand.id = CanvasLine::createId();
    m_freehand.tool = tool;
    m_freehand.color = color;
    m_freehand.thickness = thickness;
    m_freehand.points.append(point);
    m_previewPath = QPainterPath();
    m_frozenPath = QPainterPath();
    m_frozenCount = 0;
    return true;
}

bool StrokeBuilder::appendFreehandPoint(quint64 gestureId, const QPointF& point)
{
    if (!m_freehandActive || !ownsGesture(gestureId)) {
        return false;
    }

    // Point decimation
    if (!m_freehand.points.isEmpty()) {
        const QPointF& last = m_freehand.points.last();
        const qreal dx = point.x() - last.x();
        const qreal dy = point.y() - last.y();
        if (dx * dx + dy * dy < MIN_DRAW_DISTANCE * MIN_DRAW_DISTANCE) {
            return false;
        }
    }

    m_freehand.points.append(point);
    m_previewPath = StrokePath::buildPreviewPath(m_freehand.points);
    extendFrozenPath();
    return true;
}

bool StrokeBuilder::finishFreehand(quint64 gestureId, CanvasLine& outLine, QPainterPath* outSmoothedPath)
{
    if (!m_freehandActive || !ownsGesture(gestureId)) {
        return false;
    }

    outLine = m_freehand;
    if (outSmoothedPath) {
        *outSmoothedPath = StrokePath::buildSmoothPath(outLine.points);
    }

    resetFreehand();
    m_gestureId = 0;
    return !outLine.points.isEmpty();
}

// ===== Shapes =====

bool StrokeBuilder::beginShape(quint64 gestureId, ToolType tool, const QPointF& point,
                               const QColor& color, qreal thickness)
{
    if (!isShapeTool(tool) || gestureId == 0) {
        return false;
    }

    cancelAll();

    m_gestureId = gestureId;
    m_shapeActive = true;
    m_shapeTool = tool;
    m_shapeColor = color;
    m_shapeThickness = thickness;
    m_shape.kind = shapeKindForTool(tool);
    m_shape.start = point;
    m_shape.current = point;
    return true;
}

bool StrokeBuilder::updateShape(quint64 gestureId, const QPointF& point)
{
    if (!m_shapeActive || !ownsGesture(gestureId)) {
        return false;
    }
    m_shape.current = point;
    return true;
}

bool StrokeBuilder::finishShape(quint64 gestureId, CanvasLine& outLine)
{
    if (!m_shapeActive || !ownsGesture(gestureId)) {
        return false;
    }

    const ShapePreview shape = m_shape;
    resetShape();
    m_gestureId = 0;

    const QPointF delta = shape.current - shape.start;
    if (std::hypot(delta.x(), delta.y()) < MIN_SHAPE_DISTANCE) {
#ifdef EXAMINK_DEBUG
        qDebug() << "[Builder] Discarding undersized shape" << shapeKindName(shape.kind);
#endif
        return false;
    }

    outLine = CanvasLine();
    outLine.id = CanvasLine::createId();
    outLine.tool = m_shapeTool;
    outLine.color = m_shapeColor;
    outLine.thickness = m_shapeThickness;
    outLine.shapeKind = shape.kind;
    outLine.bounds = {shape.start.x(), shape.start.y(), shape.current.x(), shape.current.y()};
    return true;
}

QPainterPath StrokeBuilder::shapePreviewPath() const
{
    if (!m_shapeActive) {
        return QPainterPath();
    }
    return StrokePath::buildShapePreviewPath(m_shape.kind, m_shape.start, m_shape.current);
}

// ===== Text =====

bool StrokeBuilder::beginText(quint64 gestureId, const QPointF& point)
{
    if (gestureId == 0) {
        return false;
    }

    cancelAll();

    m_gestureId = gestureId;
    m_textActive = true;
    m_textAwaitingContent = false;
    m_textStart = point;
    m_textEnd = point;
    return true;
}

bool StrokeBuilder::updateText(quint64 gestureId, const QPointF& point)
{
    if (!m_textActive || m_textAwaitingContent || !ownsGesture(gestureId)) {
        return false;
    }
    m_textEnd = point;
    return true;
}

bool StrokeBuilder::endTextDrag(quint64 gestureId)
{
    if (!m_textActive || m_textAwaitingContent || !ownsGesture(gestureId)) {
        return false;
    }
    m_textAwaitingContent = true;
    return true;
}

bool StrokeBuilder::submitText(const QString& text, qreal fontSize, const QColor& color, TextAnnotation& outText)
{
    if (!isAwaitingText()) {
        return false;
    }

    const QString trimmed = text.trimmed();
    const QPointF start = m_textStart;
    const QPointF end = m_textEnd;
    resetText();
    m_gestureId = 0;

    if (trimmed.isEmpty()) {
        return false;
    }

    outText = TextAnnotation::fromDrag(start, end);
    outText.text = trimmed;
    outText.fontSize = fontSize;
    outText.color = color;
    return true;
}

bool StrokeBuilder::cancelText()
{
    if (!m_textActive) {
        return false;
    }
    resetText();
    m_gestureId = 0;
    return true;
}

QRectF StrokeBuilder::textDraftRect() const
{
    if (!m_textActive) {
        return QRectF();
    }
    return QRectF(m_textStart, m_textEnd).normalized();
}

// ===== Cancellation =====

bool StrokeBuilder::cancelAll()
{
    const bool hadDraft = m_freehandActive || m_shapeActive || m_textActive;
    resetFreehand();
    resetShape();
    resetText();
    m_gestureId = 0;
    return hadDraft;
}

bool StrokeBuilder::cancelInteractive()
{
    bool discarded = false;
    if (m_freehandActive) {
        resetFreehand();
        discarded = true;
    }
    if (m_shapeActive) {
        resetShape();
        discarded = true;
    }
    if (m_textActive && !m_textAwaitingContent) {
        resetText();
        discarded = true;
    }
    if (!m_textActive) {
        m_gestureId = 0;
    }
    return discarded;
}

// ===== Private =====

void StrokeBuilder::resetFreehand()
{
    m_freehandActive = false;
    m_freehand = CanvasLine();
    m_previewPath = QPainterPath();
    m_frozenPath = QPainterPath();
    m_frozenCount = 0;
}

void StrokeBuilder::extendFrozenPath()
{
    // Everything up to and including the first point of the preview window
    const QVector<QPointF>& points = m_freehand.points;
    const int frozenEnd = points.size() - StrokePath::PREVIEW_WINDOW_SIZE + 1;
    if (frozenEnd < 2) {
        return;
    }
    for (; m_frozenCount < frozenEnd; ++m_frozenCount) {
        if (m_frozenCount == 0) {
            m_frozenPath.moveTo(points[0]);
        } else {
            m_frozenPath.lineTo(points[m_frozenCount]);
        }
    }
}

void StrokeBuilder::resetShape()
{
    m_shapeActive = false;
    m_shape = ShapePreview();
}

void StrokeBuilder::resetText()
{
    m_textActive = false;
    m_textAwaitingContent = false;
    m_textStart = QPointF();
    m_textEnd = QPointF();
}
