#include "InputDispatcher.h"
#include "../core/GestureStateMachine.h"
#include "../strokes/StrokeBuilder.h"

#include <QDebug>
#include <cmath>

// ===== Constructor =====

InputDispatcher::InputDispatcher(GestureStateMachine* gestures, StrokeBuilder* builder, QObject* parent)
    : QObject(parent)
    , m_gestures(gestures)
    , m_builder(builder)
{
}

// ===== Touch Handling =====

bool InputDispatcher::handleTouch(const TouchSample& sample)
{
    if (!m_gestures || !m_builder) {
        return false;
    }

    if (!sample.isValid()) {
#ifdef EXAMINK_DEBUG
        qDebug() << "[Touch] Dropping invalid sample" << sample.position
                 << "spread" << sample.fingerSpread << "fingers" << sample.activeFingerCount;
#endif
        return false;
    }

    switch (sample.phase) {
        case TouchSample::Start:
            beginEpisode(sample);
            return true;

        case TouchSample::Move:
            if (!m_episode.active) {
                return false;
            }
            if (sample.isMultiFinger()) {
                if (!m_episode.multiTouch) {
                    enterMultiTouch(sample);
                } else if (sample.activeFingerCount != m_episode.fingerCount) {
                    // Centroid and spread jump with the finger set
                    m_episode.fingerCount = sample.activeFingerCount;
                    m_gestures->rebaseTwoFinger(sample.position, sample.fingerSpread);
                } else {
                    m_gestures->updateTwoFinger(sample.position, sample.fingerSpread);
                }
                return true;
            }
            // Multi-touch gating: back to one finger never resumes ink
            if (m_episode.multiTouch) {
                m_episode.fingerCount = sample.activeFingerCount;
                return true;
            }
            updateSingleFinger(sample);
            return true;

        case TouchSample::End:
            if (!m_episode.active) {
                return false;
            }
            if (!m_episode.multiTouch) {
                finishSingleFinger(sample);
            }
            finishEpisode();
            return true;

        case TouchSample::Cancel:
            return cancelEpisode();
    }
    return false;
}

bool InputDispatcher::cancelEpisode()
{
    if (!m_episode.active) {
        return false;
    }

#ifdef EXAMINK_DEBUG
    qDebug() << "[Touch] Cancelling episode" << m_episode.id;
#endif

    const bool discarded = m_builder->cancelInteractive();
    m_episode.active = false;
    m_lastTap = TapRecord();
    m_gestures->endGesture();
    if (discarded) {
        emit draftCancelled();
    }
    return true;
}

// ===== Episode lifecycle =====

void InputDispatcher::beginEpisode(const TouchSample& sample)
{
    // A Start without a preceding End means the old episode was lost
    if (m_episode.active) {
        cancelEpisode();
    }

    // Any new episode interrupts a running view animation
    m_gestures->stopAnimation();

    // A text box still waiting for content is abandoned by the next gesture
    if (m_builder->isAwaitingText()) {
        m_builder->cancelText();
        emit draftCancelled();
    }

    m_episode = Episode();
    m_episode.id = m_nextGestureId++;
    m_episode.active = true;
    m_episode.style = m_style;
    m_episode.startViewportPos = sample.position;
    m_episode.startMs = sample.timestampMs;
    m_episode.fingerCount = sample.activeFingerCount;

#ifdef EXAMINK_DEBUG
    qDebug() << "[Touch] Episode" << m_episode.id << "tool" << toolTypeName(m_episode.style.tool)
             << "fingers" << sample.activeFingerCount;
#endif

    if (sample.isMultiFinger()) {
        enterMultiTouch(sample);
        return;
    }
    beginSingleFinger(sample);
}

void InputDispatcher::finishEpisode()
{
    m_episode.active = false;
    m_gestures->endGesture();
}

// ===== Single finger =====

void InputDispatcher::beginSingleFinger(const TouchSample& sample)
{
    const quint64 id = m_episode.id;
    const ToolStyle& style = m_episode.style;
    const QPointF canvasPt = toCanvas(sample.position);

    if (style.tool == ToolType::Pan) {
        m_gestures->beginSingleFingerPan(sample.position);
        return;
    }

    if (isFreehandTool(style.tool)) {
        if (m_builder->beginFreehand(id, style.tool, canvasPt, style.color, style.thickness)) {
            m_gestures->setState(GestureState::Drawing);
            emit draftChanged(id);
        }
        return;
    }

    if (isShapeTool(style.tool)) {
        if (m_builder->beginShape(id, style.tool, canvasPt, style.color, style.thickness)) {
            m_gestures->setState(GestureState::ShapeDraft);
            emit draftChanged(id);
        }
        return;
    }

    if (style.tool == ToolType::Text) {
        if (m_builder->beginText(id, canvasPt)) {
            m_gestures->setState(GestureState::TextDraft);
            emit draftChanged(id);
        }
    }
}

void InputDispatcher::updateSingleFinger(const TouchSample& sample)
{
    const quint64 id = m_episode.id;
    const ToolType tool = m_episode.style.tool;

    const QPointF moved = sample.position - m_episode.startViewportPos;
    if (!m_episode.exceededSlop &&
        std::hypot(moved.x(), moved.y()) >= GestureStateMachine::TOUCH_SLOP) {
        m_episode.exceededSlop = true;
    }

    if (tool == ToolType::Pan) {
        m_gestures->updateSingleFingerPan(sample.position);
        return;
    }

    const QPointF canvasPt = toCanvas(sample.position);
    bool changed = false;
    if (isFreehandTool(tool)) {
        changed = m_builder->appendFreehandPoint(id, canvasPt);
    } else if (isShapeTool(tool)) {
        changed = m_builder->updateShape(id, canvasPt);
    } else if (tool == ToolType::Text) {
        changed = m_builder->updateText(id, canvasPt);
    }

    if (changed) {
        emit draftChanged(id);
    }
}

void InputDispatcher::finishSingleFinger(const TouchSample& sample)
{
    const quint64 id = m_episode.id;
    const ToolType tool = m_episode.style.tool;

    const QPointF moved = sample.position - m_episode.startViewportPos;
    if (std::hypot(moved.x(), moved.y()) >= GestureStateMachine::TOUCH_SLOP) {
        m_episode.exceededSlop = true;
    }

    if (completesDoubleTap(sample)) {
        finishDoubleTap();
        return;
    }

    if (tool == ToolType::Pan) {
        recordTap(sample, QString());
        return;
    }

    const QPointF canvasPt = toCanvas(sample.position);
    QString committedId;

    if (isFreehandTool(tool)) {
        m_builder->appendFreehandPoint(id, canvasPt);
        CanvasLine line;
        QPainterPath smoothed;
        if (m_builder->finishFreehand(id, line, &smoothed)) {
            committedId = line.id;
            emit lineFinished(line, smoothed);
        }
    } else if (isShapeTool(tool)) {
        if (m_builder->hasShapeDraft() && m_builder->activeGestureId() == id) {
            m_builder->updateShape(id, canvasPt);
            CanvasLine line;
            if (m_builder->finishShape(id, line)) {
                committedId = line.id;
                emit lineFinished(line, QPainterPath());
            } else {
                emit draftCancelled();
            }
        }
    } else if (tool == ToolType::Text) {
        m_builder->updateText(id, canvasPt);
        if (m_builder->endTextDrag(id)) {
            emit textInputRequested(m_builder->textDraftRect());
        }
    }

    recordTap(sample, committedId);
}

// ===== Multi-touch =====

void InputDispatcher::enterMultiTouch(const TouchSample& sample)
{
    m_episode.multiTouch = true;
    m_episode.fingerCount = sample.activeFingerCount;
    m_lastTap = TapRecord();

    // Ink in progress is discarded, never committed
    if (m_builder->cancelInteractive()) {
#ifdef EXAMINK_DEBUG
        qDebug() << "[Touch] Multi-touch cancelled the draft of episode" << m_episode.id;
#endif
        emit draftCancelled();
    }

    m_gestures->beginTwoFinger(sample.position, sample.fingerSpread);
}

// ===== Double tap =====

bool InputDispatcher::isTap(const TouchSample& sample) const
{
    const qint64 duration = sample.timestampMs - m_episode.startMs;
    return !m_episode.exceededSlop && duration >= 0 && duration <= TAP_MAX_DURATION_MS;
}

bool InputDispatcher::completesDoubleTap(const TouchSample& sample) const
{
    if (!m_lastTap.valid || !isTap(sample)) {
        return false;
    }
    const qint64 gap = m_episode.startMs - m_lastTap.endMs;
    const QPointF offset = m_episode.startViewportPos - m_lastTap.position;
    return gap >= 0 && gap <= DOUBLE_TAP_INTERVAL_MS &&
           std::hypot(offset.x(), offset.y()) <= DOUBLE_TAP_MAX_DISTANCE;
}

void InputDispatcher::finishDoubleTap()
{
    const QString discardedLineId = m_lastTap.lineId;
    m_lastTap = TapRecord();

    // The second tap leaves nothing behind
    if (m_builder->cancelInteractive()) {
        emit draftCancelled();
    }

#ifdef EXAMINK_DEBUG
    qDebug() << "[Touch] Double tap in episode" << m_episode.id << "retracting" << discardedLineId;
#endif

    emit doubleTapRecognized(discardedLineId);
    m_gestures->resetView(true);
}

void InputDispatcher::recordTap(const TouchSample& sample, const QString& lineId)
{
    if (!isTap(sample)) {
        m_lastTap = TapRecord();
        return;
    }
    m_lastTap.valid = true;
    m_lastTap.position = sample.position;
    m_lastTap.endMs = sample.timestampMs;
    m_lastTap.lineId = lineId;
}

// ===== Helpers =====

QPointF InputDispatcher::toCanvas(const QPointF& viewportPos) const
{
    return m_gestures->transform().toCanvas(viewportPos);
}
