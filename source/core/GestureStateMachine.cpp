#include "GestureStateMachine.h"

#include <QVariantAnimation>
#include <QEasingCurve>
#include <QDebug>
#include <cmath>

// ===== Constructor =====

GestureStateMachine::GestureStateMachine(QObject* parent)
    : QObject(parent)
{
    m_viewAnimation = new QVariantAnimation(this);
    m_viewAnimation->setStartValue(0.0);
    m_viewAnimation->setEndValue(1.0);
    m_viewAnimation->setDuration(VIEW_ANIMATION_MS);
    m_viewAnimation->setEasingCurve(QEasingCurve::OutCubic);
    connect(m_viewAnimation, &QVariantAnimation::valueChanged,
            this, &GestureStateMachine::onAnimationValue);
    connect(m_viewAnimation, &QVariantAnimation::finished, this, [this]() {
        // Land exactly on the target regardless of the last frame's progress
        applyTransform(m_animationTarget.zoom, m_animationTarget.pan());
    });
}

GestureStateMachine::~GestureStateMachine()
{
    if (m_viewAnimation) {
        m_viewAnimation->stop();
    }
}

// ===== Geometry =====

void GestureStateMachine::setViewportSize(const QSizeF& size)
{
    if (size.isEmpty() || size == m_viewportSize) {
        return;
    }
    m_viewportSize = size;
    if (m_logicalSize.isEmpty()) {
        // The drawing area defaults to the first laid-out viewport
        m_logicalSize = size;
    }
    applyTransform(m_transform.zoom, m_transform.pan());
}

void GestureStateMachine::setLogicalSize(const QSizeF& size)
{
    if (size.isEmpty() || size == m_logicalSize) {
        return;
    }
    m_logicalSize = size;
    applyTransform(m_transform.zoom, m_transform.pan());
}

// ===== State =====

void GestureStateMachine::setState(GestureState state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(m_state);
}

void GestureStateMachine::setTransform(qreal zoom, const QPointF& pan)
{
    stopAnimation();
    applyTransform(zoom, pan);
}

// ===== Single-finger pan =====

void GestureStateMachine::beginSingleFingerPan(const QPointF& viewportPos)
{
    stopAnimation();
    m_singlePanStart = viewportPos;
    m_singlePanOrigin = m_transform.pan();
    m_singlePanActive = false;
}

bool GestureStateMachine::updateSingleFingerPan(const QPointF& viewportPos)
{
    const QPointF delta = viewportPos - m_singlePanStart;

    if (!m_singlePanActive) {
        const qreal distance = std::hypot(delta.x(), delta.y());
        if (distance < TOUCH_SLOP) {
            // Below slop: neither pan nor ink
            return false;
        }
        m_singlePanActive = true;
        setState(GestureState::Panning);
    }

    applyTransform(m_transform.zoom, m_singlePanOrigin + delta);
    return true;
}

// ===== Two-finger pan/zoom =====

void GestureStateMachine::beginTwoFinger(const QPointF& centroid, qreal spread)
{
    stopAnimation();
    m_twoFingerActive = true;
    m_twoFingerStartCentroid = centroid;
    m_twoFingerStartPan = m_transform.pan();
    m_twoFingerStartZoom = m_transform.zoom;
    // Avoid division by zero for coincident touch points
    m_twoFingerStartSpread = qMax(spread, 1.0);
    m_singlePanActive = false;
    setState(GestureState::Panning);
}

void GestureStateMachine::updateTwoFinger(const QPointF& centroid, qreal spread)
{
    if (!m_twoFingerActive) {
        beginTwoFinger(centroid, spread);
        return;
    }

    const qreal scale = qMax(spread, 1.0) / m_twoFingerStartSpread;
    if (m_state != GestureState::Zooming && std::abs(scale - 1.0) > ZOOM_ACTIVATION_THRESHOLD) {
        setState(GestureState::Zooming);
    }

    const qreal nextZoom = CanvasTransform::clampZoom(m_twoFingerStartZoom * scale);
    const QPointF translation = centroid - m_twoFingerStartCentroid;
    applyTransform(nextZoom, m_twoFingerStartPan + translation);
}

void GestureStateMachine::rebaseTwoFinger(const QPointF& centroid, qreal spread)
{
    if (!m_twoFingerActive) {
        beginTwoFinger(centroid, spread);
        return;
    }
    m_twoFingerStartCentroid = centroid;
    m_twoFingerStartPan = m_transform.pan();
    m_twoFingerStartZoom = m_transform.zoom;
    m_twoFingerStartSpread = qMax(spread, 1.0);
}

void GestureStateMachine::endGesture()
{
    m_twoFingerActive = false;
    m_singlePanActive = false;
    setState(GestureState::Idle);
}

// ===== View commands =====

void GestureStateMachine::resetView(bool animated)
{
    const qreal targetZoom = 1.0;
    const QPointF targetPan = CanvasTransform::centeredPan(targetZoom, m_viewportSize, m_logicalSize);

    if (!animated) {
        setTransform(targetZoom, targetPan);
        return;
    }
    animateTo(targetZoom, targetPan);
}

void GestureStateMachine::zoomBy(qreal multiplier, bool animated)
{
    if (!std::isfinite(multiplier) || multiplier <= 0) {
        qWarning() << "[Gesture] zoomBy: ignoring invalid multiplier" << multiplier;
        return;
    }

    // Steps compound from the target of a running animation
    const CanvasTransform base = isAnimating() ? m_animationTarget : m_transform;
    const qreal nextZoom = CanvasTransform::clampZoom(base.zoom * multiplier);
    const QPointF nextPan = CanvasTransform::clampPan(base.pan(), nextZoom,
                                                      m_viewportSize, m_logicalSize);

    if (std::abs(nextZoom - base.zoom) < 0.0001 &&
        std::abs(nextPan.x() - base.panX) < 0.0001 &&
        std::abs(nextPan.y() - base.panY) < 0.0001) {
        return;
    }

    if (!animated) {
        setTransform(nextZoom, nextPan);
        return;
    }
    animateTo(nextZoom, nextPan);
}

bool GestureStateMachine::isAnimating() const
{
    return m_viewAnimation && m_viewAnimation->state() == QAbstractAnimation::Running;
}

void GestureStateMachine::stopAnimation()
{
    if (isAnimating()) {
        m_viewAnimation->stop();
    }
}

void GestureStateMachine::finishAnimation()
{
    if (!isAnimating()) {
        return;
    }
    m_viewAnimation->stop();
    applyTransform(m_animationTarget.zoom, m_animationTarget.pan());
}

// ===== Private =====

void GestureStateMachine::applyTransform(qreal zoom, const QPointF& pan)
{
    CanvasTransform next;
    next.zoom = CanvasTransform::clampZoom(zoom);

    // Without a laid-out viewport there is nothing to clamp against
    if (m_viewportSize.isEmpty() || m_logicalSize.isEmpty()) {
        next.panX = pan.x();
        next.panY = pan.y();
    } else {
        const QPointF clamped = CanvasTransform::clampPan(pan, next.zoom, m_viewportSize, m_logicalSize);
        next.panX = clamped.x();
        next.panY = clamped.y();
    }

    if (next == m_transform) {
        return;
    }
    m_transform = next;
    emit transformChanged(m_transform);
}

void GestureStateMachine::animateTo(qreal targetZoom, const QPointF& targetPan)
{
    m_viewAnimation->stop();
    m_animationStart = m_transform;
    m_animationTarget.zoom = CanvasTransform::clampZoom(targetZoom);
    m_animationTarget.panX = targetPan.x();
    m_animationTarget.panY = targetPan.y();
    m_viewAnimation->start();
}

void GestureStateMachine::onAnimationValue(const QVariant& value)
{
    if (!isAnimating()) {
        return;
    }
    const qreal t = value.toReal();
    const qreal zoom = m_animationStart.zoom + (m_animationTarget.zoom - m_animationStart.zoom) * t;
    const QPointF pan = m_animationStart.pan() + (m_animationTarget.pan() - m_animationStart.pan()) * t;
    applyTransform(zoom, pan);
}
