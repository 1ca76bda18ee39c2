#pragma once

// ============================================================================
// GestureStateMachine - Owns the canvas transform and gesture state
// ============================================================================
// Part of the ExamInk drawing engine
//
// Design:
// - Flat state enum, driven by InputDispatcher (touch count + captured tool)
// - 1 finger + Pan tool = slop-gated pan from the gesture origin
// - 2 fingers = pan by centroid translation + pinch zoom by spread ratio
// - All pan/zoom values are clamped before they are stored
// - Reset view and zoom steps animate with a fixed ease-out curve
// ============================================================================

#include "CanvasTransform.h"

#include <QObject>
#include <QPointF>
#include <QSizeF>
#include <QMetaType>

class QVariantAnimation;

/**
 * @brief Gesture states of one interaction episode.
 */
enum class GestureState {
    Idle,
    Drawing,      ///< Freehand stroke in progress
    ShapeDraft,   ///< Line/rectangle/ellipse drag in progress
    TextDraft,    ///< Text box drag in progress
    Panning,      ///< View is being panned (1 or 2 fingers)
    Zooming       ///< Two-finger pinch has changed the scale
};

Q_DECLARE_METATYPE(GestureState)

/**
 * @brief Owns the pan/zoom transform and runs the navigation algorithms.
 *
 * The transform has a single writer: gesture updates from InputDispatcher and
 * view commands (resetView, zoomBy) all go through this class.
 */
class GestureStateMachine : public QObject
{
    Q_OBJECT

public:
    explicit GestureStateMachine(QObject* parent = nullptr);
    ~GestureStateMachine() override;

    // ===== Geometry =====

    /**
     * @brief Set the viewport size (widget size in logical pixels).
     *
     * Re-clamps the current pan.
     */
    void setViewportSize(const QSizeF& size);
    QSizeF viewportSize() const { return m_viewportSize; }

    /**
     * @brief Set the logical canvas size (drawing area at zoom 1).
     */
    void setLogicalSize(const QSizeF& size);
    QSizeF logicalSize() const { return m_logicalSize; }

    // ===== State =====

    const CanvasTransform& transform() const { return m_transform; }
    qreal zoom() const { return m_transform.zoom; }
    QPointF pan() const { return m_transform.pan(); }

    GestureState state() const { return m_state; }

    /**
     * @brief Set the gesture state.
     *
     * Called by InputDispatcher for the content states (Drawing, ShapeDraft,
     * TextDraft) and for Idle at episode end. Pan/zoom states are entered by
     * the gesture methods below.
     */
    void setState(GestureState state);

    /**
     * @brief Replace the transform (clamped). Stops any running animation.
     */
    void setTransform(qreal zoom, const QPointF& pan);

    // ===== Single-finger pan =====

    /**
     * @brief Start a pan tool gesture at a viewport position.
     *
     * No pan is applied until the finger has moved TOUCH_SLOP pixels.
     */
    void beginSingleFingerPan(const QPointF& viewportPos);

    /**
     * @brief Update a pan tool gesture.
     * @return True if the slop has been exceeded and pan was applied.
     */
    bool updateSingleFingerPan(const QPointF& viewportPos);

    /**
     * @brief Whether the current single-finger pan has passed the touch slop.
     */
    bool singleFingerPanActive() const { return m_singlePanActive; }

    // ===== Two-finger pan/zoom =====

    /**
     * @brief Start a two-finger gesture.
     * @param centroid Centroid of the touch points (viewport coords).
     * @param spread Distance between the first two touch points.
     */
    void beginTwoFinger(const QPointF& centroid, qreal spread);

    /**
     * @brief Update a two-finger gesture.
     *
     * pan = panAtStart + (centroid - centroidAtStart), zoom = zoomAtStart *
     * spread / spreadAtStart; pan is clamped against the new zoom.
     */
    void updateTwoFinger(const QPointF& centroid, qreal spread);

    /**
     * @brief Restart the two-finger reference from the current transform.
     *
     * Called when fingers are added or lifted mid-gesture: the centroid and
     * spread jump with the finger set, so they become the new start values
     * while zoom and pan stay where they are. State is left unchanged.
     */
    void rebaseTwoFinger(const QPointF& centroid, qreal spread);

    /**
     * @brief End the current gesture and return to Idle.
     */
    void endGesture();

    // ===== View commands =====

    /**
     * @brief Animate to zoom 1 with the canvas centered.
     * @param animated False applies the target immediately.
     */
    void resetView(bool animated = true);

    /**
     * @brief Multiply the zoom (e.g. 1.2 or 1/1.2), clamp and animate.
     *
     * No-op if neither zoom nor pan would change.
     */
    void zoomBy(qreal multiplier, bool animated = true);

    bool isAnimating() const;

    /**
     * @brief Stop a running animation, keeping the intermediate transform.
     */
    void stopAnimation();

    /**
     * @brief Jump a running animation to its target.
     */
    void finishAnimation();

    // ===== Constants =====
    static constexpr qreal TOUCH_SLOP = 5.0;                ///< Logical px before 1-finger pan starts
    static constexpr qreal ZOOM_STEP = 1.2;                 ///< Zoom button multiplier
    static constexpr qreal ZOOM_ACTIVATION_THRESHOLD = 0.02; ///< Scale change that classifies a 2-finger gesture as zoom
    static constexpr int VIEW_ANIMATION_MS = 220;

signals:
    void transformChanged(const CanvasTransform& transform);
    void stateChanged(GestureState state);

private:
    void applyTransform(qreal zoom, const QPointF& pan);
    void animateTo(qreal targetZoom, const QPointF& targetPan);
    void onAnimationValue(const QVariant& value);

    CanvasTransform m_transform;
    QSizeF m_viewportSize;
    QSizeF m_logicalSize;
    GestureState m_state = GestureState::Idle;

    // Single-finger pan
    QPointF m_singlePanStart;       ///< Finger position at gesture start
    QPointF m_singlePanOrigin;      ///< Pan at gesture start
    bool m_singlePanActive = false;

    // Two-finger gesture
    QPointF m_twoFingerStartCentroid;
    QPointF m_twoFingerStartPan;
    qreal m_twoFingerStartZoom = 1.0;
    qreal m_twoFingerStartSpread = 0;
    bool m_twoFingerActive = false;

    // View animation
    QVariantAnimation* m_viewAnimation = nullptr;
    CanvasTransform m_animationStart;
    CanvasTransform m_animationTarget;
};
