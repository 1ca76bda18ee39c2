#pragma once

// ============================================================================
// InputDispatcher - Classifies touch samples and routes them
// ============================================================================
// Part of the ExamInk drawing engine
//
// Design:
// - One episode per contact sequence (Start ... End/Cancel)
// - The tool and style are captured at Start and kept for the whole episode
// - 1 finger: routed to the captured tool (ink, shape, text or slop-gated pan)
// - 2+ fingers: the episode becomes multi-touch for good; any draft is
//   discarded and the gesture drives pan/pinch-zoom until the last finger lifts
// - A change in finger count re-bases the pinch so the view does not jump
// - Two quick taps in place reset the view, whatever the tool; the dot left
//   by the first tap is retracted and the second tap commits nothing
// - Samples outside an episode (or of a cancelled one) are ignored
// ============================================================================

#include "TouchSample.h"
#include "../core/ToolType.h"
#include "../strokes/CanvasLine.h"

#include <QObject>
#include <QColor>
#include <QPainterPath>
#include <QRectF>

class GestureStateMachine;
class StrokeBuilder;

/**
 * @brief Tool and style used for new content.
 */
struct ToolStyle {
    ToolType tool = ToolType::Pencil;
    QColor color;
    qreal thickness = 4.0;
};

/**
 * @brief Routes raw touch samples to the gesture state machine and builder.
 */
class InputDispatcher : public QObject
{
    Q_OBJECT

public:
    /**
     * @param gestures Transform owner (not owned).
     * @param builder Draft builder (not owned).
     */
    InputDispatcher(GestureStateMachine* gestures, StrokeBuilder* builder, QObject* parent = nullptr);
    ~InputDispatcher() override = default;

    /**
     * @brief Process one touch sample.
     * @return True if the sample was consumed.
     */
    bool handleTouch(const TouchSample& sample);

    /**
     * @brief Tool and style that the next episode will capture.
     */
    void setStyle(const ToolStyle& style) { m_style = style; }
    const ToolStyle& style() const { return m_style; }

    /**
     * @brief Abort the running episode, discarding its drafts.
     *
     * Further Move/End samples of that episode are ignored.
     * @return True if an episode was running.
     */
    bool cancelEpisode();

    bool isEpisodeActive() const { return m_episode.active; }
    bool isMultiTouchEpisode() const { return m_episode.active && m_episode.multiTouch; }

    /**
     * @brief Tool captured by the running episode (valid while active).
     */
    ToolType capturedTool() const { return m_episode.style.tool; }
    quint64 currentGestureId() const { return m_episode.active ? m_episode.id : 0; }

    // ===== Constants =====
    static constexpr qint64 TAP_MAX_DURATION_MS = 250;
    static constexpr qint64 DOUBLE_TAP_INTERVAL_MS = 300;
    static constexpr qreal DOUBLE_TAP_MAX_DISTANCE = 20.0;

signals:
    /**
     * @brief A freehand stroke or shape finished and should be committed.
     * @param smoothedPath Smoothed path for freehand lines, empty for shapes.
     */
    void lineFinished(const CanvasLine& line, const QPainterPath& smoothedPath);

    /**
     * @brief A text box drag ended; the host should ask for its content.
     * @param canvasRect Draft rectangle in canvas coordinates.
     */
    void textInputRequested(const QRectF& canvasRect);

    /**
     * @brief Preview path, shape preview or text rect changed.
     */
    void draftChanged(quint64 gestureId);

    /**
     * @brief A draft was discarded without being committed.
     */
    void draftCancelled();

    /**
     * @brief Two taps in place reset the view.
     * @param discardedLineId Id of the dot committed by the first tap, empty
     *        if the first tap committed nothing.
     */
    void doubleTapRecognized(const QString& discardedLineId);

private:
    struct Episode {
        quint64 id = 0;
        bool active = false;
        bool multiTouch = false;
        ToolStyle style;                ///< Captured at Start
        QPointF startViewportPos;
        qint64 startMs = 0;
        bool exceededSlop = false;
        int fingerCount = 0;            ///< Fingers in contact at the last sample
    };

    struct TapRecord {
        bool valid = false;
        QPointF position;
        qint64 endMs = 0;
        QString lineId;                 ///< Line committed by this tap, if any
    };

    void beginEpisode(const TouchSample& sample);
    void beginSingleFinger(const TouchSample& sample);
    void updateSingleFinger(const TouchSample& sample);
    void finishSingleFinger(const TouchSample& sample);
    void enterMultiTouch(const TouchSample& sample);
    void finishEpisode();
    bool isTap(const TouchSample& sample) const;
    bool completesDoubleTap(const TouchSample& sample) const;
    void finishDoubleTap();
    void recordTap(const TouchSample& sample, const QString& lineId);

    QPointF toCanvas(const QPointF& viewportPos) const;

    GestureStateMachine* m_gestures;    ///< Not owned
    StrokeBuilder* m_builder;           ///< Not owned

    ToolStyle m_style;
    Episode m_episode;
    TapRecord m_lastTap;
    quint64 m_nextGestureId = 1;
};
