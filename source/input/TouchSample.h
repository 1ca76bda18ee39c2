#pragma once

// ============================================================================
// TouchSample - Platform-neutral touch input sample
// ============================================================================
// Part of the ExamInk drawing engine
//
// Phases follow QTouchEvent: Start is the first finger down, Move reports
// any change (including fingers added or lifted), End is the last finger up.
// ============================================================================

#include <QPointF>
#include <QtGlobal>
#include <cmath>

/**
 * @brief One raw touch sample as delivered by the host.
 */
struct TouchSample {
    enum Phase { Start, Move, End, Cancel };

    Phase phase = Move;
    QPointF position;           ///< Viewport coords; centroid when several fingers are down
    qreal fingerSpread = 0;     ///< Distance between the first two fingers (0 for one finger)
    int activeFingerCount = 1;  ///< Fingers currently in contact
    qint64 timestampMs = 0;     ///< Event time, used for tap detection

    /**
     * @brief Check that the sample carries usable numbers.
     */
    bool isValid() const {
        return std::isfinite(position.x()) && std::isfinite(position.y()) &&
               std::isfinite(fingerSpread) && fingerSpread >= 0 &&
               activeFingerCount >= 0;
    }

    bool isMultiFinger() const { return activeFingerCount >= 2; }

    static TouchSample make(Phase phase, const QPointF& pos, int fingers = 1,
                            qint64 timestampMs = 0, qreal spread = 0) {
        TouchSample s;
        s.phase = phase;
        s.position = pos;
        s.activeFingerCount = fingers;
        s.timestampMs = timestampMs;
        s.fingerSpread = spread;
        return s;
    }
};
