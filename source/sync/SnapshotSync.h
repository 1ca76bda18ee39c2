#pragma once

// ============================================================================
// SnapshotSync - Commit tier of the dual-rate sync
// ============================================================================
// Part of the ExamInk drawing engine
//
// The interaction tier (transform, preview path, drafts) is read directly
// from the engine on every sample. This class carries the slower tier:
// - Snapshot: committed content + style, coalesced to one delivery per frame
// - View state: the transform, coalesced the same way
// - Preview frame: repaint requests during a gesture, dropped on cancel
// After exit() nothing else is delivered.
// ============================================================================

#include "CanvasSnapshot.h"
#include "FrameCoalescer.h"
#include "../core/CanvasTransform.h"

#include <QObject>
#include <memory>

class SnapshotSync : public QObject
{
    Q_OBJECT

public:
    explicit SnapshotSync(QObject* parent = nullptr, int frameMs = FrameCoalescer<CanvasSnapshot>::DEFAULT_FRAME_MS);
    ~SnapshotSync() override;

    /**
     * @brief Schedule a snapshot; replaces any snapshot not yet delivered.
     */
    void scheduleSnapshot(const CanvasSnapshot& snapshot);

    /**
     * @brief Schedule a view state delivery.
     */
    void scheduleViewState(const CanvasTransform& transform);

    /**
     * @brief Schedule a repaint of the live preview for a gesture.
     */
    void schedulePreviewFrame(quint64 gestureId);

    /**
     * @brief Drop a preview frame that has not been delivered yet.
     */
    void cancelPreviewFrame();

    /**
     * @brief Deliver everything that is pending right now.
     */
    void flushAll();

    /**
     * @brief Deliver the final snapshot exactly once.
     *
     * Pending preview and view state frames are dropped, a pending snapshot
     * is superseded by @p finalSnapshot.
     * @return False if exit was already delivered.
     */
    bool exit(const CanvasSnapshot& finalSnapshot);

    bool hasExited() const { return m_exited; }
    bool hasPendingSnapshot() const { return m_snapshots->hasPending(); }
    bool hasPendingViewState() const { return m_viewStates->hasPending(); }
    bool hasPendingPreviewFrame() const { return m_previewFrames->hasPending(); }

    /**
     * @brief Last snapshot delivered through snapshotReady().
     */
    const CanvasSnapshot& lastDelivered() const { return m_lastDelivered; }
    int snapshotDeliveryCount() const { return m_snapshots->deliveryCount(); }

signals:
    void snapshotReady(const CanvasSnapshot& snapshot);
    void viewStateReady(const CanvasTransform& transform);
    void previewFrameReady(quint64 gestureId);
    void exitSnapshotReady(const CanvasSnapshot& snapshot);

private:
    std::unique_ptr<FrameCoalescer<CanvasSnapshot>> m_snapshots;
    std::unique_ptr<FrameCoalescer<CanvasTransform>> m_viewStates;
    std::unique_ptr<FrameCoalescer<quint64>> m_previewFrames;
    CanvasSnapshot m_lastDelivered;
    bool m_exited = false;
};
