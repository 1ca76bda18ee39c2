#include "SnapshotSync.h"

#include <QDebug>

SnapshotSync::SnapshotSync(QObject* parent, int frameMs)
    : QObject(parent)
{
    m_snapshots = std::make_unique<FrameCoalescer<CanvasSnapshot>>(
        [this](const CanvasSnapshot& snapshot) {
            m_lastDelivered = snapshot;
            emit snapshotReady(snapshot);
        }, this, frameMs);

    m_viewStates = std::make_unique<FrameCoalescer<CanvasTransform>>(
        [this](const CanvasTransform& transform) {
            emit viewStateReady(transform);
        }, this, frameMs);

    m_previewFrames = std::make_unique<FrameCoalescer<quint64>>(
        [this](const quint64& gestureId) {
            emit previewFrameReady(gestureId);
        }, this, frameMs);
}

SnapshotSync::~SnapshotSync()
{
    // Coalescers stop their timers before the QObject children go away
    m_previewFrames.reset();
    m_viewStates.reset();
    m_snapshots.reset();
}

void SnapshotSync::scheduleSnapshot(const CanvasSnapshot& snapshot)
{
    if (m_exited) {
        return;
    }
    m_snapshots->update(snapshot);
}

void SnapshotSync::scheduleViewState(const CanvasTransform& transform)
{
    if (m_exited) {
        return;
    }
    m_viewStates->update(transform);
}

void SnapshotSync::schedulePreviewFrame(quint64 gestureId)
{
    if (m_exited) {
        return;
    }
    m_previewFrames->update(gestureId);
}

void SnapshotSync::cancelPreviewFrame()
{
    m_previewFrames->cancel();
}

void SnapshotSync::flushAll()
{
    if (m_exited) {
        return;
    }
    m_previewFrames->flush();
    m_viewStates->flush();
    m_snapshots->flush();
}

bool SnapshotSync::exit(const CanvasSnapshot& finalSnapshot)
{
    if (m_exited) {
        qWarning() << "[Snapshot] exit() called more than once, ignoring";
        return false;
    }
    m_exited = true;

    m_previewFrames->cancel();
    m_viewStates->cancel();
    m_snapshots->cancel();

    m_lastDelivered = finalSnapshot;
    emit exitSnapshotReady(finalSnapshot);
    return true;
}
