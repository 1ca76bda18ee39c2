#pragma once

// ============================================================================
// SnapshotFile - JSON file load/save for canvas snapshots
// ============================================================================
// Part of the ExamInk drawing engine
// Used by the host for --input/--output; the engine itself does no I/O.
// ============================================================================

#include "CanvasSnapshot.h"

#include <QString>

namespace SnapshotFile {

/**
 * @brief Read a snapshot from a JSON file.
 * @param path File to read.
 * @param out Receives the snapshot on success.
 * @return False (with a warning logged) if the file cannot be read or parsed.
 */
bool load(const QString& path, CanvasSnapshot& out);

/**
 * @brief Write a snapshot as indented JSON.
 * @return False (with a warning logged) on any write failure.
 */
bool save(const CanvasSnapshot& snapshot, const QString& path);

} // namespace SnapshotFile
