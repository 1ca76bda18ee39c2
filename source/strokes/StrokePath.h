#pragma once

// ============================================================================
// StrokePath - Path construction for strokes, shapes and previews
// ============================================================================
// Part of the ExamInk drawing engine
//
// Two path flavors exist for freehand ink:
// - Preview: polyline over a sliding window of the most recent points,
//   rebuilt on every input sample (cost bounded by the window size)
// - Smoothed: quadratic midpoint curve over the complete point list,
//   built once when the stroke is committed
// ============================================================================

#include "CanvasLine.h"

#include <QPainterPath>
#include <QHash>
#include <QVector>
#include <QPointF>

namespace StrokePath {

/// Number of trailing points used by the live preview path.
constexpr int PREVIEW_WINDOW_SIZE = 100;

/**
 * @brief Build the smoothed path for a complete freehand stroke.
 * @param points All retained points of the stroke.
 * @return Empty path for no points, a single moveTo for a dot, a straight
 *         segment for two points, quadratic midpoint curves otherwise.
 */
QPainterPath buildSmoothPath(const QVector<QPointF>& points);

/**
 * @brief Build the live preview polyline from the last PREVIEW_WINDOW_SIZE points.
 * @return Empty path if fewer than two points are available.
 */
QPainterPath buildPreviewPath(const QVector<QPointF>& points,
                              int windowSize = PREVIEW_WINDOW_SIZE);

/**
 * @brief Build the outline of an in-progress shape drag.
 */
QPainterPath buildShapePreviewPath(ShapeKind kind, const QPointF& start, const QPointF& current);

/**
 * @brief Build the final path for a committed line (shape or freehand).
 */
QPainterPath buildLinePath(const CanvasLine& line);

} // namespace StrokePath

/**
 * @brief Cache of rendered paths for committed lines.
 *
 * Keyed by line id. An entry is valid while the line's point count matches
 * the version it was built at; shapes always have version 0.
 */
class LinePathCache {
public:
    /**
     * @brief Get the path for a line, rebuilding it if missing or stale.
     */
    const QPainterPath& pathFor(const CanvasLine& line);

    /**
     * @brief Store a path already built for a line (e.g. at commit time).
     */
    void store(const CanvasLine& line, const QPainterPath& path);

    /**
     * @brief Drop the cached path of one line.
     */
    void invalidate(const QString& lineId) { m_entries.remove(lineId); }

    /**
     * @brief Drop every entry whose id is not in the given set of lines.
     */
    void retainOnly(const QVector<CanvasLine>& lines);

    void clear() { m_entries.clear(); }

    int size() const { return m_entries.size(); }
    bool contains(const QString& lineId) const { return m_entries.contains(lineId); }

private:
    static int versionOf(const CanvasLine& line) { return line.isShape() ? 0 : line.points.size(); }

    struct Entry {
        QPainterPath path;
        int version = -1;
    };
    QHash<QString, Entry> m_entries;
};
