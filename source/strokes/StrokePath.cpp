#include "StrokePath.h"

#include <QSet>

namespace StrokePath {

QPainterPath buildSmoothPath(const QVector<QPointF>& points)
{
    QPainterPath path;
    const int n = points.size();
    if (n == 0) {
        return path;
    }

    path.moveTo(points[0]);
    if (n == 1) {
        // Dot: the consumer draws a round cap at the single point
        return path;
    }
    if (n == 2) {
        path.lineTo(points[1]);
        return path;
    }

    // Each interior point is the control point of a curve ending at the
    // midpoint to its successor
    for (int i = 1; i < n - 1; ++i) {
        const QPointF& current = points[i];
        const QPointF& next = points[i + 1];
        path.quadTo(current, (current + next) / 2.0);
    }
    path.quadTo(points[n - 2], points[n - 1]);
    return path;
}

QPainterPath buildPreviewPath(const QVector<QPointF>& points, int windowSize)
{
    QPainterPath path;
    const int n = points.size();
    if (n < 2 || windowSize < 2) {
        return path;
    }

    const int startIndex = n > windowSize ? n - windowSize : 0;
    path.moveTo(points[startIndex]);
    for (int i = startIndex + 1; i < n; ++i) {
        path.lineTo(points[i]);
    }
    return path;
}

QPainterPath buildShapePreviewPath(ShapeKind kind, const QPointF& start, const QPointF& current)
{
    QPainterPath path;
    switch (kind) {
        case ShapeKind::Line:
            path.moveTo(start);
            path.lineTo(current);
            break;
        case ShapeKind::Rectangle:
            path.addRect(QRectF(start, current).normalized());
            break;
        case ShapeKind::Ellipse:
            path.addEllipse(QRectF(start, current).normalized());
            break;
        case ShapeKind::None:
            break;
    }
    return path;
}

QPainterPath buildLinePath(const CanvasLine& line)
{
    if (line.isShape()) {
        return buildShapePreviewPath(line.shapeKind, line.bounds.start(), line.bounds.end());
    }
    return buildSmoothPath(line.points);
}

} // namespace StrokePath

// ===== LinePathCache =====

const QPainterPath& LinePathCache::pathFor(const CanvasLine& line)
{
    const int version = versionOf(line);
    auto it = m_entries.find(line.id);
    if (it == m_entries.end() || it->version != version) {
        Entry entry;
        entry.path = StrokePath::buildLinePath(line);
        entry.version = version;
        it = m_entries.insert(line.id, entry);
    }
    return it->path;
}

void LinePathCache::store(const CanvasLine& line, const QPainterPath& path)
{
    Entry entry;
    entry.path = path;
    entry.version = versionOf(line);
    m_entries.insert(line.id, entry);
}

void LinePathCache::retainOnly(const QVector<CanvasLine>& lines)
{
    QSet<QString> liveIds;
    liveIds.reserve(lines.size());
    for (const CanvasLine& line : lines) {
        liveIds.insert(line.id);
    }

    for (auto it = m_entries.begin(); it != m_entries.end(); ) {
        if (!liveIds.contains(it.key())) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
}
