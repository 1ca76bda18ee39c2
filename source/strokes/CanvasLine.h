#pragma once

// ============================================================================
// CanvasLine - A committed freehand stroke or shape
// ============================================================================
// Part of the ExamInk drawing engine
// Freehand lines carry a point list; shapes carry only their drag bounds.
// ============================================================================

#include "../core/ToolType.h"

#include <QString>
#include <QVector>
#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QJsonObject>
#include <QJsonArray>
#include <QUuid>

/**
 * @brief Shape classification for a CanvasLine.
 */
enum class ShapeKind {
    None,       ///< Freehand stroke (points are authoritative)
    Line,
    Rectangle,
    Ellipse
};

inline QString shapeKindName(ShapeKind kind)
{
    switch (kind) {
        case ShapeKind::Line:      return QStringLiteral("line");
        case ShapeKind::Rectangle: return QStringLiteral("rectangle");
        case ShapeKind::Ellipse:   return QStringLiteral("ellipse");
        case ShapeKind::None:      break;
    }
    return QString();
}

inline ShapeKind shapeKindFromName(const QString& name)
{
    if (name == QLatin1String("line"))      return ShapeKind::Line;
    if (name == QLatin1String("rectangle")) return ShapeKind::Rectangle;
    if (name == QLatin1String("ellipse"))   return ShapeKind::Ellipse;
    return ShapeKind::None;
}

inline ShapeKind shapeKindForTool(ToolType tool)
{
    switch (tool) {
        case ToolType::Line:      return ShapeKind::Line;
        case ToolType::Rectangle: return ShapeKind::Rectangle;
        case ToolType::Ellipse:   return ShapeKind::Ellipse;
        default:                  return ShapeKind::None;
    }
}

/**
 * @brief Drag bounds of a shape: the gesture start and end points.
 *
 * Not normalized; x1/y1 is always where the drag started.
 */
struct LineBounds {
    qreal x1 = 0;
    qreal y1 = 0;
    qreal x2 = 0;
    qreal y2 = 0;

    QPointF start() const { return QPointF(x1, y1); }
    QPointF end() const { return QPointF(x2, y2); }

    /**
     * @brief Normalized rectangle (min corner, absolute size).
     */
    QRectF normalizedRect() const {
        return QRectF(QPointF(qMin(x1, x2), qMin(y1, y2)),
                      QPointF(qMax(x1, x2), qMax(y1, y2)));
    }

    bool operator==(const LineBounds& other) const {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }
    bool operator!=(const LineBounds& other) const { return !(*this == other); }
};

/**
 * @brief A committed drawing object: a freehand stroke or a shape.
 *
 * All coordinates are logical canvas coordinates (pan/zoom already removed).
 */
struct CanvasLine {
    QString id;                     ///< UUID for tracking (used by history and path cache)
    ToolType tool = ToolType::Pencil;
    QColor color;
    qreal thickness = 4.0;
    QVector<QPointF> points;        ///< Freehand points (empty for shapes)
    ShapeKind shapeKind = ShapeKind::None;
    LineBounds bounds;              ///< Valid only when hasBounds()

    bool isShape() const { return shapeKind != ShapeKind::None; }
    bool hasBounds() const { return isShape(); }

    /**
     * @brief Create a line with a fresh UUID.
     */
    static QString createId() {
        return QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    bool operator==(const CanvasLine& other) const {
        return id == other.id && tool == other.tool && color == other.color &&
               thickness == other.thickness && points == other.points &&
               shapeKind == other.shapeKind && bounds == other.bounds;
    }
    bool operator!=(const CanvasLine& other) const { return !(*this == other); }

    /**
     * @brief Serialize to JSON.
     * @return JSON object with id, tool, color, thickness, points and, for
     *         shapes, shape + bounds.
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["id"] = id;
        obj["tool"] = toolTypeName(tool);
        obj["color"] = color.name(QColor::HexRgb);
        obj["thickness"] = thickness;
        QJsonArray pointsArray;
        for (const QPointF& pt : points) {
            QJsonObject p;
            p["x"] = pt.x();
            p["y"] = pt.y();
            pointsArray.append(p);
        }
        obj["points"] = pointsArray;
        if (isShape()) {
            obj["shape"] = shapeKindName(shapeKind);
            QJsonObject b;
            b["x1"] = bounds.x1;
            b["y1"] = bounds.y1;
            b["x2"] = bounds.x2;
            b["y2"] = bounds.y2;
            obj["bounds"] = b;
        }
        return obj;
    }

    /**
     * @brief Deserialize from JSON.
     *
     * Missing ids are regenerated. A shape without bounds falls back to its
     * first and last point.
     */
    static CanvasLine fromJson(const QJsonObject& obj) {
        CanvasLine line;
        line.id = obj["id"].toString();
        if (line.id.isEmpty()) {
            line.id = createId();
        }
        line.tool = toolTypeFromName(obj["tool"].toString());
        line.color = QColor(obj["color"].toString());
        if (!line.color.isValid()) {
            line.color = Qt::black;
        }
        line.thickness = obj["thickness"].toDouble(4.0);

        const QJsonArray pointsArray = obj["points"].toArray();
        for (const auto& val : pointsArray) {
            const QJsonObject p = val.toObject();
            line.points.append(QPointF(p["x"].toDouble(), p["y"].toDouble()));
        }

        line.shapeKind = shapeKindFromName(obj["shape"].toString());
        if (line.isShape()) {
            if (obj.contains("bounds")) {
                const QJsonObject b = obj["bounds"].toObject();
                line.bounds = {b["x1"].toDouble(), b["y1"].toDouble(),
                               b["x2"].toDouble(), b["y2"].toDouble()};
            } else if (!line.points.isEmpty()) {
                const QPointF s = line.points.first();
                const QPointF e = line.points.last();
                line.bounds = {s.x(), s.y(), e.x(), e.y()};
            }
            line.points.clear();
        }
        return line;
    }
};
