#pragma once

// ============================================================================
// TextAnnotation - A committed text box on the canvas
// ============================================================================
// Part of the ExamInk drawing engine
// ============================================================================

#include <QString>
#include <QColor>
#include <QRectF>
#include <QJsonObject>
#include <QUuid>

/**
 * @brief A text box in logical canvas coordinates.
 *
 * The rectangle is always normalized (x/y is the min corner) and at least
 * MIN_WIDTH x MIN_HEIGHT.
 */
struct TextAnnotation {
    QString id;
    qreal x = 0;
    qreal y = 0;
    qreal width = MIN_WIDTH;
    qreal height = MIN_HEIGHT;
    QString text;
    qreal fontSize = 24.0;
    QColor color;

    static constexpr qreal MIN_WIDTH = 100.0;
    static constexpr qreal MIN_HEIGHT = 40.0;

    QRectF rect() const { return QRectF(x, y, width, height); }

    /**
     * @brief Build an annotation from a drag rectangle.
     * @param start Drag start point.
     * @param end Drag end point.
     *
     * Normalizes the rectangle and applies the minimum size.
     */
    static TextAnnotation fromDrag(const QPointF& start, const QPointF& end) {
        TextAnnotation t;
        t.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        t.x = qMin(start.x(), end.x());
        t.y = qMin(start.y(), end.y());
        t.width = qMax(qAbs(end.x() - start.x()), MIN_WIDTH);
        t.height = qMax(qAbs(end.y() - start.y()), MIN_HEIGHT);
        return t;
    }

    bool operator==(const TextAnnotation& other) const {
        return id == other.id && x == other.x && y == other.y &&
               width == other.width && height == other.height &&
               text == other.text && fontSize == other.fontSize && color == other.color;
    }
    bool operator!=(const TextAnnotation& other) const { return !(*this == other); }

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["id"] = id;
        obj["x"] = x;
        obj["y"] = y;
        obj["width"] = width;
        obj["height"] = height;
        obj["text"] = text;
        obj["fontSize"] = fontSize;
        obj["color"] = color.name(QColor::HexRgb);
        return obj;
    }

    static TextAnnotation fromJson(const QJsonObject& obj) {
        TextAnnotation t;
        // Older payloads used numeric ids
        const QJsonValue idValue = obj["id"];
        if (idValue.isDouble()) {
            t.id = QString::number(static_cast<qint64>(idValue.toDouble()));
        } else {
            t.id = idValue.toString();
        }
        if (t.id.isEmpty()) {
            t.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        }
        t.x = obj["x"].toDouble();
        t.y = obj["y"].toDouble();
        t.width = obj["width"].toDouble(MIN_WIDTH);
        t.height = obj["height"].toDouble(MIN_HEIGHT);
        t.text = obj["text"].toString();
        t.fontSize = obj["fontSize"].toDouble(24.0);
        t.color = QColor(obj["color"].toString());
        if (!t.color.isValid()) {
            t.color = Qt::black;
        }
        return t;
    }
};
