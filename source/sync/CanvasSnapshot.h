#pragma once

// ============================================================================
// CanvasSnapshot - Externally consumable projection of engine state
// ============================================================================
// Part of the ExamInk drawing engine
//
// A plain value type. Qt containers are implicitly shared, so copies are
// cheap and consumers never alias engine-owned state.
// ============================================================================

#include "../core/ToolType.h"
#include "../strokes/CanvasLine.h"
#include "../strokes/TextAnnotation.h"

#include <QColor>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>
#include <QMetaType>

struct CanvasSnapshot {
    QVector<CanvasLine> lines;
    QVector<TextAnnotation> textAnnotations;
    ToolType tool = ToolType::Pencil;
    QColor color;
    qreal thickness = 4.0;
    qreal canvasWidth = 0;
    qreal canvasHeight = 0;

    bool isEmpty() const { return lines.isEmpty() && textAnnotations.isEmpty(); }

    bool operator==(const CanvasSnapshot& other) const {
        return lines == other.lines && textAnnotations == other.textAnnotations &&
               tool == other.tool && color == other.color &&
               thickness == other.thickness &&
               canvasWidth == other.canvasWidth && canvasHeight == other.canvasHeight;
    }
    bool operator!=(const CanvasSnapshot& other) const { return !(*this == other); }

    QJsonObject toJson() const {
        QJsonObject obj;
        QJsonArray linesArray;
        for (const CanvasLine& line : lines) {
            linesArray.append(line.toJson());
        }
        obj["lines"] = linesArray;

        QJsonArray textArray;
        for (const TextAnnotation& text : textAnnotations) {
            textArray.append(text.toJson());
        }
        obj["textAnnotations"] = textArray;

        obj["tool"] = toolTypeName(tool);
        obj["color"] = color.name(QColor::HexRgb);
        obj["thickness"] = thickness;
        obj["canvasWidth"] = canvasWidth;
        obj["canvasHeight"] = canvasHeight;
        return obj;
    }

    /**
     * @brief Deserialize a snapshot.
     *
     * Missing fields keep their defaults; an invalid color is left invalid
     * so the caller can substitute its own default.
     */
    static CanvasSnapshot fromJson(const QJsonObject& obj) {
        CanvasSnapshot snap;
        const QJsonArray linesArray = obj["lines"].toArray();
        snap.lines.reserve(linesArray.size());
        for (const auto& val : linesArray) {
            if (val.isObject()) {
                snap.lines.append(CanvasLine::fromJson(val.toObject()));
            }
        }

        const QJsonArray textArray = obj["textAnnotations"].toArray();
        snap.textAnnotations.reserve(textArray.size());
        for (const auto& val : textArray) {
            if (val.isObject()) {
                snap.textAnnotations.append(TextAnnotation::fromJson(val.toObject()));
            }
        }

        snap.tool = toolTypeFromName(obj["tool"].toString());
        snap.color = QColor(obj["color"].toString());
        snap.thickness = obj["thickness"].toDouble(4.0);
        snap.canvasWidth = obj["canvasWidth"].toDouble();
        snap.canvasHeight = obj["canvasHeight"].toDouble();
        return snap;
    }
};

Q_DECLARE_METATYPE(CanvasSnapshot)
