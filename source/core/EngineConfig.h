#pragma once

// ============================================================================
// EngineConfig - Construction-time configuration of the drawing engine
// ============================================================================
// Part of the ExamInk drawing engine
// ============================================================================

#include "ToolType.h"
#include "../strokes/CanvasLine.h"
#include "../strokes/TextAnnotation.h"
#include "../sync/CanvasSnapshot.h"

#include <QColor>
#include <QVector>
#include <functional>

/**
 * @brief Initial content, style choices and snapshot callbacks.
 *
 * Unset values are filled in by normalized(): an invalid initialColor
 * becomes the first palette entry, a non-positive initialThickness becomes
 * the second thickness option.
 */
struct EngineConfig {
    QVector<CanvasLine> initialLines;
    QVector<TextAnnotation> initialTextAnnotations;

    ToolType initialTool = ToolType::Pencil;
    QColor initialColor;                ///< Invalid = palette[0]
    qreal initialThickness = 0;         ///< <= 0 = thicknessOptions[1]
    qreal initialTextFontSize = 24.0;

    QVector<QColor> colorPalette = defaultPalette();
    QVector<qreal> thicknessOptions = defaultThicknessOptions();

    std::function<void(const CanvasSnapshot&)> onChange;   ///< Commit-tier updates
    std::function<void(const CanvasSnapshot&)> onExit;     ///< Called once at teardown

    static QVector<QColor> defaultPalette() {
        return {QColor("#111827"), QColor("#ef4444"), QColor("#22c55e"),
                QColor("#3b82f6"), QColor("#f59e0b"), QColor("#a855f7")};
    }

    static QVector<qreal> defaultThicknessOptions() {
        return {2, 4, 6, 10, 16};
    }

    /**
     * @brief Copy with defaults applied to every unset field.
     */
    EngineConfig normalized() const {
        EngineConfig c = *this;
        if (c.colorPalette.isEmpty()) {
            c.colorPalette = defaultPalette();
        }
        if (c.thicknessOptions.isEmpty()) {
            c.thicknessOptions = defaultThicknessOptions();
        }
        if (!c.initialColor.isValid()) {
            c.initialColor = c.colorPalette.first();
        }
        if (c.initialThickness <= 0) {
            c.initialThickness = c.thicknessOptions.size() > 1 ? c.thicknessOptions.at(1)
                                                               : c.thicknessOptions.first();
        }
        if (c.initialTextFontSize <= 0) {
            c.initialTextFontSize = 24.0;
        }
        return c;
    }
};
