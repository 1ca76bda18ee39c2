#pragma once

// ============================================================================
// CanvasSettings - Persisted user preferences for the canvas
// ============================================================================
// Part of the ExamInk drawing engine
// Stores the last tool, color, thickness and text size in QSettings.
// ============================================================================

#include "EngineConfig.h"
#include "ToolType.h"

#include <QColor>
#include <QString>

class CanvasSettings
{
public:
    /**
     * @param organization QSettings organization name.
     * @param application QSettings application name.
     */
    explicit CanvasSettings(const QString& organization = QStringLiteral("ExamInk"),
                            const QString& application = QStringLiteral("App"));

    /**
     * @brief Read preferences; invalid or missing values fall back to defaults.
     */
    void load();

    /**
     * @brief Write the current preferences.
     */
    void save() const;

    /**
     * @brief Take tool and style from an exit snapshot and save them.
     */
    void saveFromSnapshot(const CanvasSnapshot& snapshot);

    /**
     * @brief Build an engine config seeded with these preferences.
     */
    EngineConfig toEngineConfig() const;

    ToolType tool() const { return m_tool; }
    void setTool(ToolType tool) { m_tool = tool; }

    QColor color() const { return m_color; }
    void setColor(const QColor& color);

    qreal thickness() const { return m_thickness; }
    void setThickness(qreal thickness);

    qreal textFontSize() const { return m_textFontSize; }
    void setTextFontSize(qreal size);

private:
    QString m_organization;
    QString m_application;

    ToolType m_tool = ToolType::Pencil;
    QColor m_color;                     ///< Invalid = engine default
    qreal m_thickness = 0;              ///< 0 = engine default
    qreal m_textFontSize = 24.0;
};
