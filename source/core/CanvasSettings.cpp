#include "CanvasSettings.h"
#include "DrawingEngine.h"

#include <QSettings>

CanvasSettings::CanvasSettings(const QString& organization, const QString& application)
    : m_organization(organization)
    , m_application(application)
{
}

void CanvasSettings::load()
{
    QSettings settings(m_organization, m_application);
    m_tool = toolTypeFromName(settings.value("canvas/tool", "pencil").toString());

    const QString colorName = settings.value("canvas/color").toString();
    m_color = colorName.isEmpty() ? QColor() : QColor(colorName);

    const qreal thickness = settings.value("canvas/thickness", 0.0).toDouble();
    m_thickness = thickness > 0 ? qBound(DrawingEngine::MIN_THICKNESS, thickness, DrawingEngine::MAX_THICKNESS) : 0;

    m_textFontSize = qBound(DrawingEngine::MIN_FONT_SIZE,
                            settings.value("canvas/textFontSize", 24.0).toDouble(),
                            DrawingEngine::MAX_FONT_SIZE);
}

void CanvasSettings::save() const
{
    QSettings settings(m_organization, m_application);
    settings.setValue("canvas/tool", toolTypeName(m_tool));
    if (m_color.isValid()) {
        settings.setValue("canvas/color", m_color.name());
    } else {
        settings.remove("canvas/color");
    }
    settings.setValue("canvas/thickness", m_thickness);
    settings.setValue("canvas/textFontSize", m_textFontSize);
}

void CanvasSettings::saveFromSnapshot(const CanvasSnapshot& snapshot)
{
    m_tool = snapshot.tool;
    setColor(snapshot.color);
    setThickness(snapshot.thickness);
    save();
}

EngineConfig CanvasSettings::toEngineConfig() const
{
    EngineConfig config;
    config.initialTool = m_tool;
    config.initialColor = m_color;
    config.initialThickness = m_thickness;
    config.initialTextFontSize = m_textFontSize;
    return config.normalized();
}

void CanvasSettings::setColor(const QColor& color)
{
    if (color.isValid()) {
        m_color = color;
    }
}

void CanvasSettings::setThickness(qreal thickness)
{
    if (thickness > 0) {
        m_thickness = qBound(DrawingEngine::MIN_THICKNESS, thickness, DrawingEngine::MAX_THICKNESS);
    }
}

void CanvasSettings::setTextFontSize(qreal size)
{
    m_textFontSize = qBound(DrawingEngine::MIN_FONT_SIZE, size, DrawingEngine::MAX_FONT_SIZE);
}
