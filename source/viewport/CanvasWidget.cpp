#include "CanvasWidget.h"
#include "../core/DrawingEngine.h"

#include <QPainter>
#include <QPaintEvent>
#include <QResizeEvent>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QTouchEvent>
#include <QInputDialog>
#include <QDateTime>
#include <QLineF>
#include <QDebug>

// ===== Constructor =====

CanvasWidget::CanvasWidget(DrawingEngine* engine, QWidget* parent)
    : QWidget(parent)
    , m_engine(engine)
{
    setAttribute(Qt::WA_AcceptTouchEvents, true);
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setFocusPolicy(Qt::StrongFocus);

    if (!m_engine) {
        qWarning() << "[Canvas] Created without an engine";
        return;
    }

    connect(m_engine, &DrawingEngine::interactionUpdated, this, qOverload<>(&QWidget::update));
    connect(m_engine, &DrawingEngine::previewFrameReady, this, qOverload<>(&QWidget::update));
    connect(m_engine->history(), &CommandHistory::historyChanged, this, qOverload<>(&QWidget::update));

    // Queued: the dialog runs its own event loop and must not nest inside
    // touch event delivery
    connect(m_engine, &DrawingEngine::textInputRequested, this, &CanvasWidget::requestText,
            Qt::QueuedConnection);
}

void CanvasWidget::setCanvasBackground(const QColor& color)
{
    if (!color.isValid() || color == m_canvasBackground) {
        return;
    }
    m_canvasBackground = color;
    update();
}

// ===== Touch =====

bool CanvasWidget::sampleFromTouchEvent(const QTouchEvent* event, TouchSample& out)
{
    if (!event) {
        return false;
    }

    QVector<QPointF> active;
    const auto& points = event->points();
    for (const auto& point : points) {
        if (point.state() != QEventPoint::Released) {
            active.append(point.position());
        }
    }

    switch (event->type()) {
        case QEvent::TouchBegin:  out.phase = TouchSample::Start; break;
        case QEvent::TouchUpdate: out.phase = TouchSample::Move; break;
        case QEvent::TouchEnd:    out.phase = TouchSample::End; break;
        case QEvent::TouchCancel: out.phase = TouchSample::Cancel; break;
        default:
            return false;
    }

    out.timestampMs = static_cast<qint64>(event->timestamp());
    out.activeFingerCount = active.size();

    if (active.isEmpty()) {
        // Last finger lifted: report where it was released
        if (points.isEmpty()) {
            return out.phase == TouchSample::Cancel;
        }
        out.position = points.first().position();
        out.fingerSpread = 0;
        if (out.phase == TouchSample::Move) {
            out.phase = TouchSample::End;
        }
        return true;
    }

    QPointF centroid;
    for (const QPointF& p : active) {
        centroid += p;
    }
    out.position = centroid / active.size();
    out.fingerSpread = active.size() >= 2 ? QLineF(active[0], active[1]).length() : 0;
    return true;
}

bool CanvasWidget::event(QEvent* event)
{
    switch (event->type()) {
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
        case QEvent::TouchCancel: {
            TouchSample sample;
            if (m_engine && sampleFromTouchEvent(static_cast<QTouchEvent*>(event), sample)) {
                m_engine->handleTouch(sample);
            }
            event->accept();
            return true;
        }
        default:
            break;
    }
    return QWidget::event(event);
}

// ===== Mouse (single finger) =====

void CanvasWidget::mousePressEvent(QMouseEvent* event)
{
    // Touch-synthesized mouse events were already handled as touch
    if (!m_engine || event->button() != Qt::LeftButton ||
        event->deviceType() == QInputDevice::DeviceType::TouchScreen) {
        QWidget::mousePressEvent(event);
        return;
    }
    m_mouseDown = true;
    m_engine->handleTouch(TouchSample::make(TouchSample::Start, event->position(), 1,
                                            static_cast<qint64>(event->timestamp())));
    event->accept();
}

void CanvasWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_engine || !m_mouseDown) {
        QWidget::mouseMoveEvent(event);
        return;
    }
    m_engine->handleTouch(TouchSample::make(TouchSample::Move, event->position(), 1,
                                            static_cast<qint64>(event->timestamp())));
    event->accept();
}

void CanvasWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (!m_engine || !m_mouseDown || event->button() != Qt::LeftButton) {
        QWidget::mouseReleaseEvent(event);
        return;
    }
    m_mouseDown = false;
    m_engine->handleTouch(TouchSample::make(TouchSample::End, event->position(), 0,
                                            static_cast<qint64>(event->timestamp())));
    event->accept();
}

// ===== Keyboard =====

void CanvasWidget::keyPressEvent(QKeyEvent* event)
{
    if (!m_engine) {
        QWidget::keyPressEvent(event);
        return;
    }

    const bool redoChord = event->key() == Qt::Key_Z &&
                           event->modifiers() == (Qt::ControlModifier | Qt::ShiftModifier);
    if (event->matches(QKeySequence::Redo) || redoChord) {
        m_engine->redo();
        event->accept();
        return;
    }
    if (event->matches(QKeySequence::Undo)) {
        m_engine->undo();
        event->accept();
        return;
    }

    switch (event->key()) {
        case Qt::Key_Plus:
        case Qt::Key_Equal:
            m_engine->zoomIn();
            break;
        case Qt::Key_Minus:
            m_engine->zoomOut();
            break;
        case Qt::Key_0:
            m_engine->resetView();
            break;
        case Qt::Key_1: m_engine->setTool(ToolType::Pencil); break;
        case Qt::Key_2: m_engine->setTool(ToolType::Eraser); break;
        case Qt::Key_3: m_engine->setTool(ToolType::Line); break;
        case Qt::Key_4: m_engine->setTool(ToolType::Rectangle); break;
        case Qt::Key_5: m_engine->setTool(ToolType::Ellipse); break;
        case Qt::Key_6: m_engine->setTool(ToolType::Text); break;
        case Qt::Key_7: m_engine->setTool(ToolType::Pan); break;
        default:
            QWidget::keyPressEvent(event);
            return;
    }
    event->accept();
}

// ===== Geometry =====

void CanvasWidget::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    if (m_engine) {
        m_engine->setViewportSize(QSizeF(event->size()));
    }
}

// ===== Text entry =====

void CanvasWidget::requestText(const QRectF& canvasRect)
{
    emit textRequested(canvasRect);
    if (!m_engine || !m_textDialogEnabled || !m_engine->isAwaitingText()) {
        return;
    }

    bool ok = false;
    const QString text = QInputDialog::getMultiLineText(this, tr("Add text"), tr("Text:"), QString(), &ok);
    if (!m_engine) {
        return;
    }
    if (ok) {
        m_engine->submitTextDraft(text);
    } else {
        m_engine->cancelTextDraft();
    }
}

// ===== Painting =====

void CanvasWidget::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), m_outsideColor);
    if (!m_engine) {
        return;
    }
    painter.setRenderHint(QPainter::Antialiasing, true);

    const CanvasTransform& t = m_engine->transform();
    painter.translate(t.panX, t.panY);
    painter.scale(t.zoom, t.zoom);

    painter.fillRect(QRectF(QPointF(0, 0), m_engine->logicalSize()), m_canvasBackground);

    paintCommitted(painter);
    paintDrafts(painter);
}

QPen CanvasWidget::penFor(const QColor& color, qreal thickness, bool eraser) const
{
    // Eraser lines cover ink underneath, so they paint wider in the background color
    QPen pen(eraser ? m_canvasBackground : color, eraser ? thickness * 2 : thickness,
             Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    return pen;
}

void CanvasWidget::paintCommitted(QPainter& painter)
{
    const QVector<CanvasObject>& objects = m_engine->committed();
    for (const CanvasObject& object : objects) {
        if (object.kind == CanvasObject::Line) {
            const CanvasLine& line = object.line;
            painter.setPen(penFor(line.color, line.thickness, line.tool == ToolType::Eraser));
            painter.setBrush(Qt::NoBrush);
            if (!line.isShape() && line.points.size() == 1) {
                painter.drawPoint(line.points.first());
                continue;
            }
            painter.drawPath(m_engine->pathForLine(line));
            continue;
        }

        const TextAnnotation& text = object.text;
        QFont font = painter.font();
        font.setPixelSize(qMax(1, qRound(text.fontSize)));
        painter.setFont(font);
        painter.setPen(text.color);
        painter.drawText(text.rect(), Qt::AlignLeft | Qt::AlignTop | Qt::TextWordWrap, text.text);
    }
}

void CanvasWidget::paintDrafts(QPainter& painter)
{
    const StrokeBuilder& builder = m_engine->builder();

    if (builder.hasFreehandDraft()) {
        const CanvasLine& line = builder.freehandDraft();
        painter.setPen(penFor(line.color, line.thickness, line.tool == ToolType::Eraser));
        painter.setBrush(Qt::NoBrush);

        const int n = line.points.size();
        if (n == 1) {
            painter.drawPoint(line.points.first());
        } else {
            // Points older than the preview window are kept in a growing path
            if (!builder.frozenPath().isEmpty()) {
                painter.drawPath(builder.frozenPath());
            }
            painter.drawPath(builder.previewPath());
        }
    }

    if (builder.hasShapeDraft()) {
        painter.setPen(penFor(builder.shapeColor(), builder.shapeThickness(), false));
        painter.setBrush(Qt::NoBrush);
        painter.drawPath(builder.shapePreviewPath());
    }

    if (builder.hasTextDraft()) {
        QPen dashed(QColor(59, 130, 246), 1.0 / m_engine->transform().zoom, Qt::DashLine);
        painter.setPen(dashed);
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(builder.textDraftRect());
    }
}
