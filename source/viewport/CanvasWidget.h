#pragma once

// ============================================================================
// CanvasWidget - Host widget for the drawing engine
// ============================================================================
// Part of the ExamInk drawing engine
//
// Converts QTouchEvent (and mouse input as a single finger) into TouchSample
// values, paints the engine state under the live transform and shows the
// text entry dialog when a text box has been dragged.
// ============================================================================

#include "../input/TouchSample.h"

#include <QWidget>
#include <QColor>
#include <QPen>
#include <QPointer>
#include <QRectF>

class DrawingEngine;
class QTouchEvent;
class QPainter;

class CanvasWidget : public QWidget
{
    Q_OBJECT

public:
    /**
     * @param engine Engine to drive (not owned, must outlive the widget).
     */
    explicit CanvasWidget(DrawingEngine* engine, QWidget* parent = nullptr);
    ~CanvasWidget() override = default;

    DrawingEngine* engine() const { return m_engine; }

    /**
     * @brief Color of the drawing area; eraser lines are painted with it.
     */
    void setCanvasBackground(const QColor& color);
    QColor canvasBackground() const { return m_canvasBackground; }

    /**
     * @brief Whether a QInputDialog is shown for text drafts.
     *
     * When disabled, textRequested() is the only notification.
     */
    void setTextDialogEnabled(bool enabled) { m_textDialogEnabled = enabled; }

    QSize sizeHint() const override { return QSize(1024, 768); }

    /**
     * @brief Build a TouchSample from a touch event.
     * @return False if the event carries no usable points.
     */
    static bool sampleFromTouchEvent(const QTouchEvent* event, TouchSample& out);

signals:
    void textRequested(const QRectF& canvasRect);

protected:
    bool event(QEvent* event) override;
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    void requestText(const QRectF& canvasRect);
    void paintCommitted(QPainter& painter);
    void paintDrafts(QPainter& painter);
    QPen penFor(const QColor& color, qreal thickness, bool eraser) const;

    QPointer<DrawingEngine> m_engine;
    QColor m_canvasBackground = Qt::white;
    QColor m_outsideColor = QColor(64, 64, 64);
    bool m_textDialogEnabled = true;
    bool m_mouseDown = false;
};
