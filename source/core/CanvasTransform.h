#pragma once

// ============================================================================
// CanvasTransform - Pan/zoom state and clamping rules
// ============================================================================
// Part of the ExamInk drawing engine
//
// Viewport point = canvas point * zoom + pan
// Canvas point   = (viewport point - pan) / zoom
// ============================================================================

#include <QPointF>
#include <QSizeF>
#include <QMetaType>
#include <QtGlobal>

/**
 * @brief The live view transform of the canvas.
 *
 * Pan is in viewport pixels, zoom is a scale factor. Both are always stored
 * clamped (see clampPan() and clampZoom()).
 */
struct CanvasTransform {
    qreal panX = 0;
    qreal panY = 0;
    qreal zoom = 1.0;

    static constexpr qreal MIN_ZOOM = 0.4;
    static constexpr qreal MAX_ZOOM = 8.0;

    QPointF pan() const { return QPointF(panX, panY); }

    /**
     * @brief Convert a viewport point to logical canvas coordinates.
     */
    QPointF toCanvas(const QPointF& viewportPt) const {
        return QPointF((viewportPt.x() - panX) / zoom, (viewportPt.y() - panY) / zoom);
    }

    /**
     * @brief Convert a logical canvas point to viewport coordinates.
     */
    QPointF toViewport(const QPointF& canvasPt) const {
        return QPointF(canvasPt.x() * zoom + panX, canvasPt.y() * zoom + panY);
    }

    bool operator==(const CanvasTransform& other) const {
        return qFuzzyCompare(panX + 1.0, other.panX + 1.0) &&
               qFuzzyCompare(panY + 1.0, other.panY + 1.0) &&
               qFuzzyCompare(zoom, other.zoom);
    }
    bool operator!=(const CanvasTransform& other) const { return !(*this == other); }

    static qreal clampZoom(qreal zoom) {
        return qBound(MIN_ZOOM, zoom, MAX_ZOOM);
    }

    /**
     * @brief Clamp one pan axis.
     * @param rawPan Requested pan along the axis.
     * @param zoom Zoom the pan is evaluated against.
     * @param viewportSize Viewport extent along the axis.
     * @param logicalSize Logical canvas extent along the axis.
     *
     * If the scaled content fits (extra >= 0) pan may move within one
     * viewport extent either way. If it overflows, pan is limited to
     * [extra, 0] so the content always covers the viewport.
     */
    static qreal clampPanAxis(qreal rawPan, qreal zoom, qreal viewportSize, qreal logicalSize);

    /**
     * @brief Clamp both pan axes against the given zoom.
     */
    static QPointF clampPan(const QPointF& rawPan, qreal zoom,
                            const QSizeF& viewportSize, const QSizeF& logicalSize);

    /**
     * @brief Pan that centers the logical canvas at the given zoom (clamped).
     */
    static QPointF centeredPan(qreal zoom, const QSizeF& viewportSize, const QSizeF& logicalSize);
};

Q_DECLARE_METATYPE(CanvasTransform)
