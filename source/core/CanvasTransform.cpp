#include "CanvasTransform.h"

qreal CanvasTransform::clampPanAxis(qreal rawPan, qreal zoom, qreal viewportSize, qreal logicalSize)
{
    const qreal extra = viewportSize - logicalSize * zoom;
    if (extra >= 0) {
        return qBound(-viewportSize, rawPan, viewportSize);
    }
    return qBound(extra, rawPan, 0.0);
}

QPointF CanvasTransform::clampPan(const QPointF& rawPan, qreal zoom,
                                  const QSizeF& viewportSize, const QSizeF& logicalSize)
{
    return QPointF(clampPanAxis(rawPan.x(), zoom, viewportSize.width(), logicalSize.width()),
                   clampPanAxis(rawPan.y(), zoom, viewportSize.height(), logicalSize.height()));
}

QPointF CanvasTransform::centeredPan(qreal zoom, const QSizeF& viewportSize, const QSizeF& logicalSize)
{
    const QPointF raw((viewportSize.width() - logicalSize.width() * zoom) / 2.0,
                      (viewportSize.height() - logicalSize.height() * zoom) / 2.0);
    return clampPan(raw, zoom, viewportSize, logicalSize);
}
