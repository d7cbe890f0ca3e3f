// =====================================================================
//  src/libfloorplan/plan/viewfit.cpp — Scale-to-fit transform
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/viewfit.h>

namespace floorplan {
namespace plan {

QPointF ViewFit::map(const QPointF& point) const
{
    double factor = pointsPerMeter * scale;
    return QPointF(point.x() * factor + offset.x(),
                   point.y() * factor + offset.y());
}

QRectF ViewFit::map(const QRectF& rect) const
{
    double factor = pointsPerMeter * scale;
    return QRectF(map(rect.topLeft()),
                  QSizeF(rect.width() * factor, rect.height() * factor));
}

ViewFit computeViewFit(const FloorPlanModel& model,
                       const QSizeF& viewSize,
                       const ViewFitOptions& options)
{
    ViewFit fit;
    fit.pointsPerMeter = options.pointsPerMeter;

    double availableWidth = viewSize.width() - options.padding * 2.0;
    double availableHeight = viewSize.height() - options.padding * 2.0;
    if (availableWidth <= 0.0 || availableHeight <= 0.0) return fit;
    if (!model.hasArea() || options.pointsPerMeter <= 0.0) return fit;

    const QRectF& box = model.boundingBox;
    double scaleX = availableWidth / (box.width() * options.pointsPerMeter);
    double scaleY = availableHeight / (box.height() * options.pointsPerMeter);
    fit.scale = qMin(scaleX, scaleY);

    // Center the scaled plan in the available area
    double factor = options.pointsPerMeter * fit.scale;
    double scaledWidth = box.width() * factor;
    double scaledHeight = box.height() * factor;

    fit.offset = QPointF(
        options.padding + (availableWidth - scaledWidth) / 2.0 - box.left() * factor,
        options.padding + (availableHeight - scaledHeight) / 2.0 - box.top() * factor);
    fit.valid = true;
    return fit;
}

}  // namespace plan
}  // namespace floorplan
