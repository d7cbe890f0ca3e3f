// =====================================================================
//  src/libfloorplan/floorplan/plan/viewfit.h — Scale-to-fit transform
// =====================================================================
//
//  Computes the uniform scale and offset that fit a floor plan into a
//  viewport of a given size, centered, with padding on every side.
//  Renderers map model rectangles through the result.
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_PLAN_VIEWFIT_H
#define FLOORPLAN_PLAN_VIEWFIT_H

#include "../core.h"
#include "model.h"

#include <QPointF>
#include <QRectF>
#include <QSizeF>

namespace floorplan {
namespace plan {

/// Options for computeViewFit()
struct ViewFitOptions {
    double padding = 40.0;          ///< Margin on every side, in view points
    double pointsPerMeter = 100.0;  ///< Base scale before fitting
};

/// Model-to-view mapping: view = model * pointsPerMeter * scale + offset
struct FLOORPLAN_EXPORT ViewFit {
    bool valid = false;             ///< False if the model or viewport is degenerate
    double scale = 1.0;             ///< Fit factor applied on top of pointsPerMeter
    double pointsPerMeter = 100.0;
    QPointF offset;

    /// Map a model point (meters) to view coordinates
    QPointF map(const QPointF& point) const;

    /// Map a model rectangle (meters) to view coordinates
    QRectF map(const QRectF& rect) const;
};

/// Fit the model's bounding box into a viewport.
///
/// Returns an invalid fit (scale 1, zero offset) when the viewport is no
/// larger than the padding or the model has no area; no division by
/// zero takes place in either case.
FLOORPLAN_EXPORT ViewFit computeViewFit(const FloorPlanModel& model,
                                        const QSizeF& viewSize,
                                        const ViewFitOptions& options = {});

}  // namespace plan
}  // namespace floorplan

#endif  // FLOORPLAN_PLAN_VIEWFIT_H
