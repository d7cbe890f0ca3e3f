// =====================================================================
//  src/libfloorplan/floorplan/plan/builder.h — Floor plan construction
// =====================================================================
//
//  Projects captured 3D surfaces onto the horizontal plane and
//  assembles the resulting FloorPlanModel.
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_PLAN_BUILDER_H
#define FLOORPLAN_PLAN_BUILDER_H

#include "../core.h"
#include "model.h"
#include "surface.h"

#include <QRectF>
#include <QString>
#include <QVector>

namespace floorplan {
namespace plan {

// =====================================================================
//  Building
// =====================================================================

/// Build a floor plan from captured surfaces.
///
/// Elements are emitted grouped by kind (walls, doors, windows,
/// openings, objects), keeping input order within each group.  The
/// bounding box spans every element rectangle; room dimensions come
/// from the walls alone.  Empty input gives an empty model with a zero
/// bounding box and zero dimensions.
///
/// Non-finite transform or dimension values are not checked and carry
/// through to the model.  Use buildFloorPlanChecked() to reject them.
FLOORPLAN_EXPORT FloorPlanModel buildFloorPlan(const QVector<SurfaceRecord>& surfaces);

/// Reason a checked build failed
enum class BuildError {
    None,
    MalformedGeometry   ///< A transform or dimension component is NaN or infinite
};

/// Result of buildFloorPlanChecked()
struct BuildResult {
    bool success = false;
    FloorPlanModel model;               ///< Valid only when success is true
    BuildError error = BuildError::None;
    QString errorMessage;
    int surfaceIndex = -1;              ///< Index of the offending surface, -1 if none
};

/// Build a floor plan after validating every surface.
/// Fails with BuildError::MalformedGeometry at the first surface whose
/// transform or dimensions contain a non-finite value.
FLOORPLAN_EXPORT BuildResult buildFloorPlanChecked(const QVector<SurfaceRecord>& surfaces);

// =====================================================================
//  Projection Helpers
// =====================================================================

/// Top-down footprint of a surface: centered on its world X/Z position,
/// sized by its width (x) and depth (z) extents.
FLOORPLAN_EXPORT QRectF footprint(const SurfaceRecord& surface);

/// Rotation of a transform about the vertical axis, taken from its
/// local X axis: atan2(x.z, x.x), in radians within (-pi, pi].
FLOORPLAN_EXPORT double planRotation(const geometry::Matrix4& transform);

/// Display label for a furniture category ("Fridge", "TV", ...).
/// Categories without a label, including Unknown, give "Object".
FLOORPLAN_EXPORT QString objectLabel(ObjectCategory category);

/// Bounding rectangle of all element rectangles; (0, 0, 0, 0) if empty
FLOORPLAN_EXPORT QRectF elementBounds(const QVector<FloorPlanElement>& elements);

}  // namespace plan
}  // namespace floorplan

#endif  // FLOORPLAN_PLAN_BUILDER_H
