// =====================================================================
//  src/libfloorplan/floorplan/plan/roomgeometry.h — Room-level measures
// =====================================================================
//
//  Whole-room quantities derived from the captured walls: overall
//  dimensions, approximate floor area and center, plus per-kind scan
//  statistics.
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_PLAN_ROOMGEOMETRY_H
#define FLOORPLAN_PLAN_ROOMGEOMETRY_H

#include "../core.h"
#include "../geometry/types.h"
#include "model.h"
#include "surface.h"

#include <QString>
#include <QVector>

#include <optional>

namespace floorplan {
namespace plan {

/// Axis-aligned extent of all walls (position +/- half dimensions on
/// every axis).  All zero when there are no walls.
FLOORPLAN_EXPORT RoomDimensions roomDimensions(const QVector<SurfaceRecord>& surfaces);

/// Approximate floor area in square meters: width x depth of the box
/// spanned by wall positions +/- half the wall width.  Zero without walls.
FLOORPLAN_EXPORT double approximateFloorArea(const QVector<SurfaceRecord>& surfaces);

/// Mean of all wall positions; empty without walls
FLOORPLAN_EXPORT std::optional<geometry::Vector3> roomCenter(const QVector<SurfaceRecord>& surfaces);

// =====================================================================
//  Scan Statistics
// =====================================================================

/// Element counts and floor area of a capture
struct FLOORPLAN_EXPORT ScanStatistics {
    int wallCount = 0;
    int doorCount = 0;
    int windowCount = 0;
    int openingCount = 0;
    int objectCount = 0;
    double floorArea = 0.0;     ///< Square meters

    int totalElements() const
    {
        return wallCount + doorCount + windowCount + openingCount + objectCount;
    }

    /// Human-readable summary, e.g. "4 walls, 1 door, 25.5 m² floor".
    /// Openings are counted in totalElements() but not listed.
    /// Returns "No elements detected" when nothing is listed.
    QString summary() const;
};

/// Gather statistics for a list of surfaces
FLOORPLAN_EXPORT ScanStatistics scanStatistics(const QVector<SurfaceRecord>& surfaces);

}  // namespace plan
}  // namespace floorplan

#endif  // FLOORPLAN_PLAN_ROOMGEOMETRY_H
