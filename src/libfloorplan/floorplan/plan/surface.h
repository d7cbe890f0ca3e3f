// =====================================================================
//  src/libfloorplan/floorplan/plan/surface.h — Captured room surfaces
// =====================================================================
//
//  Input records handed over by the scanning session once a room has
//  been captured: one record per detected wall, door, window, opening
//  or furniture object.
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_PLAN_SURFACE_H
#define FLOORPLAN_PLAN_SURFACE_H

#include "../core.h"
#include "../geometry/types.h"

#include <QString>
#include <QVector>

namespace floorplan {
namespace plan {

// =====================================================================
//  Surface Kinds
// =====================================================================

/// Kind of detected element
enum class SurfaceKind {
    Wall,
    Door,
    Window,
    Opening,
    Object      ///< Furniture or fixture, see ObjectCategory
};

/// Furniture category reported for Object surfaces
enum class ObjectCategory {
    Storage,
    Refrigerator,
    Stove,
    Bed,
    Sink,
    WasherDryer,
    Toilet,
    Bathtub,
    Oven,
    Dishwasher,
    Table,
    Sofa,
    Chair,
    Fireplace,
    Television,
    Stairs,
    Unknown     ///< Category not known to this library
};

// =====================================================================
//  Surface Record
// =====================================================================

/// One detected element of a captured room
struct FLOORPLAN_EXPORT SurfaceRecord {
    SurfaceKind kind = SurfaceKind::Wall;
    geometry::Matrix4 transform;                ///< Local-to-world transform
    geometry::Vector3 dimensions;               ///< Width (x), height (y), depth (z) in meters
    ObjectCategory category = ObjectCategory::Unknown;  ///< Only meaningful for objects

    bool operator==(const SurfaceRecord& other) const;
    bool operator!=(const SurfaceRecord& other) const { return !(*this == other); }
};

// =====================================================================
//  Factory Functions
// =====================================================================

/// Create a structural surface (wall, door, window or opening)
FLOORPLAN_EXPORT SurfaceRecord createSurface(SurfaceKind kind,
                                             const geometry::Matrix4& transform,
                                             const geometry::Vector3& dimensions);

/// Create a furniture object surface
FLOORPLAN_EXPORT SurfaceRecord createObject(ObjectCategory category,
                                            const geometry::Matrix4& transform,
                                            const geometry::Vector3& dimensions);

// =====================================================================
//  Names
// =====================================================================

/// Stable lowercase identifier ("wall", "door", ...) used in JSON files
FLOORPLAN_EXPORT QString surfaceKindName(SurfaceKind kind);

/// Parse a surface kind identifier.
/// Returns false if the name is not recognized.
FLOORPLAN_EXPORT bool surfaceKindFromName(const QString& name, SurfaceKind* kind);

/// Stable camelCase identifier ("storage", "washerDryer", ...) used in JSON files
FLOORPLAN_EXPORT QString categoryName(ObjectCategory category);

/// Parse a category identifier.  Unrecognized names map to Unknown.
FLOORPLAN_EXPORT ObjectCategory categoryFromName(const QString& name);

}  // namespace plan
}  // namespace floorplan

#endif  // FLOORPLAN_PLAN_SURFACE_H
