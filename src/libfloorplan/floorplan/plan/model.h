// =====================================================================
//  src/libfloorplan/floorplan/plan/model.h — Floor plan model
// =====================================================================
//
//  The normalized 2D floor plan: a top-down projection of every
//  captured surface, plus the overall plan extent and the room's
//  wall-derived dimensions.  Built by buildFloorPlan() and consumed by
//  the SVG and DXF encoders; never refers back to the raw surfaces.
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_PLAN_MODEL_H
#define FLOORPLAN_PLAN_MODEL_H

#include "../core.h"
#include "../geometry/types.h"
#include "surface.h"

#include <QRectF>
#include <QString>
#include <QVector>

#include <optional>

namespace floorplan {
namespace plan {

// =====================================================================
//  Element Kind
// =====================================================================

/// Discriminator of ElementKind
enum class ElementType {
    Wall,
    Door,
    Window,
    Opening,
    Object
};

/// Closed set of plan element kinds: Wall | Door | Window | Opening |
/// Object(category).  The category is carried only by Object.
///
/// Code dispatching on type() switches over every ElementType without
/// a default label, so adding a kind fails the build (-Werror=switch)
/// until every encoder handles it.
class FLOORPLAN_EXPORT ElementKind {
public:
    static ElementKind wall() { return ElementKind(ElementType::Wall); }
    static ElementKind door() { return ElementKind(ElementType::Door); }
    static ElementKind window() { return ElementKind(ElementType::Window); }
    static ElementKind opening() { return ElementKind(ElementType::Opening); }
    static ElementKind object(ObjectCategory category)
    {
        return ElementKind(ElementType::Object, category);
    }

    /// Element kind for a surface kind (objects take the given category)
    static ElementKind fromSurface(SurfaceKind kind,
                                   ObjectCategory category = ObjectCategory::Unknown);

    ElementType type() const { return m_type; }

    /// Furniture category; Unknown for structural kinds
    ObjectCategory category() const { return m_category; }

    bool isObject() const { return m_type == ElementType::Object; }

    bool operator==(const ElementKind& other) const
    {
        return m_type == other.m_type && m_category == other.m_category;
    }
    bool operator!=(const ElementKind& other) const { return !(*this == other); }

private:
    explicit ElementKind(ElementType type,
                         ObjectCategory category = ObjectCategory::Unknown)
        : m_type(type)
        , m_category(type == ElementType::Object ? category : ObjectCategory::Unknown)
    {
    }

    ElementType m_type;
    ObjectCategory m_category;
};

/// Stable lowercase identifier ("wall", "door", ...) of an element type
FLOORPLAN_EXPORT QString elementTypeName(ElementType type);

/// Parse an element type identifier.
/// Returns false if the name is not recognized.
FLOORPLAN_EXPORT bool elementTypeFromName(const QString& name, ElementType* type);

// =====================================================================
//  Floor Plan Element
// =====================================================================

/// 2D projection of one captured surface
struct FLOORPLAN_EXPORT FloorPlanElement {
    QRectF rect;                        ///< Plan rectangle in meters (x = world X, y = world Z)
    double rotation = 0.0;              ///< Rotation about the vertical axis, radians in (-pi, pi]
    ElementKind kind = ElementKind::wall();
    std::optional<QString> label;       ///< Display label, objects only

    bool operator==(const FloorPlanElement& other) const;
    bool operator!=(const FloorPlanElement& other) const { return !(*this == other); }

    /// Compare with tolerance on rectangle and rotation
    bool fuzzyEquals(const FloorPlanElement& other,
                     double tolerance = geometry::DEFAULT_TOLERANCE) const;
};

// =====================================================================
//  Room Dimensions
// =====================================================================

/// Overall room extent derived from the walls, in meters
struct FLOORPLAN_EXPORT RoomDimensions {
    double width = 0.0;     ///< Extent along world X
    double height = 0.0;    ///< Vertical (floor to ceiling) extent
    double depth = 0.0;     ///< Extent along world Z

    bool operator==(const RoomDimensions& other) const
    {
        return width == other.width && height == other.height && depth == other.depth;
    }
    bool operator!=(const RoomDimensions& other) const { return !(*this == other); }
};

// =====================================================================
//  Floor Plan Model
// =====================================================================

/// Complete floor plan ready for export
struct FLOORPLAN_EXPORT FloorPlanModel {
    QVector<FloorPlanElement> elements;     ///< Walls, doors, windows, openings, objects
    QRectF boundingBox;                     ///< Extent of all element rectangles
    RoomDimensions roomDimensions;

    bool isEmpty() const { return elements.isEmpty(); }

    /// True if the bounding box has a positive, finite area.  Required
    /// before anything divides by the box width or height.
    bool hasArea() const;

    /// Number of elements of the given type
    int count(ElementType type) const;

    bool operator==(const FloorPlanModel& other) const;
    bool operator!=(const FloorPlanModel& other) const { return !(*this == other); }

    /// Compare element list, bounding box and dimensions with tolerance
    bool fuzzyEquals(const FloorPlanModel& other,
                     double tolerance = geometry::DEFAULT_TOLERANCE) const;
};

}  // namespace plan
}  // namespace floorplan

#endif  // FLOORPLAN_PLAN_MODEL_H
