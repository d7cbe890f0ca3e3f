// =====================================================================
//  src/libfloorplan/plan/model.cpp — Floor plan model
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/model.h>

namespace floorplan {
namespace plan {

namespace {

bool fuzzyRectEquals(const QRectF& a, const QRectF& b, double tolerance)
{
    return qAbs(a.x() - b.x()) <= tolerance &&
           qAbs(a.y() - b.y()) <= tolerance &&
           qAbs(a.width() - b.width()) <= tolerance &&
           qAbs(a.height() - b.height()) <= tolerance;
}

bool exactRectEquals(const QRectF& a, const QRectF& b)
{
    // QRectF::operator== is fuzzy; the model compares exactly
    return a.x() == b.x() && a.y() == b.y() &&
           a.width() == b.width() && a.height() == b.height();
}

}  // anonymous namespace

// =====================================================================
//  ElementKind
// =====================================================================

ElementKind ElementKind::fromSurface(SurfaceKind kind, ObjectCategory category)
{
    switch (kind) {
    case SurfaceKind::Wall:    return wall();
    case SurfaceKind::Door:    return door();
    case SurfaceKind::Window:  return window();
    case SurfaceKind::Opening: return opening();
    case SurfaceKind::Object:  return object(category);
    }
    return object(ObjectCategory::Unknown);
}

QString elementTypeName(ElementType type)
{
    switch (type) {
    case ElementType::Wall:    return QStringLiteral("wall");
    case ElementType::Door:    return QStringLiteral("door");
    case ElementType::Window:  return QStringLiteral("window");
    case ElementType::Opening: return QStringLiteral("opening");
    case ElementType::Object:  return QStringLiteral("object");
    }
    return QStringLiteral("object");
}

bool elementTypeFromName(const QString& name, ElementType* type)
{
    static const ElementType types[] = {
        ElementType::Wall, ElementType::Door, ElementType::Window,
        ElementType::Opening, ElementType::Object
    };

    for (ElementType candidate : types) {
        if (name == elementTypeName(candidate)) {
            if (type) *type = candidate;
            return true;
        }
    }
    return false;
}

// =====================================================================
//  FloorPlanElement
// =====================================================================

bool FloorPlanElement::operator==(const FloorPlanElement& other) const
{
    return exactRectEquals(rect, other.rect) &&
           rotation == other.rotation &&
           kind == other.kind &&
           label == other.label;
}

bool FloorPlanElement::fuzzyEquals(const FloorPlanElement& other, double tolerance) const
{
    return fuzzyRectEquals(rect, other.rect, tolerance) &&
           qAbs(rotation - other.rotation) <= tolerance &&
           kind == other.kind &&
           label == other.label;
}

// =====================================================================
//  FloorPlanModel
// =====================================================================

bool FloorPlanModel::hasArea() const
{
    return geometry::isFinite(boundingBox) &&
           boundingBox.width() > 0.0 && boundingBox.height() > 0.0;
}

int FloorPlanModel::count(ElementType type) const
{
    int n = 0;
    for (const FloorPlanElement& element : elements) {
        if (element.kind.type() == type) ++n;
    }
    return n;
}

bool FloorPlanModel::operator==(const FloorPlanModel& other) const
{
    return elements == other.elements &&
           exactRectEquals(boundingBox, other.boundingBox) &&
           roomDimensions == other.roomDimensions;
}

bool FloorPlanModel::fuzzyEquals(const FloorPlanModel& other, double tolerance) const
{
    if (elements.size() != other.elements.size()) return false;

    for (int i = 0; i < elements.size(); ++i) {
        if (!elements[i].fuzzyEquals(other.elements[i], tolerance)) return false;
    }

    return fuzzyRectEquals(boundingBox, other.boundingBox, tolerance) &&
           qAbs(roomDimensions.width - other.roomDimensions.width) <= tolerance &&
           qAbs(roomDimensions.height - other.roomDimensions.height) <= tolerance &&
           qAbs(roomDimensions.depth - other.roomDimensions.depth) <= tolerance;
}

}  // namespace plan
}  // namespace floorplan
