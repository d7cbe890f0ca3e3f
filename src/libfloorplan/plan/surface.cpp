// =====================================================================
//  src/libfloorplan/plan/surface.cpp — Captured room surfaces
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/surface.h>

namespace floorplan {
namespace plan {

namespace {

struct CategoryEntry {
    ObjectCategory category;
    const char* name;
};

const CategoryEntry CATEGORY_NAMES[] = {
    {ObjectCategory::Storage,      "storage"},
    {ObjectCategory::Refrigerator, "refrigerator"},
    {ObjectCategory::Stove,        "stove"},
    {ObjectCategory::Bed,          "bed"},
    {ObjectCategory::Sink,         "sink"},
    {ObjectCategory::WasherDryer,  "washerDryer"},
    {ObjectCategory::Toilet,       "toilet"},
    {ObjectCategory::Bathtub,      "bathtub"},
    {ObjectCategory::Oven,         "oven"},
    {ObjectCategory::Dishwasher,   "dishwasher"},
    {ObjectCategory::Table,        "table"},
    {ObjectCategory::Sofa,         "sofa"},
    {ObjectCategory::Chair,        "chair"},
    {ObjectCategory::Fireplace,    "fireplace"},
    {ObjectCategory::Television,   "television"},
    {ObjectCategory::Stairs,       "stairs"},
};

}  // anonymous namespace

bool SurfaceRecord::operator==(const SurfaceRecord& other) const
{
    return kind == other.kind &&
           transform == other.transform &&
           dimensions == other.dimensions &&
           category == other.category;
}

SurfaceRecord createSurface(SurfaceKind kind,
                            const geometry::Matrix4& transform,
                            const geometry::Vector3& dimensions)
{
    SurfaceRecord surface;
    surface.kind = kind;
    surface.transform = transform;
    surface.dimensions = dimensions;
    return surface;
}

SurfaceRecord createObject(ObjectCategory category,
                           const geometry::Matrix4& transform,
                           const geometry::Vector3& dimensions)
{
    SurfaceRecord surface;
    surface.kind = SurfaceKind::Object;
    surface.transform = transform;
    surface.dimensions = dimensions;
    surface.category = category;
    return surface;
}

QString surfaceKindName(SurfaceKind kind)
{
    switch (kind) {
    case SurfaceKind::Wall:    return QStringLiteral("wall");
    case SurfaceKind::Door:    return QStringLiteral("door");
    case SurfaceKind::Window:  return QStringLiteral("window");
    case SurfaceKind::Opening: return QStringLiteral("opening");
    case SurfaceKind::Object:  return QStringLiteral("object");
    }
    return QStringLiteral("object");
}

bool surfaceKindFromName(const QString& name, SurfaceKind* kind)
{
    static const SurfaceKind kinds[] = {
        SurfaceKind::Wall, SurfaceKind::Door, SurfaceKind::Window,
        SurfaceKind::Opening, SurfaceKind::Object
    };

    for (SurfaceKind candidate : kinds) {
        if (name.compare(surfaceKindName(candidate), Qt::CaseInsensitive) == 0) {
            if (kind) *kind = candidate;
            return true;
        }
    }
    return false;
}

QString categoryName(ObjectCategory category)
{
    for (const CategoryEntry& entry : CATEGORY_NAMES) {
        if (entry.category == category) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QStringLiteral("unknown");
}

ObjectCategory categoryFromName(const QString& name)
{
    for (const CategoryEntry& entry : CATEGORY_NAMES) {
        if (name.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
            return entry.category;
        }
    }
    return ObjectCategory::Unknown;
}

}  // namespace plan
}  // namespace floorplan
