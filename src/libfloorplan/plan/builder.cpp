// =====================================================================
//  src/libfloorplan/plan/builder.cpp — Floor plan construction
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/builder.h>
#include <floorplan/plan/roomgeometry.h>

#include "../logging.h"

#include <QtMath>

namespace floorplan {
namespace plan {

namespace {

/// Build order of the element groups
const SurfaceKind BUILD_ORDER[] = {
    SurfaceKind::Wall,
    SurfaceKind::Door,
    SurfaceKind::Window,
    SurfaceKind::Opening,
    SurfaceKind::Object
};

FloorPlanElement elementFor(const SurfaceRecord& surface)
{
    FloorPlanElement element;
    element.rect = footprint(surface);
    element.rotation = planRotation(surface.transform);
    element.kind = ElementKind::fromSurface(surface.kind, surface.category);
    if (element.kind.isObject()) {
        element.label = objectLabel(surface.category);
    }
    return element;
}

}  // anonymous namespace

// =====================================================================
//  Projection Helpers
// =====================================================================

QRectF footprint(const SurfaceRecord& surface)
{
    geometry::Vector3 position = surface.transform.position();
    double width = qAbs(surface.dimensions.x);
    double depth = qAbs(surface.dimensions.z);

    // World X/Z become plan x/y; the vertical axis is dropped
    return QRectF(position.x - width / 2.0,
                  position.z - depth / 2.0,
                  width,
                  depth);
}

double planRotation(const geometry::Matrix4& transform)
{
    geometry::Vector3 axis = transform.xAxis();
    double angle = qAtan2(axis.z, axis.x);

    // atan2 yields [-pi, pi]; fold -pi onto +pi
    if (angle <= -M_PI) {
        angle += 2.0 * M_PI;
    }
    return angle;
}

QString objectLabel(ObjectCategory category)
{
    switch (category) {
    case ObjectCategory::Storage:      return QStringLiteral("Storage");
    case ObjectCategory::Refrigerator: return QStringLiteral("Fridge");
    case ObjectCategory::Stove:        return QStringLiteral("Stove");
    case ObjectCategory::Bed:          return QStringLiteral("Bed");
    case ObjectCategory::Sink:         return QStringLiteral("Sink");
    case ObjectCategory::WasherDryer:  return QStringLiteral("Washer");
    case ObjectCategory::Toilet:       return QStringLiteral("Toilet");
    case ObjectCategory::Bathtub:      return QStringLiteral("Bathtub");
    case ObjectCategory::Oven:         return QStringLiteral("Oven");
    case ObjectCategory::Dishwasher:   return QStringLiteral("Dishwasher");
    case ObjectCategory::Table:        return QStringLiteral("Table");
    case ObjectCategory::Sofa:         return QStringLiteral("Sofa");
    case ObjectCategory::Chair:        return QStringLiteral("Chair");
    case ObjectCategory::Fireplace:    return QStringLiteral("Fireplace");
    case ObjectCategory::Television:   return QStringLiteral("TV");
    case ObjectCategory::Stairs:       return QStringLiteral("Stairs");
    case ObjectCategory::Unknown:      break;
    }
    // Also reached for out-of-range values cast from newer scanners
    return QStringLiteral("Object");
}

QRectF elementBounds(const QVector<FloorPlanElement>& elements)
{
    geometry::BoundingBox bounds;
    for (const FloorPlanElement& element : elements) {
        bounds.include(element.rect);
    }
    return bounds.toRect();
}

// =====================================================================
//  Building
// =====================================================================

FloorPlanModel buildFloorPlan(const QVector<SurfaceRecord>& surfaces)
{
    FloorPlanModel model;
    model.elements.reserve(surfaces.size());

    for (SurfaceKind kind : BUILD_ORDER) {
        for (const SurfaceRecord& surface : surfaces) {
            if (surface.kind == kind) {
                model.elements.append(elementFor(surface));
            }
        }
    }

    model.boundingBox = elementBounds(model.elements);
    model.roomDimensions = roomDimensions(surfaces);

    qCDebug(lcBuilder) << "Built floor plan with" << model.elements.size()
                       << "elements, bounds" << model.boundingBox;
    return model;
}

BuildResult buildFloorPlanChecked(const QVector<SurfaceRecord>& surfaces)
{
    BuildResult result;

    for (int i = 0; i < surfaces.size(); ++i) {
        const SurfaceRecord& surface = surfaces[i];
        if (surface.transform.isFinite() && surface.dimensions.isFinite()) {
            continue;
        }

        result.error = BuildError::MalformedGeometry;
        result.surfaceIndex = i;
        result.errorMessage = QStringLiteral("Malformed geometry in %1 surface %2: "
                                             "non-finite %3")
            .arg(surfaceKindName(surface.kind))
            .arg(i)
            .arg(surface.transform.isFinite() ? QStringLiteral("dimensions")
                                              : QStringLiteral("transform"));
        qCWarning(lcBuilder).noquote() << result.errorMessage;
        return result;
    }

    result.model = buildFloorPlan(surfaces);
    result.success = true;
    return result;
}

}  // namespace plan
}  // namespace floorplan
