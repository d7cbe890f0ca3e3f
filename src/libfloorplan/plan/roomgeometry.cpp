// =====================================================================
//  src/libfloorplan/plan/roomgeometry.cpp — Room-level measures
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/roomgeometry.h>

#include <QStringList>

namespace floorplan {
namespace plan {

namespace {

QString countPhrase(int count, const char* noun)
{
    return QStringLiteral("%1 %2%3")
        .arg(count)
        .arg(QLatin1String(noun))
        .arg(count == 1 ? QString() : QStringLiteral("s"));
}

}  // anonymous namespace

RoomDimensions roomDimensions(const QVector<SurfaceRecord>& surfaces)
{
    bool any = false;
    geometry::Vector3 lo;
    geometry::Vector3 hi;

    for (const SurfaceRecord& surface : surfaces) {
        if (surface.kind != SurfaceKind::Wall) continue;

        geometry::Vector3 position = surface.transform.position();
        geometry::Vector3 half(qAbs(surface.dimensions.x) / 2.0,
                               qAbs(surface.dimensions.y) / 2.0,
                               qAbs(surface.dimensions.z) / 2.0);
        geometry::Vector3 wallLo = position - half;
        geometry::Vector3 wallHi = position + half;

        if (!any) {
            lo = wallLo;
            hi = wallHi;
            any = true;
            continue;
        }

        lo.x = qMin(lo.x, wallLo.x);
        lo.y = qMin(lo.y, wallLo.y);
        lo.z = qMin(lo.z, wallLo.z);
        hi.x = qMax(hi.x, wallHi.x);
        hi.y = qMax(hi.y, wallHi.y);
        hi.z = qMax(hi.z, wallHi.z);
    }

    RoomDimensions dims;
    if (any) {
        dims.width = hi.x - lo.x;
        dims.height = hi.y - lo.y;
        dims.depth = hi.z - lo.z;
    }
    return dims;
}

double approximateFloorArea(const QVector<SurfaceRecord>& surfaces)
{
    geometry::BoundingBox bounds;

    for (const SurfaceRecord& surface : surfaces) {
        if (surface.kind != SurfaceKind::Wall) continue;

        // Walls run along either axis; half the wall width pads both
        geometry::Vector3 position = surface.transform.position();
        double halfWidth = surface.dimensions.x / 2.0;
        bounds.include(QPointF(position.x - halfWidth, position.z - halfWidth));
        bounds.include(QPointF(position.x + halfWidth, position.z + halfWidth));
    }

    if (!bounds.valid) return 0.0;
    return bounds.width() * bounds.height();
}

std::optional<geometry::Vector3> roomCenter(const QVector<SurfaceRecord>& surfaces)
{
    geometry::Vector3 sum;
    int walls = 0;

    for (const SurfaceRecord& surface : surfaces) {
        if (surface.kind != SurfaceKind::Wall) continue;
        sum = sum + surface.transform.position();
        ++walls;
    }

    if (walls == 0) return std::nullopt;
    return sum / static_cast<double>(walls);
}

// =====================================================================
//  Scan Statistics
// =====================================================================

QString ScanStatistics::summary() const
{
    QStringList parts;
    if (wallCount > 0) parts << countPhrase(wallCount, "wall");
    if (doorCount > 0) parts << countPhrase(doorCount, "door");
    if (windowCount > 0) parts << countPhrase(windowCount, "window");
    if (objectCount > 0) parts << countPhrase(objectCount, "object");
    if (floorArea > 0.0) {
        parts << QStringLiteral("%1 m\u00B2 floor").arg(floorArea, 0, 'f', 1);
    }

    if (parts.isEmpty()) return QStringLiteral("No elements detected");
    return parts.join(QStringLiteral(", "));
}

ScanStatistics scanStatistics(const QVector<SurfaceRecord>& surfaces)
{
    ScanStatistics stats;

    for (const SurfaceRecord& surface : surfaces) {
        switch (surface.kind) {
        case SurfaceKind::Wall:    ++stats.wallCount; break;
        case SurfaceKind::Door:    ++stats.doorCount; break;
        case SurfaceKind::Window:  ++stats.windowCount; break;
        case SurfaceKind::Opening: ++stats.openingCount; break;
        case SurfaceKind::Object:  ++stats.objectCount; break;
        }
    }

    stats.floorArea = approximateFloorArea(surfaces);
    return stats;
}

}  // namespace plan
}  // namespace floorplan
