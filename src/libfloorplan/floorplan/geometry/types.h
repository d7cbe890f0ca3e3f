// =====================================================================
//  src/libfloorplan/floorplan/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Lightweight value types shared by the builder and the encoders:
//  3D vectors and spatial transforms as delivered by the room scanner,
//  and a 2D bounding box for plan-space extents.
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_GEOMETRY_TYPES_H
#define FLOORPLAN_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QRectF>
#include <QVector>
#include <QtMath>

namespace floorplan {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Default tolerance for geometric comparisons (in meters)
constexpr double DEFAULT_TOLERANCE = 1e-6;

// =====================================================================
//  Vector3
// =====================================================================

/// 3D vector in scanner world space (Y up, meters)
struct FLOORPLAN_EXPORT Vector3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vector3() = default;
    Vector3(double vx, double vy, double vz) : x(vx), y(vy), z(vz) {}

    Vector3 operator+(const Vector3& o) const { return Vector3(x + o.x, y + o.y, z + o.z); }
    Vector3 operator-(const Vector3& o) const { return Vector3(x - o.x, y - o.y, z - o.z); }
    Vector3 operator*(double s) const { return Vector3(x * s, y * s, z * s); }
    Vector3 operator/(double s) const { return Vector3(x / s, y / s, z / s); }

    bool operator==(const Vector3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vector3& o) const { return !(*this == o); }

    /// True if no component is NaN or infinite
    bool isFinite() const;

    /// Component-wise comparison within tolerance
    bool fuzzyEquals(const Vector3& o, double tolerance = DEFAULT_TOLERANCE) const;
};

// =====================================================================
//  Matrix4
// =====================================================================

/// 4x4 affine transform, stored column-major.
///
/// Column 0..2 are the local X, Y and Z axes, column 3 the world
/// position.  This is the layout the scanner hands over, so values can
/// be copied straight in with fromColumnMajor().
struct FLOORPLAN_EXPORT Matrix4 {
    double m[4][4] = {
        {1.0, 0.0, 0.0, 0.0},
        {0.0, 1.0, 0.0, 0.0},
        {0.0, 0.0, 1.0, 0.0},
        {0.0, 0.0, 0.0, 1.0}
    };  ///< m[column][row]

    /// Identity transform
    static Matrix4 identity();

    /// Translation transform
    static Matrix4 translation(double x, double y, double z);

    /// Rotation about the vertical (Y) axis, angle in radians.
    /// Plan y is world +Z, so the plan rotation is the negated angle.
    static Matrix4 rotationY(double angleRadians);

    /// Build from 16 values in column-major order.
    /// Missing trailing values keep their identity defaults.
    static Matrix4 fromColumnMajor(const QVector<double>& values);

    /// Flatten to 16 values in column-major order
    QVector<double> toColumnMajor() const;

    /// Local X axis (column 0, xyz part)
    Vector3 xAxis() const { return Vector3(m[0][0], m[0][1], m[0][2]); }

    /// World position (column 3, xyz part)
    Vector3 position() const { return Vector3(m[3][0], m[3][1], m[3][2]); }

    /// True if no element is NaN or infinite
    bool isFinite() const;

    /// Combine with another transform (this * other)
    Matrix4 operator*(const Matrix4& other) const;

    bool operator==(const Matrix4& other) const;
    bool operator!=(const Matrix4& other) const { return !(*this == other); }
};

// =====================================================================
//  Bounding Box
// =====================================================================

/// Axis-aligned 2D bounding box accumulated from plan rectangles
struct FLOORPLAN_EXPORT BoundingBox {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
    bool valid = false;

    /// Expand to include a point
    void include(const QPointF& point);

    /// Expand to include all four corners of a rectangle
    void include(const QRectF& rect);

    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }

    /// Convert to QRectF; an empty box converts to (0, 0, 0, 0)
    QRectF toRect() const;
};

/// True if every coordinate of the rectangle is finite
FLOORPLAN_EXPORT bool isFinite(const QRectF& rect);

}  // namespace geometry
}  // namespace floorplan

#endif  // FLOORPLAN_GEOMETRY_TYPES_H
