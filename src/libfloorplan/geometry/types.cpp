// =====================================================================
//  src/libfloorplan/geometry/types.cpp — Basic geometry types implementation
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/geometry/types.h>

namespace floorplan {
namespace geometry {

// =====================================================================
//  Vector3 Implementation
// =====================================================================

bool Vector3::isFinite() const
{
    return qIsFinite(x) && qIsFinite(y) && qIsFinite(z);
}

bool Vector3::fuzzyEquals(const Vector3& o, double tolerance) const
{
    return qAbs(x - o.x) <= tolerance &&
           qAbs(y - o.y) <= tolerance &&
           qAbs(z - o.z) <= tolerance;
}

// =====================================================================
//  Matrix4 Implementation
// =====================================================================

Matrix4 Matrix4::identity()
{
    return Matrix4();
}

Matrix4 Matrix4::translation(double x, double y, double z)
{
    Matrix4 t;
    t.m[3][0] = x;
    t.m[3][1] = y;
    t.m[3][2] = z;
    return t;
}

Matrix4 Matrix4::rotationY(double angleRadians)
{
    double c = qCos(angleRadians);
    double s = qSin(angleRadians);

    // Right-handed rotation about +Y: X axis maps to (c, 0, -s)
    Matrix4 r;
    r.m[0][0] = c;
    r.m[0][2] = -s;
    r.m[2][0] = s;
    r.m[2][2] = c;
    return r;
}

Matrix4 Matrix4::fromColumnMajor(const QVector<double>& values)
{
    Matrix4 t;
    int count = qMin(static_cast<int>(values.size()), 16);
    for (int i = 0; i < count; ++i) {
        t.m[i / 4][i % 4] = values[i];
    }
    return t;
}

QVector<double> Matrix4::toColumnMajor() const
{
    QVector<double> values;
    values.reserve(16);
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            values.append(m[col][row]);
        }
    }
    return values;
}

bool Matrix4::isFinite() const
{
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            if (!qIsFinite(m[col][row])) return false;
        }
    }
    return true;
}

Matrix4 Matrix4::operator*(const Matrix4& other) const
{
    Matrix4 result;
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            double sum = 0.0;
            for (int k = 0; k < 4; ++k) {
                sum += m[k][row] * other.m[col][k];
            }
            result.m[col][row] = sum;
        }
    }
    return result;
}

bool Matrix4::operator==(const Matrix4& other) const
{
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            if (m[col][row] != other.m[col][row]) return false;
        }
    }
    return true;
}

// =====================================================================
//  BoundingBox Implementation
// =====================================================================

void BoundingBox::include(const QPointF& point)
{
    if (!valid) {
        minX = maxX = point.x();
        minY = maxY = point.y();
        valid = true;
    } else {
        minX = qMin(minX, point.x());
        minY = qMin(minY, point.y());
        maxX = qMax(maxX, point.x());
        maxY = qMax(maxY, point.y());
    }
}

void BoundingBox::include(const QRectF& rect)
{
    include(rect.topLeft());
    include(rect.topRight());
    include(rect.bottomRight());
    include(rect.bottomLeft());
}

QRectF BoundingBox::toRect() const
{
    if (!valid) return QRectF(0.0, 0.0, 0.0, 0.0);
    return QRectF(minX, minY, maxX - minX, maxY - minY);
}

bool isFinite(const QRectF& rect)
{
    return qIsFinite(rect.x()) && qIsFinite(rect.y()) &&
           qIsFinite(rect.width()) && qIsFinite(rect.height());
}

}  // namespace geometry
}  // namespace floorplan
