#ifndef UMB_INCLUDE_BASIC_TRANSFORM_H
#define UMB_INCLUDE_BASIC_TRANSFORM_H

#include <basic/matrix.h>
#include <basic/tuple.h>

namespace umb {

// Affine transform constructors. Transforms compose right to left: to
// rotate, then scale, then translate a point p, compute
// translation(...) * scaling(...) * rotation_x(...) * p.

Matrix4 translation(double x, double y, double z);
Matrix4 scaling(double x, double y, double z);

// Right-handed rotations, angles in radians.
Matrix4 rotation_x(double radians);
Matrix4 rotation_y(double radians);
Matrix4 rotation_z(double radians);

// Moves each component in proportion to the other two.
Matrix4 shearing(double xy, double xz, double yx, double yz, double zx, double zy);

// World to eye transform for an eye at `from` looking at `to`.
// Throws ZeroMagnitudeError if from == to or up is a zero vector.
Matrix4 view_transform(const Point &from, const Point &to, const Vector &up);

}

#endif
