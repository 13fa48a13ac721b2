#ifndef UMB_INCLUDE_BASIC_RAY_H
#define UMB_INCLUDE_BASIC_RAY_H

#include <basic/matrix.h>
#include <basic/tuple.h>

namespace umb {

struct Ray {
	Point origin;
	Vector direction;

	// Constructors
	Ray() = default;
	Ray(const Point &origin, const Vector &direction); // direction is kept as given, not normalized

	// Get point at parameter t along the ray
	Point position(double t) const;

	// Apply a transform to both origin and direction
	Ray transform(const Matrix4 &m) const;
};

}

#endif
