#ifndef UMB_INCLUDE_OBJECT_SPHERE_H
#define UMB_INCLUDE_OBJECT_SPHERE_H

#include <basic/matrix.h>
#include <basic/ray.h>
#include <basic/tuple.h>
#include <material/material.h>
#include <object/object.h>
#include <vector>

namespace umb {

// Unit sphere centered at the object space origin, derived from class Object.
class Sphere : public Object {
public:
	// Constructors
	Sphere();
	Sphere(const Matrix4 &transform, const Material &material);
	Sphere(const Sphere &) = default; // Spheres are plain values
	Sphere &operator=(const Sphere &) = default;

	// Destructors
	~Sphere() override = default;

protected:
	// Solve |o + t*d - c|^2 = 1 for t, roots in ascending order.
	std::vector<double> local_intersect(const Ray &object_ray) const override;

	// Vector from the center to the point.
	Vector local_normal_at(const Point &object_point) const override;
};

}

#endif
