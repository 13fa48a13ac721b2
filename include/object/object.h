#ifndef UMB_INCLUDE_OBJECT_OBJECT_H
#define UMB_INCLUDE_OBJECT_OBJECT_H

#include <basic/matrix.h>
#include <basic/ray.h>
#include <basic/tuple.h>
#include <material/material.h>
#include <object/intersection.h>
#include <vector>

namespace umb {

// Object base class. Every shape is defined in its own object space; the
// transform maps object space to world space. Derived classes only deal
// with object space rays and points.
class Object {
protected:
	// Declare the constructors in protected section. Copying is left to the
	// concrete shapes so an Object is never sliced.
	Object();
	Object(const Object &) = default;
	Object &operator=(const Object &) = default;

public:
	// Destructor
	virtual ~Object();

	// Object to world transform.
	const Matrix4 &transform() const;
	const Matrix4 &inverse_transform() const;

	// Throws NotInvertibleError if the transform is singular, leaving the object unchanged.
	void set_transform(const Matrix4 &transform);

	const Material &material() const;
	Material &material();
	void set_material(const Material &material);

	// Intersect a world space ray, results are in ascending order of t.
	std::vector<Intersection> intersect(const Ray &ray) const;

	// Unit surface normal at a world space point.
	Vector normal_at(const Point &world_point) const;

protected:
	// Virtual function interface declaration

	// Ray parameters where the object space ray crosses the surface.
	virtual std::vector<double> local_intersect(const Ray &object_ray) const = 0;

	// Unnormalized surface normal at an object space point.
	virtual Vector local_normal_at(const Point &object_point) const = 0;

private:
	Matrix4 transform_;
	Matrix4 inverse_; // Cached inverse of transform_
	Matrix4 normal_matrix_; // Cached transpose of inverse_
	Material material_;
};

}

#endif
