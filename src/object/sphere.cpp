#include <cmath>
#include <utility>
#include <object/sphere.h>

namespace umb {

Sphere::Sphere() = default;

Sphere::Sphere(const Matrix4 &transform, const Material &material) {
	set_transform(transform);
	set_material(material);
}

std::vector<double> Sphere::local_intersect(const Ray &object_ray) const {
	Vector sphere_to_ray = object_ray.origin - Point::point(0, 0, 0);

	double a = object_ray.direction.dot(object_ray.direction);
	double b = 2.0 * object_ray.direction.dot(sphere_to_ray);
	double c = sphere_to_ray.dot(sphere_to_ray) - 1.0;
	double discriminant = b * b - 4.0 * a * c;

	if (discriminant < 0.0) {
		return {};
	}

	double root = std::sqrt(discriminant);
	double t1 = (-b - root) / (2.0 * a);
	double t2 = (-b + root) / (2.0 * a);
	if (t1 > t2) {
		std::swap(t1, t2);
	}
	return { t1, t2 };
}

Vector Sphere::local_normal_at(const Point &object_point) const {
	return object_point - Point::point(0, 0, 0);
}

}
