#include <object/object.h>

namespace umb {

Object::Object() : transform_(Matrix4::identity()), inverse_(Matrix4::identity()), normal_matrix_(Matrix4::identity()) {
}

Object::~Object() = default;

const Matrix4 &Object::transform() const {
	return transform_;
}

const Matrix4 &Object::inverse_transform() const {
	return inverse_;
}

void Object::set_transform(const Matrix4 &transform) {
	// inverse() throws before any member is touched.
	Matrix4 inverse = transform.inverse();
	transform_ = transform;
	inverse_ = inverse;
	normal_matrix_ = inverse.transpose();
}

const Material &Object::material() const {
	return material_;
}

Material &Object::material() {
	return material_;
}

void Object::set_material(const Material &material) {
	material_ = material;
}

std::vector<Intersection> Object::intersect(const Ray &ray) const {
	std::vector<double> ts = local_intersect(ray.transform(inverse_));

	std::vector<Intersection> intersections;
	intersections.reserve(ts.size());
	for (double t : ts) {
		intersections.emplace_back(t, this);
	}
	sort_intersections(intersections);
	return intersections;
}

Vector Object::normal_at(const Point &world_point) const {
	Point object_point = inverse_ * world_point;
	Vector object_normal = local_normal_at(object_point);
	Vector world_normal = normal_matrix_ * object_normal;

	// The transposed inverse can leak translation into w.
	world_normal[3] = 0.0;
	return world_normal.normalized();
}

}
