#include <basic/transform.h>
#include <cmath>

namespace umb {

Matrix4 translation(double x, double y, double z) {
	return Matrix4 {
		{ 1, 0, 0, x },
		{ 0, 1, 0, y },
		{ 0, 0, 1, z },
		{ 0, 0, 0, 1 },
	};
}

Matrix4 scaling(double x, double y, double z) {
	return Matrix4 {
		{ x, 0, 0, 0 },
		{ 0, y, 0, 0 },
		{ 0, 0, z, 0 },
		{ 0, 0, 0, 1 },
	};
}

Matrix4 rotation_x(double radians) {
	double c = std::cos(radians), s = std::sin(radians);
	return Matrix4 {
		{ 1, 0, 0, 0 },
		{ 0, c, -s, 0 },
		{ 0, s, c, 0 },
		{ 0, 0, 0, 1 },
	};
}

Matrix4 rotation_y(double radians) {
	double c = std::cos(radians), s = std::sin(radians);
	return Matrix4 {
		{ c, 0, s, 0 },
		{ 0, 1, 0, 0 },
		{ -s, 0, c, 0 },
		{ 0, 0, 0, 1 },
	};
}

Matrix4 rotation_z(double radians) {
	double c = std::cos(radians), s = std::sin(radians);
	return Matrix4 {
		{ c, -s, 0, 0 },
		{ s, c, 0, 0 },
		{ 0, 0, 1, 0 },
		{ 0, 0, 0, 1 },
	};
}

Matrix4 shearing(double xy, double xz, double yx, double yz, double zx, double zy) {
	return Matrix4 {
		{ 1, xy, xz, 0 },
		{ yx, 1, yz, 0 },
		{ zx, zy, 1, 0 },
		{ 0, 0, 0, 1 },
	};
}

Matrix4 view_transform(const Point &from, const Point &to, const Vector &up) {
	Vector forward = (to - from).normalized();
	Vector left = forward.cross(up.normalized());
	Vector true_up = left.cross(forward);

	Matrix4 orientation {
		{ left.x(), left.y(), left.z(), 0 },
		{ true_up.x(), true_up.y(), true_up.z(), 0 },
		{ -forward.x(), -forward.y(), -forward.z(), 0 },
		{ 0, 0, 0, 1 },
	};

	return orientation * translation(-from.x(), -from.y(), -from.z());
}

}
