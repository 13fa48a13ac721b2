#include <basic/ray.h>

namespace umb {

Ray::Ray(const Point &origin, const Vector &direction) : origin(origin), direction(direction) {
}

Point Ray::position(double t) const {
	return origin + direction * t;
}

Ray Ray::transform(const Matrix4 &m) const {
	return Ray(m * origin, m * direction);
}

}
