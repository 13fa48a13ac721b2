#include <light/point_light.h>
#include <stdexcept>

namespace umb {

PointLight::PointLight(const Point &position, const Color &intensity) : position_(position), intensity_(intensity) {
	if (!position.is_point()) {
		throw std::invalid_argument("Light position must be a point");
	}
}

const Point &PointLight::position() const {
	return position_;
}

const Color &PointLight::intensity() const {
	return intensity_;
}

bool operator==(const PointLight &a, const PointLight &b) {
	return a.position() == b.position() && a.intensity() == b.intensity();
}

bool operator!=(const PointLight &a, const PointLight &b) {
	return !(a == b);
}

}
