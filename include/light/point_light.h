#ifndef UMB_INCLUDE_LIGHT_POINT_LIGHT_H
#define UMB_INCLUDE_LIGHT_POINT_LIGHT_H

#include <basic/color.h>
#include <basic/tuple.h>

namespace umb {

// Light source with no size, emitting from a single point.
class PointLight {
public:
	// Throws std::invalid_argument if position is not a point (w != 1).
	PointLight(const Point &position, const Color &intensity);

	const Point &position() const;
	const Color &intensity() const;

private:
	Point position_;
	Color intensity_;
};

bool operator==(const PointLight &a, const PointLight &b);
bool operator!=(const PointLight &a, const PointLight &b);

}

#endif
