#ifndef UMB_INCLUDE_LIGHT_LIGHTING_H
#define UMB_INCLUDE_LIGHT_LIGHTING_H

#include <basic/color.h>
#include <basic/tuple.h>
#include <light/point_light.h>
#include <material/material.h>

namespace umb {

// Phong reflection at a surface point: ambient + diffuse + specular.
// eye_vector and normal_vector must be unit vectors. When in_shadow is
// set, or when the point coincides with the light, only the ambient term
// contributes. The result is not clamped.
Color lighting(const Material &material, const PointLight &light, const Point &point,
	const Vector &eye_vector, const Vector &normal_vector, bool in_shadow);

}

#endif
