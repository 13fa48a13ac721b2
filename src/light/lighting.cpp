#include <cmath>
#include <light/lighting.h>

namespace umb {

Color lighting(const Material &material, const PointLight &light, const Point &point,
	const Vector &eye_vector, const Vector &normal_vector, bool in_shadow) {
	// Combine the surface color with the light's color/intensity
	Color effective_color = material.color * light.intensity();

	Color ambient = effective_color * material.ambient;
	if (in_shadow) {
		return ambient;
	}

	// Direction to the light source, undefined when the point is the light itself.
	Vector to_light = light.position() - point;
	double distance = to_light.magnitude();
	if (distance == 0.0) {
		return ambient;
	}
	Vector light_vector = to_light / distance;

	// Cosine of the angle between light and normal, negative means the
	// light is on the other side of the surface.
	double light_dot_normal = light_vector.dot(normal_vector);
	if (light_dot_normal < 0.0) {
		return ambient;
	}

	Color diffuse = effective_color * material.diffuse * light_dot_normal;

	Color specular = Color::black();
	Vector reflect_vector = (-light_vector).reflect(normal_vector);
	double reflect_dot_eye = reflect_vector.dot(eye_vector);
	if (reflect_dot_eye > 0.0) {
		double factor = std::pow(reflect_dot_eye, material.shininess);
		specular = light.intensity() * material.specular * factor;
	}

	return ambient + diffuse + specular;
}

}
