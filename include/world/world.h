#ifndef UMB_INCLUDE_WORLD_WORLD_H
#define UMB_INCLUDE_WORLD_WORLD_H

#include <basic/color.h>
#include <basic/ray.h>
#include <basic/tuple.h>
#include <light/point_light.h>
#include <memory>
#include <object/intersection.h>
#include <object/object.h>
#include <optional>
#include <vector>

namespace umb {

// Scene container: an ordered set of owned objects and at most one light.
// All queries are read-only, so a World may be shared between render threads.
class World {
public:
	// Constructors
	World() = default;
	World(World &&) = default;
	World &operator=(World &&) = default;

	// Take ownership of an object and return a reference to it. Throws std::invalid_argument on null.
	Object &add_object(std::unique_ptr<Object> object);

	std::size_t object_count() const;
	Object &object(std::size_t index); // Throws std::out_of_range
	const Object &object(std::size_t index) const;
	void clear_objects();

	const std::optional<PointLight> &light() const;
	void set_light(const PointLight &light);
	void clear_light();

	// All intersections of the ray with every object, ascending by t.
	std::vector<Intersection> intersect(const Ray &ray) const;

	// Shade a prepared hit, black if there is no light.
	Color shade_hit(const PreparedHit &hit) const;

	// Color seen along the ray, black when nothing is hit.
	Color color_at(const Ray &ray) const;

	// Whether something lies between the point and the light. Always false without a light.
	bool is_shadowed(const Point &point) const;

private:
	std::vector<std::unique_ptr<Object>> objects_;
	std::optional<PointLight> light_;
};

// Two concentric spheres lit from (-10, 10, -10): the outer one green tinted,
// the inner one scaled by 0.5.
World default_world();

}

#endif
