#ifndef UMB_INCLUDE_OBJECT_INTERSECTION_H
#define UMB_INCLUDE_OBJECT_INTERSECTION_H

#include <basic/ray.h>
#include <basic/tuple.h>
#include <optional>
#include <vector>

namespace umb {

// The declaration of Object to avoid circular dependency(forward declaration), please see object.h for the detailed definition.
class Object;

// A ray parameter t at which a ray crosses the surface of an object.
// The object is not owned; it must outlive the intersection.
struct Intersection {
	double t;
	const Object *object;

	Intersection(double t, const Object *object);
};

// Orders intersections by t only.
bool operator<(const Intersection &a, const Intersection &b);

// Sort intersections ascending by t.
void sort_intersections(std::vector<Intersection> &intersections);

// The intersection with the lowest non-negative t, or nothing if every t is negative.
std::optional<Intersection> find_hit(const std::vector<Intersection> &intersections);

// Surface state at a hit, derived once from the intersection and the ray that produced it.
struct PreparedHit {
	double t;
	const Object *object;
	Point point; // World space hit point
	Vector eye_vector; // Points back towards the ray origin
	Vector normal_vector; // Flipped towards the eye when inside is true
	bool inside; // The ray started inside the object
	Point over_point; // point nudged along the normal, used as shadow ray origin
};

PreparedHit prepare_hit(const Intersection &intersection, const Ray &ray);

}

#endif
