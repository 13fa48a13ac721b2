#include <algorithm>
#include <basic/math.h>
#include <object/intersection.h>
#include <object/object.h>

namespace umb {

Intersection::Intersection(double t, const Object *object) : t(t), object(object) {
}

bool operator<(const Intersection &a, const Intersection &b) {
	return a.t < b.t;
}

void sort_intersections(std::vector<Intersection> &intersections) {
	std::stable_sort(intersections.begin(), intersections.end());
}

std::optional<Intersection> find_hit(const std::vector<Intersection> &intersections) {
	std::optional<Intersection> hit;
	for (const Intersection &i : intersections) {
		if (i.t < 0.0) {
			continue;
		}
		if (!hit || i.t < hit->t) {
			hit = i;
		}
	}
	return hit;
}

PreparedHit prepare_hit(const Intersection &intersection, const Ray &ray) {
	PreparedHit hit;
	hit.t = intersection.t;
	hit.object = intersection.object;
	hit.point = ray.position(intersection.t);
	hit.eye_vector = -ray.direction;
	hit.normal_vector = intersection.object->normal_at(hit.point);

	if (hit.normal_vector.dot(hit.eye_vector) < 0.0) {
		hit.inside = true;
		hit.normal_vector = -hit.normal_vector;
	} else {
		hit.inside = false;
	}

	// Offset to keep shadow rays from re-hitting the same surface.
	hit.over_point = hit.point + hit.normal_vector * EPSILON;
	return hit;
}

}
