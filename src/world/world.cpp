#include <basic/transform.h>
#include <light/lighting.h>
#include <object/sphere.h>
#include <stdexcept>
#include <utility>
#include <world/world.h>

namespace umb {

Object &World::add_object(std::unique_ptr<Object> object) {
	if (!object) {
		throw std::invalid_argument("Object pointer cannot be null");
	}
	objects_.push_back(std::move(object));
	return *objects_.back();
}

std::size_t World::object_count() const {
	return objects_.size();
}

Object &World::object(std::size_t index) {
	return *objects_.at(index);
}

const Object &World::object(std::size_t index) const {
	return *objects_.at(index);
}

void World::clear_objects() {
	objects_.clear();
}

const std::optional<PointLight> &World::light() const {
	return light_;
}

void World::set_light(const PointLight &light) {
	light_ = light;
}

void World::clear_light() {
	light_.reset();
}

std::vector<Intersection> World::intersect(const Ray &ray) const {
	std::vector<Intersection> intersections;
	for (const auto &object : objects_) {
		std::vector<Intersection> xs = object->intersect(ray);
		intersections.insert(intersections.end(), xs.begin(), xs.end());
	}
	sort_intersections(intersections);
	return intersections;
}

Color World::shade_hit(const PreparedHit &hit) const {
	if (!light_) {
		return Color::black();
	}
	return lighting(hit.object->material(), *light_, hit.point, hit.eye_vector, hit.normal_vector,
		is_shadowed(hit.over_point));
}

Color World::color_at(const Ray &ray) const {
	std::optional<Intersection> hit = find_hit(intersect(ray));
	if (!hit) {
		return Color::black();
	}
	return shade_hit(prepare_hit(*hit, ray));
}

bool World::is_shadowed(const Point &point) const {
	if (!light_) {
		return false;
	}

	Vector shadow_vector = light_->position() - point;
	double distance = shadow_vector.magnitude();
	if (distance == 0.0) {
		// The point is the light itself.
		return false;
	}

	Ray shadow_ray(point, shadow_vector / distance);
	std::optional<Intersection> hit = find_hit(intersect(shadow_ray));
	return hit && hit->t < distance;
}

World default_world() {
	World world;
	world.set_light(PointLight(Point::point(-10, 10, -10), Color::white()));

	auto outer = std::make_unique<Sphere>();
	outer->material().color = Color(0.8, 1.0, 0.6);
	outer->material().diffuse = 0.7;
	outer->material().specular = 0.2;
	world.add_object(std::move(outer));

	auto inner = std::make_unique<Sphere>();
	inner->set_transform(scaling(0.5, 0.5, 0.5));
	world.add_object(std::move(inner));

	return world;
}

}
