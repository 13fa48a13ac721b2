// Renders three spheres on a floor between two walls, all built from
// flattened spheres, through a camera.
#include <algorithm>
#include <basic/color.h>
#include <basic/error.h>
#include <basic/transform.h>
#include <basic/tuple.h>
#include <camera/camera.h>
#include <canvas.h>
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <light/point_light.h>
#include <material/material.h>
#include <memory>
#include <object/sphere.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <world/world.h>

using namespace umb;

namespace {

struct Options {
	int width = 500;
	int height = 250;
	unsigned threads = std::max(1u, std::thread::hardware_concurrency());
	std::string output = "scene.ppm";
};

// scene [width height] [threads] [output.ppm]
// A trailing argument ending in .ppm is the output path, the numbers before
// it are read as threads, width height, or width height threads.
Options parse_options(int argc, char **argv) {
	Options options;
	std::vector<std::string> numbers;
	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		if (i == argc - 1 && arg.size() > 4 && arg.substr(arg.size() - 4) == ".ppm") {
			options.output = arg;
		} else {
			numbers.push_back(arg);
		}
	}

	int threads = 0;
	switch (numbers.size()) {
	case 0:
		break;
	case 1:
		threads = std::stoi(numbers[0]);
		break;
	case 2:
	case 3:
		options.width = std::stoi(numbers[0]);
		options.height = std::stoi(numbers[1]);
		if (numbers.size() == 3) {
			threads = std::stoi(numbers[2]);
		}
		break;
	default:
		throw std::invalid_argument("too many arguments");
	}

	if (numbers.size() == 1 || numbers.size() == 3) {
		if (threads <= 0) {
			throw std::invalid_argument("threads must be positive");
		}
		options.threads = static_cast<unsigned>(threads);
	}
	return options;
}

// A singular transform would poison the image with NaNs, so such a
// primitive is left out of the world.
void add_sphere(World &world, const std::string &name, const Matrix4 &transform, const Material &material) {
	auto sphere = std::make_unique<Sphere>();
	try {
		sphere->set_transform(transform);
	} catch (const NotInvertibleError &e) {
		std::cerr << "Skipping " << name << ": " << e.what() << "\n";
		return;
	}
	sphere->set_material(material);
	world.add_object(std::move(sphere));
}

World build_world() {
	World world;
	world.set_light(PointLight(Point::point(-10, 10, -10), Color::white()));

	Material wall;
	wall.color = Color(0.9, 0.9, 0.9);
	wall.specular = 0;

	add_sphere(world, "floor", scaling(10, 0.01, 10), wall);
	add_sphere(world, "left wall",
		translation(0, 0, 5) * rotation_y(-M_PI / 4) * rotation_x(M_PI / 2) * scaling(10, 0.01, 10), wall);
	add_sphere(world, "right wall",
		translation(0, 0, 5) * rotation_y(M_PI / 4) * rotation_x(M_PI / 2) * scaling(10, 0.01, 10), wall);

	Material middle;
	middle.color = Color(0, 1, 0);
	middle.diffuse = 0.7;
	middle.specular = 0.3;
	add_sphere(world, "middle sphere", translation(-0.5, 1, 0.5), middle);

	Material right;
	right.color = Color(0, 0, 1);
	right.diffuse = 0.7;
	right.specular = 0.3;
	add_sphere(world, "right sphere", translation(1.5, 0.5, -0.5) * scaling(0.5, 0.5, 0.5), right);

	Material left;
	left.color = Color(1, 0, 0);
	left.diffuse = 0.7;
	left.specular = 0.3;
	add_sphere(world, "left sphere", translation(-1.5, 0.33, -0.75) * scaling(0.33, 0.33, 0.33), left);

	return world;
}

}

int main(int argc, char **argv) {
	Options options;
	try {
		options = parse_options(argc, argv);
	} catch (const std::exception &e) {
		std::cerr << "Usage: " << argv[0] << " [width height] [threads] [output.ppm] (" << e.what() << ")\n";
		return 1;
	}

	try {
		World world = build_world();

		Camera camera(options.width, options.height, M_PI / 3);
		camera.set_transform(view_transform(Point::point(0, 1.5, -5), Point::point(0, 1, 0), Vector::vector(0, 1, 0)));

		std::cout << "Rendering " << options.width << "x" << options.height << " with " << world.object_count()
				  << " objects on " << options.threads << " threads..." << std::endl;

		auto t0 = std::chrono::high_resolution_clock::now();
		Canvas canvas = camera.render(world, options.threads);
		auto t1 = std::chrono::high_resolution_clock::now();

		std::cout << "Render complete in " << std::fixed << std::setprecision(2)
				  << std::chrono::duration<double>(t1 - t0).count() << " s" << std::endl;

		canvas.save(options.output);
	} catch (const std::exception &e) {
		std::cerr << "scene: " << e.what() << "\n";
		return 1;
	}

	std::cout << "Saved to " << options.output << "\n";
	return 0;
}
