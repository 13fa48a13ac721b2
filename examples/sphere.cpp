// Casts rays from a fixed eye through a wall of pixels onto a single lit
// sphere, without a camera or world.
#include <basic/color.h>
#include <basic/ray.h>
#include <basic/tuple.h>
#include <canvas.h>
#include <exception>
#include <iomanip>
#include <iostream>
#include <light/lighting.h>
#include <light/point_light.h>
#include <object/intersection.h>
#include <object/sphere.h>
#include <optional>
#include <stdexcept>
#include <string>

using namespace umb;

int main(int argc, char **argv) {
	int canvas_size = 500;
	std::string output = "sphere.ppm";

	try {
		if (argc > 3) {
			throw std::invalid_argument("too many arguments");
		}
		if (argc > 1) {
			canvas_size = std::stoi(argv[1]);
		}
		if (argc > 2) {
			output = argv[2];
		}
	} catch (const std::exception &e) {
		std::cerr << "Usage: " << argv[0] << " [size] [output.ppm] (" << e.what() << ")\n";
		return 1;
	}

	try {
		const double wall_z = 5.0;
		const double wall_size = 5.0;
		const double half_wall = wall_size / 2.0;
		const double pixel_size = wall_size / canvas_size;

		Canvas canvas(canvas_size, canvas_size);

		Sphere sphere;
		sphere.material().color = Color(1, 0, 1);

		const PointLight light(Point::point(-10, 10, -10), Color::white());
		const Point ray_origin = Point::point(0, 0, -5);

		std::cout << "Starting render..." << std::endl;
		for (int y = 0; y < canvas_size; ++y) {
			if (y % 16 == 0) {
				std::cerr << "\rProgress: " << std::setw(4) << y << "/" << canvas_size << " rows" << std::flush;
			}
			double world_y = half_wall - pixel_size * y;
			for (int x = 0; x < canvas_size; ++x) {
				double world_x = -half_wall + pixel_size * x;
				Point wall_point = Point::point(world_x, world_y, wall_z);
				Ray ray(ray_origin, (wall_point - ray_origin).normalized());

				std::optional<Intersection> hit = find_hit(sphere.intersect(ray));
				if (!hit) {
					continue;
				}
				PreparedHit prepared = prepare_hit(*hit, ray);
				Color color = lighting(sphere.material(), light, prepared.point, prepared.eye_vector,
					prepared.normal_vector, false);
				canvas.write_pixel(x, y, color);
			}
		}
		std::cerr << "\nRender complete.\n";

		canvas.save(output);
	} catch (const std::exception &e) {
		std::cerr << "sphere: " << e.what() << "\n";
		return 1;
	}

	std::cout << "Saved to " << output << "\n";
	return 0;
}
