// Plots the flight of a projectile pushed around by gravity and wind.
#include <basic/color.h>
#include <basic/tuple.h>
#include <canvas.h>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>

using namespace umb;

namespace {

struct Projectile {
	Point position;
	Vector velocity;
};

struct Environment {
	Vector gravity;
	Vector wind;
};

// Advance one time step.
Projectile tick(const Environment &environment, const Projectile &projectile) {
	return Projectile{ projectile.position + projectile.velocity,
		projectile.velocity + environment.gravity + environment.wind };
}

}

int main(int argc, char **argv) {
	if (argc > 2) {
		std::cerr << "Usage: " << argv[0] << " [output.ppm]\n";
		return 1;
	}
	const std::string output = argc > 1 ? argv[1] : "projectile.ppm";

	try {
		Canvas canvas(900, 550);
		const Color color(0, 1, 1);

		Projectile projectile{ Point::point(0, 1, 0), Vector::vector(1, 1.8, 0).normalized() * 11.25 };
		const Environment environment{ Vector::vector(0, -0.1, 0), Vector::vector(-0.01, 0, 0) };

		int ticks = 0;
		while (true) {
			projectile = tick(environment, projectile);
			++ticks;
			std::cout << "position: " << projectile.position << "\n";

			// Canvas y grows downwards.
			int x = static_cast<int>(std::lround(projectile.position.x()));
			int y = canvas.height() - static_cast<int>(std::lround(projectile.position.y()));
			if (x < 0 || x >= canvas.width() || y < 0 || y >= canvas.height()) {
				break;
			}
			canvas.write_pixel(x, y, color);
		}
		std::cout << "ticks: " << ticks << "\n";

		canvas.save(output);
	} catch (const std::exception &e) {
		std::cerr << "projectile: " << e.what() << "\n";
		return 1;
	}

	std::cout << "Saved to " << output << "\n";
	return 0;
}
