// Draws the twelve hour marks of a clock face using matrix transformations.
#include <basic/color.h>
#include <basic/transform.h>
#include <basic/tuple.h>
#include <canvas.h>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>

using namespace umb;

int main(int argc, char **argv) {
	if (argc > 2) {
		std::cerr << "Usage: " << argv[0] << " [output.ppm]\n";
		return 1;
	}
	const std::string output = argc > 1 ? argv[1] : "clockface.ppm";
	const int size = 500;

	try {
		Canvas canvas(size, size);
		const Color color = Color::white();

		// Rotate 1/12 of a circle for each hour, starting at 12 o'clock.
		Point hour_point = Point::point(0, 1, 0);
		const Matrix4 hour_rotation = rotation_z(-M_PI / 6.0);

		// Flip around x since canvas y grows downwards, then scale and center.
		const double clock_radius = 3.0 * size / 8.0;
		const Matrix4 transform = translation(size / 2.0, size / 2.0, 0)
			* scaling(clock_radius, clock_radius, 0)
			* rotation_x(M_PI);

		for (int hour = 0; hour < 12; ++hour) {
			Point p = transform * hour_point;
			int x = static_cast<int>(std::lround(p.x()));
			int y = static_cast<int>(std::lround(p.y()));
			std::cout << "hour " << hour << ": " << hour_point << " -> (" << x << ", " << y << ")\n";
			canvas.write_pixel(x, y, color);
			hour_point = hour_rotation * hour_point;
		}

		canvas.save(output);
	} catch (const std::exception &e) {
		std::cerr << "clockface: " << e.what() << "\n";
		return 1;
	}

	std::cout << "Saved to " << output << "\n";
	return 0;
}
