#include <algorithm>
#include <canvas.h>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

namespace umb {

namespace {

// PPM readers may reject lines of 70 characters or more.
constexpr std::size_t PPM_LINE_LENGTH = 70;

// Clamp while still a double, large values would overflow the int conversion.
int encode_channel(double value) {
	if (std::isnan(value)) {
		return 0;
	}
	double scaled = std::clamp(value * 255.0, 0.0, 255.0);
	return static_cast<int>(std::lround(scaled));
}

}

Canvas::Canvas(int width, int height) : width_(width), height_(height) {
	if (width <= 0 || height <= 0) {
		throw std::invalid_argument("Canvas width and height must be positive.");
	}
	pixels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), Color::black());
}

int Canvas::width() const {
	return width_;
}

int Canvas::height() const {
	return height_;
}

std::size_t Canvas::index(int x, int y) const {
	if (x < 0 || x >= width_ || y < 0 || y >= height_) {
		throw std::out_of_range("Pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") is outside the canvas.");
	}
	return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
}

const Color &Canvas::pixel_at(int x, int y) const {
	return pixels_[index(x, y)];
}

void Canvas::write_pixel(int x, int y, const Color &color) {
	pixels_[index(x, y)] = color;
}

std::string Canvas::to_ppm() const {
	std::ostringstream ppm;
	ppm << "P3\n" << width_ << " " << height_ << "\n255\n";

	const std::size_t values_per_row = static_cast<std::size_t>(width_) * 3;
	std::size_t count = 0;
	std::string line;

	auto flush = [&]() {
		ppm << line << '\n';
		line.clear();
	};

	for (const Color &pixel : pixels_) {
		for (double channel : { pixel.red(), pixel.green(), pixel.blue() }) {
			std::string value = std::to_string(encode_channel(channel));

			// Wrap before the value rather than splitting it.
			if (line.size() + 1 + value.size() >= PPM_LINE_LENGTH) {
				flush();
			}
			if (!line.empty()) {
				line += ' ';
			}
			line += value;

			// Every pixel row ends its own line.
			if (++count % values_per_row == 0) {
				flush();
			}
		}
	}
	flush();

	return ppm.str();
}

void Canvas::save(const std::string &file_path) const {
	std::ofstream file(file_path, std::ios::binary);
	if (!file) {
		throw std::runtime_error("Failed to open image file: " + file_path);
	}
	file << to_ppm();
	if (!file) {
		throw std::runtime_error("Failed to write image file: " + file_path);
	}
}

}
