#ifndef UMB_INCLUDE_CANVAS_H
#define UMB_INCLUDE_CANVAS_H

#include <basic/color.h>
#include <string>
#include <vector>

namespace umb {

// Row-major raster of colors, created black.
class Canvas {
public:
	// Constructors
	Canvas(int width, int height); // Throws std::invalid_argument unless both are positive.

	int width() const;
	int height() const;

	// Pixel access, throws std::out_of_range outside the canvas.
	const Color &pixel_at(int x, int y) const;
	void write_pixel(int x, int y, const Color &color);

	// Encode as plain text PPM (P3). Channels are scaled to [0, 255] and
	// lines are kept under 70 characters.
	std::string to_ppm() const;

	// Save to_ppm() to a file, throws std::runtime_error on I/O failure.
	void save(const std::string &file_path) const;

private:
	int width_, height_;
	std::vector<Color> pixels_;

	std::size_t index(int x, int y) const;
};

}

#endif
