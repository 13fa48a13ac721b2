#include <basic/color.h>
#include <canvas.h>
#include <catch2/catch.hpp>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace umb;

namespace {

std::vector<std::string> split_lines(const std::string &text) {
	std::vector<std::string> lines;
	std::istringstream stream(text);
	std::string line;
	while (std::getline(stream, line)) {
		lines.push_back(line);
	}
	return lines;
}

}

TEST_CASE("Canvas creation", "[canvas]") {
	Canvas c(10, 20);
	REQUIRE(c.width() == 10);
	REQUIRE(c.height() == 20);
	for (int y = 0; y < c.height(); ++y) {
		for (int x = 0; x < c.width(); ++x) {
			REQUIRE(c.pixel_at(x, y) == Color(0, 0, 0));
		}
	}

	SECTION("non-positive sizes are rejected") {
		REQUIRE_THROWS_AS(Canvas(0, 10), std::invalid_argument);
		REQUIRE_THROWS_AS(Canvas(10, -3), std::invalid_argument);
	}
}

TEST_CASE("Writing pixels", "[canvas]") {
	Canvas c(10, 20);
	c.write_pixel(2, 3, Color(1, 0, 0));
	REQUIRE(c.pixel_at(2, 3) == Color(1, 0, 0));
	REQUIRE(c.pixel_at(3, 2) == Color(0, 0, 0));

	SECTION("outside the canvas") {
		REQUIRE_THROWS_AS(c.write_pixel(10, 0, Color(1, 1, 1)), std::out_of_range);
		REQUIRE_THROWS_AS(c.write_pixel(0, -1, Color(1, 1, 1)), std::out_of_range);
		REQUIRE_THROWS_AS(c.pixel_at(0, 20), std::out_of_range);
	}
}

TEST_CASE("PPM encoding", "[canvas][ppm]") {
	SECTION("header") {
		std::vector<std::string> lines = split_lines(Canvas(5, 3).to_ppm());
		REQUIRE(lines.size() >= 3);
		REQUIRE(lines[0] == "P3");
		REQUIRE(lines[1] == "5 3");
		REQUIRE(lines[2] == "255");
	}

	SECTION("pixel data is scaled and clamped") {
		Canvas c(5, 3);
		c.write_pixel(0, 0, Color(1.5, 0, 0));
		c.write_pixel(2, 1, Color(0, 0.5, 0));
		c.write_pixel(4, 2, Color(-0.5, 0, 1));

		std::vector<std::string> lines = split_lines(c.to_ppm());
		REQUIRE(lines.size() >= 6);
		REQUIRE(lines[3] == "255 0 0 0 0 0 0 0 0 0 0 0 0 0 0");
		REQUIRE(lines[4] == "0 0 0 0 0 0 0 128 0 0 0 0 0 0 0");
		REQUIRE(lines[5] == "0 0 0 0 0 0 0 0 0 0 0 0 0 0 255");
	}

	SECTION("long lines are split") {
		Canvas c(10, 2);
		for (int y = 0; y < 2; ++y) {
			for (int x = 0; x < 10; ++x) {
				c.write_pixel(x, y, Color(1, 0.8, 0.6));
			}
		}

		std::vector<std::string> lines = split_lines(c.to_ppm());
		REQUIRE(lines.size() >= 7);
		REQUIRE(lines[3] == "255 204 153 255 204 153 255 204 153 255 204 153 255 204 153 255 204");
		REQUIRE(lines[4] == "153 255 204 153 255 204 153 255 204 153 255 204 153");
		REQUIRE(lines[5] == "255 204 153 255 204 153 255 204 153 255 204 153 255 204 153 255 204");
		REQUIRE(lines[6] == "153 255 204 153 255 204 153 255 204 153 255 204 153");
		for (const std::string &line : lines) {
			REQUIRE(line.size() < 70);
		}
	}

	SECTION("very bright and undefined channels are clamped") {
		Canvas c(2, 1);
		c.write_pixel(0, 0, Color(1e8, 2, 1));
		c.write_pixel(1, 0, Color(std::nan(""), -1e12, 0));

		std::vector<std::string> lines = split_lines(c.to_ppm());
		REQUIRE(lines.size() >= 4);
		REQUIRE(lines[3] == "255 255 255 0 0 0");
	}

	SECTION("ends with a newline") {
		std::string ppm = Canvas(5, 3).to_ppm();
		REQUIRE_FALSE(ppm.empty());
		REQUIRE(ppm.back() == '\n');
	}
}

TEST_CASE("Saving a canvas", "[canvas]") {
	Canvas c(2, 2);
	REQUIRE_THROWS_AS(c.save("/nonexistent-directory/image.ppm"), std::runtime_error);
}
