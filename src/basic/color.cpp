#include <basic/color.h>

namespace umb {

Color::Color()
	: e_ { 0, 0, 0 } {
}

Color::Color(double red, double green, double blue)
	: e_ { red, green, blue } {
}

Color Color::black() {
	return Color(0, 0, 0);
}

Color Color::white() {
	return Color(1, 1, 1);
}

double Color::red() const {
	return e_[0];
}

double Color::green() const {
	return e_[1];
}

double Color::blue() const {
	return e_[2];
}

Color &Color::operator+=(const Color &c) {
	e_[0] += c.e_[0];
	e_[1] += c.e_[1];
	e_[2] += c.e_[2];
	return *this;
}

Color &Color::operator-=(const Color &c) {
	e_[0] -= c.e_[0];
	e_[1] -= c.e_[1];
	e_[2] -= c.e_[2];
	return *this;
}

Color &Color::operator*=(double s) {
	e_[0] *= s;
	e_[1] *= s;
	e_[2] *= s;
	return *this;
}

bool Color::approx_equal(const Color &c, double epsilon) const {
	return equal(e_[0], c.e_[0], epsilon) && equal(e_[1], c.e_[1], epsilon) && equal(e_[2], c.e_[2], epsilon);
}

Color operator+(const Color &a, const Color &b) {
	return Color(a.e_[0] + b.e_[0], a.e_[1] + b.e_[1], a.e_[2] + b.e_[2]);
}

Color operator-(const Color &a, const Color &b) {
	return Color(a.e_[0] - b.e_[0], a.e_[1] - b.e_[1], a.e_[2] - b.e_[2]);
}

Color operator*(const Color &a, const Color &b) {
	return Color(a.e_[0] * b.e_[0], a.e_[1] * b.e_[1], a.e_[2] * b.e_[2]);
}

Color operator*(const Color &c, double s) {
	return Color(c.e_[0] * s, c.e_[1] * s, c.e_[2] * s);
}

Color operator*(double s, const Color &c) {
	return c * s;
}

bool operator==(const Color &a, const Color &b) {
	return a.approx_equal(b);
}

bool operator!=(const Color &a, const Color &b) {
	return !(a == b);
}

std::ostream &operator<<(std::ostream &os, const Color &c) {
	return os << "(" << c.red() << ", " << c.green() << ", " << c.blue() << ")";
}

}
