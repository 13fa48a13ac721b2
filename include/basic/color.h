#ifndef UMB_INCLUDE_BASIC_COLOR_H
#define UMB_INCLUDE_BASIC_COLOR_H

#include <basic/math.h>
#include <ostream>

namespace umb {

// RGB color, channels nominally in [0, 1]. Values outside that range are
// kept and only clamped when encoded.
class Color {
private:
	double e_[3]; // red, green, blue value

public:
	// Constructors
	Color();
	Color(double red, double green, double blue);

	static Color black();
	static Color white();

	// Channel access
	double red() const;
	double green() const;
	double blue() const;

	// Compound assignment operations
	Color &operator+=(const Color &c);
	Color &operator-=(const Color &c);
	Color &operator*=(double s);

	bool approx_equal(const Color &c, double epsilon = EPSILON) const;

	// Friend function declarations
	friend Color operator+(const Color &a, const Color &b);
	friend Color operator-(const Color &a, const Color &b);
	friend Color operator*(const Color &a, const Color &b); // Hadamard product
	friend Color operator*(const Color &c, double s);
	friend Color operator*(double s, const Color &c);
};

Color operator+(const Color &a, const Color &b);
Color operator-(const Color &a, const Color &b);
Color operator*(const Color &a, const Color &b);
Color operator*(const Color &c, double s);
Color operator*(double s, const Color &c);

bool operator==(const Color &a, const Color &b);
bool operator!=(const Color &a, const Color &b);

std::ostream &operator<<(std::ostream &os, const Color &c);

}

#endif
