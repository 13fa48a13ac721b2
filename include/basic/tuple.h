#ifndef UMB_INCLUDE_BASIC_TUPLE_H
#define UMB_INCLUDE_BASIC_TUPLE_H

#include <basic/math.h>
#include <ostream>

namespace umb {

// Homogeneous 4-component tuple. A tuple with w == 1 is a point, a tuple
// with w == 0 is a vector. Arithmetic does not enforce the distinction.
class Tuple {
private:
	double e_[4]; // x, y, z, w value

public:
	// Constructors
	Tuple();
	Tuple(double x, double y, double z, double w);

	// Named constructors
	static Tuple point(double x, double y, double z);
	static Tuple vector(double x, double y, double z);

	// Component access
	double x() const;
	double y() const;
	double z() const;
	double w() const;
	double operator[](int i) const;
	double &operator[](int i);

	bool is_point() const;
	bool is_vector() const;

	// Negation
	Tuple operator-() const;

	// Compound assignment operations
	Tuple &operator+=(const Tuple &t);
	Tuple &operator-=(const Tuple &t);
	Tuple &operator*=(double s);
	Tuple &operator/=(double s);

	// Euclidean norm over all four components
	double magnitude() const;

	// Normalization - throws ZeroMagnitudeError if the magnitude is zero
	Tuple normalized() const;

	// Dot product over all four components
	double dot(const Tuple &t) const;

	// Cross product of the xyz parts, always a vector
	Tuple cross(const Tuple &t) const;

	// Reflect this vector around the given normal
	Tuple reflect(const Tuple &normal) const;

	// Component-wise comparison within epsilon
	bool approx_equal(const Tuple &t, double epsilon = EPSILON) const;

	// Friend function declarations
	friend Tuple operator+(const Tuple &a, const Tuple &b);
	friend Tuple operator-(const Tuple &a, const Tuple &b);
	friend Tuple operator*(const Tuple &t, double s);
	friend Tuple operator*(double s, const Tuple &t);
	friend Tuple operator/(const Tuple &t, double s);
};

Tuple operator+(const Tuple &a, const Tuple &b);
Tuple operator-(const Tuple &a, const Tuple &b);
Tuple operator*(const Tuple &t, double s);
Tuple operator*(double s, const Tuple &t);
Tuple operator/(const Tuple &t, double s);

// Approximate equality using EPSILON
bool operator==(const Tuple &a, const Tuple &b);
bool operator!=(const Tuple &a, const Tuple &b);

std::ostream &operator<<(std::ostream &os, const Tuple &t);

using Point = Tuple;
using Vector = Tuple;

}

#endif
