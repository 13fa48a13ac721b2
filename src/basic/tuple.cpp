#include <basic/error.h>
#include <basic/tuple.h>
#include <cmath>

namespace umb {

Tuple::Tuple()
	: e_ { 0, 0, 0, 0 } {
}

Tuple::Tuple(double x, double y, double z, double w)
	: e_ { x, y, z, w } {
}

Tuple Tuple::point(double x, double y, double z) {
	return Tuple(x, y, z, 1.0);
}

Tuple Tuple::vector(double x, double y, double z) {
	return Tuple(x, y, z, 0.0);
}

double Tuple::x() const {
	return e_[0];
}

double Tuple::y() const {
	return e_[1];
}

double Tuple::z() const {
	return e_[2];
}

double Tuple::w() const {
	return e_[3];
}

double Tuple::operator[](int i) const {
	return e_[i];
}

double &Tuple::operator[](int i) {
	return e_[i];
}

bool Tuple::is_point() const {
	return e_[3] == 1.0;
}

bool Tuple::is_vector() const {
	return e_[3] == 0.0;
}

Tuple Tuple::operator-() const {
	return Tuple(-e_[0], -e_[1], -e_[2], -e_[3]);
}

Tuple &Tuple::operator+=(const Tuple &t) {
	for (int i = 0; i < 4; ++i) {
		e_[i] += t.e_[i];
	}
	return *this;
}

Tuple &Tuple::operator-=(const Tuple &t) {
	for (int i = 0; i < 4; ++i) {
		e_[i] -= t.e_[i];
	}
	return *this;
}

Tuple &Tuple::operator*=(double s) {
	for (int i = 0; i < 4; ++i) {
		e_[i] *= s;
	}
	return *this;
}

Tuple &Tuple::operator/=(double s) {
	for (int i = 0; i < 4; ++i) {
		e_[i] /= s;
	}
	return *this;
}

double Tuple::magnitude() const {
	return std::sqrt(dot(*this));
}

Tuple Tuple::normalized() const {
	double len = magnitude();
	if (len == 0.0) {
		throw ZeroMagnitudeError("Cannot normalize a zero length tuple");
	}
	return *this / len;
}

double Tuple::dot(const Tuple &t) const {
	return e_[0] * t.e_[0] + e_[1] * t.e_[1] + e_[2] * t.e_[2] + e_[3] * t.e_[3];
}

Tuple Tuple::cross(const Tuple &t) const {
	return Tuple::vector(e_[1] * t.e_[2] - e_[2] * t.e_[1],
		e_[2] * t.e_[0] - e_[0] * t.e_[2],
		e_[0] * t.e_[1] - e_[1] * t.e_[0]);
}

Tuple Tuple::reflect(const Tuple &normal) const {
	return *this - normal * 2.0 * dot(normal);
}

bool Tuple::approx_equal(const Tuple &t, double epsilon) const {
	for (int i = 0; i < 4; ++i) {
		if (!equal(e_[i], t.e_[i], epsilon)) {
			return false;
		}
	}
	return true;
}

Tuple operator+(const Tuple &a, const Tuple &b) {
	return Tuple(a.e_[0] + b.e_[0], a.e_[1] + b.e_[1], a.e_[2] + b.e_[2], a.e_[3] + b.e_[3]);
}

Tuple operator-(const Tuple &a, const Tuple &b) {
	return Tuple(a.e_[0] - b.e_[0], a.e_[1] - b.e_[1], a.e_[2] - b.e_[2], a.e_[3] - b.e_[3]);
}

Tuple operator*(const Tuple &t, double s) {
	return Tuple(t.e_[0] * s, t.e_[1] * s, t.e_[2] * s, t.e_[3] * s);
}

Tuple operator*(double s, const Tuple &t) {
	return t * s;
}

// Division by zero follows IEEE semantics (inf or NaN components)
Tuple operator/(const Tuple &t, double s) {
	return Tuple(t.e_[0] / s, t.e_[1] / s, t.e_[2] / s, t.e_[3] / s);
}

bool operator==(const Tuple &a, const Tuple &b) {
	return a.approx_equal(b);
}

bool operator!=(const Tuple &a, const Tuple &b) {
	return !(a == b);
}

std::ostream &operator<<(std::ostream &os, const Tuple &t) {
	return os << "(" << t.x() << ", " << t.y() << ", " << t.z() << ", " << t.w() << ")";
}

}
