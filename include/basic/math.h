#ifndef UMB_INCLUDE_BASIC_MATH_H
#define UMB_INCLUDE_BASIC_MATH_H

namespace umb {

// Tolerance used for approximate floating point comparisons and for the
// shadow acne offset along surface normals.
constexpr double EPSILON = 1e-5;

// Check if two scalars are equal within the given tolerance.
bool equal(double a, double b, double epsilon = EPSILON);

}

#endif
