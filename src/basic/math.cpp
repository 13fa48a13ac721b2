#include <basic/math.h>
#include <cmath>

namespace umb {

bool equal(double a, double b, double epsilon) {
	return std::fabs(a - b) < epsilon;
}

}
