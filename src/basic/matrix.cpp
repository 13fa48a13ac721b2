#include <basic/matrix.h>

namespace umb {

Tuple operator*(const Matrix4 &m, const Tuple &t) {
	double e[4];
	for (int r = 0; r < 4; ++r) {
		e[r] = m(r, 0) * t.x() + m(r, 1) * t.y() + m(r, 2) * t.z() + m(r, 3) * t.w();
	}
	return Tuple(e[0], e[1], e[2], e[3]);
}

}
