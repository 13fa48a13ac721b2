#include <material/material.h>

namespace umb {

bool operator==(const Material &a, const Material &b) {
	return a.color == b.color
		&& equal(a.ambient, b.ambient)
		&& equal(a.diffuse, b.diffuse)
		&& equal(a.specular, b.specular)
		&& equal(a.shininess, b.shininess);
}

bool operator!=(const Material &a, const Material &b) {
	return !(a == b);
}

}
