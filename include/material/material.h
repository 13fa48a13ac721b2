#ifndef UMB_INCLUDE_MATERIAL_MATERIAL_H
#define UMB_INCLUDE_MATERIAL_MATERIAL_H

#include <basic/color.h>

namespace umb {

// Phong surface parameters. Coefficients are expected in [0, 1] and
// shininess to be positive; neither is enforced.
struct Material {
	Color color = Color::white();
	double ambient = 0.1;
	double diffuse = 0.9;
	double specular = 0.9;
	double shininess = 200.0;
};

bool operator==(const Material &a, const Material &b);
bool operator!=(const Material &a, const Material &b);

}

#endif
