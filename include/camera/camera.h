#ifndef UMB_INCLUDE_CAMERA_CAMERA_H
#define UMB_INCLUDE_CAMERA_CAMERA_H

#include <basic/matrix.h>
#include <basic/ray.h>
#include <canvas.h>
#include <world/world.h>

namespace umb {

// Pinhole camera looking down -z in its own space, with the image plane at z = -1.
class Camera {
public:
	// Constructors
	Camera() = delete;
	Camera(int hsize, int vsize, double field_of_view); // Throws std::invalid_argument on non-positive sizes.
	Camera(int hsize, int vsize, double field_of_view, const Matrix4 &transform);

	int hsize() const;
	int vsize() const;
	double field_of_view() const;
	double half_width() const;
	double half_height() const;
	double pixel_size() const;

	// World to camera transform, e.g. from view_transform(). Throws NotInvertibleError when singular.
	const Matrix4 &transform() const;
	void set_transform(const Matrix4 &transform);

	// Ray from the camera through the center of pixel (px, py).
	Ray ray_for_pixel(int px, int py) const;

	// Render the world into a new canvas. With threads > 1 the rows are
	// split between worker threads; pixels are independent so the result
	// is identical to the single threaded render.
	Canvas render(const World &world, unsigned threads = 1) const;

private:
	int hsize_, vsize_;
	double field_of_view_;
	double half_width_, half_height_, pixel_size_;
	Matrix4 transform_;
	Matrix4 inverse_; // Cached inverse of transform_

	// Render every row y with y % stride == first.
	void render_rows(const World &world, Canvas &canvas, int first, int stride) const;
};

}

#endif
