#include <algorithm>
#include <camera/camera.h>
#include <cmath>
#include <future>
#include <stdexcept>
#include <vector>

namespace umb {

Camera::Camera(int hsize, int vsize, double field_of_view)
	: hsize_(hsize), vsize_(vsize), field_of_view_(field_of_view), transform_(Matrix4::identity()), inverse_(Matrix4::identity()) {
	if (hsize <= 0 || vsize <= 0) {
		throw std::invalid_argument("Camera hsize and vsize must be positive.");
	}

	double half_view = std::tan(field_of_view / 2.0);
	double aspect = static_cast<double>(hsize) / static_cast<double>(vsize);
	if (aspect >= 1.0) {
		half_width_ = half_view;
		half_height_ = half_view / aspect;
	} else {
		half_width_ = half_view * aspect;
		half_height_ = half_view;
	}
	pixel_size_ = (half_width_ * 2.0) / static_cast<double>(hsize);
}

Camera::Camera(int hsize, int vsize, double field_of_view, const Matrix4 &transform) : Camera(hsize, vsize, field_of_view) {
	set_transform(transform);
}

int Camera::hsize() const {
	return hsize_;
}

int Camera::vsize() const {
	return vsize_;
}

double Camera::field_of_view() const {
	return field_of_view_;
}

double Camera::half_width() const {
	return half_width_;
}

double Camera::half_height() const {
	return half_height_;
}

double Camera::pixel_size() const {
	return pixel_size_;
}

const Matrix4 &Camera::transform() const {
	return transform_;
}

void Camera::set_transform(const Matrix4 &transform) {
	Matrix4 inverse = transform.inverse();
	transform_ = transform;
	inverse_ = inverse;
}

Ray Camera::ray_for_pixel(int px, int py) const {
	// Offset from the edge of the canvas to the pixel's center
	double x_offset = (px + 0.5) * pixel_size_;
	double y_offset = (py + 0.5) * pixel_size_;

	// The camera looks toward -z, so +x is to the left.
	double world_x = half_width_ - x_offset;
	double world_y = half_height_ - y_offset;

	Point pixel = inverse_ * Point::point(world_x, world_y, -1.0);
	Point origin = inverse_ * Point::point(0, 0, 0);
	Vector direction = (pixel - origin).normalized();

	return Ray(origin, direction);
}

void Camera::render_rows(const World &world, Canvas &canvas, int first, int stride) const {
	for (int y = first; y < vsize_; y += stride) {
		for (int x = 0; x < hsize_; ++x) {
			canvas.write_pixel(x, y, world.color_at(ray_for_pixel(x, y)));
		}
	}
}

Canvas Camera::render(const World &world, unsigned threads) const {
	Canvas canvas(hsize_, vsize_);

	int workers = static_cast<int>(std::min<unsigned>(std::max(threads, 1u), static_cast<unsigned>(vsize_)));
	if (workers == 1) {
		render_rows(world, canvas, 0, 1);
		return canvas;
	}

	// Interleaved rows balance the work; every pixel is written by exactly one worker.
	std::vector<std::future<void>> futures;
	futures.reserve(workers);
	for (int i = 0; i < workers; ++i) {
		futures.emplace_back(std::async(std::launch::async, [this, &world, &canvas, i, workers]() {
			render_rows(world, canvas, i, workers);
		}));
	}

	// Wait for every worker before rethrowing, the canvas is shared.
	for (auto &future : futures) {
		future.wait();
	}
	for (auto &future : futures) {
		future.get();
	}

	return canvas;
}

}
