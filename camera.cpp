#include "camera.hpp"

#include <glm/glm.hpp>

#include "ray.hpp"

Camera::Camera() : Camera(glm::vec3(0.0f), ASPECT_RATIO) {}

Camera::Camera(glm::vec3 camera_position, float aspect_ratio)
	: _position(camera_position), _aspect_ratio(aspect_ratio) {
	const float viewport_height = 2.0f;
	const float viewport_width = _aspect_ratio * viewport_height;

	horizontal = glm::vec3(viewport_width, 0.0f, 0.0f);
	vertical = glm::vec3(0.0f, viewport_height, 0.0f);
	lower_left_corner = _position - horizontal / 2.0f - vertical / 2.0f - glm::vec3(0.0f, 0.0f, focal_length);
}

const glm::vec3& Camera::position() const {
	return _position;
}

float Camera::aspect_ratio() const {
	return _aspect_ratio;
}

Ray Camera::cast_ray(float u, float v) const {
	const glm::vec3 target = lower_left_corner + u * horizontal + v * vertical;
	return Ray(_position, glm::normalize(target - _position));
}
