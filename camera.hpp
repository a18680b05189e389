#pragma once

#include <glm/glm.hpp>

#include "ray.hpp"
#include "constants.hpp"

// Pinhole camera looking down -Z with +Y up.
class Camera {
public:

    Camera();

    Camera(glm::vec3 camera_position, float aspect_ratio);

    const glm::vec3& position() const;
    float aspect_ratio() const;

    // u, v in [0, 1], v = 0 is the bottom edge of the viewport.
    Ray cast_ray(float u, float v) const;

private:
    glm::vec3 _position;
    float _aspect_ratio = ASPECT_RATIO; // Ratio of image width over height
    static constexpr float focal_length = 1.0f;

    glm::vec3 horizontal;
    glm::vec3 vertical;
    glm::vec3 lower_left_corner;
};
