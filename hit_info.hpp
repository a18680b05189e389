#pragma once

#include <glm/glm.hpp>

struct Material;

// Valid only for the query that produced it; mat_ptr borrows from the primitive.
struct HitInfo {
    glm::vec3 position;
    glm::vec3 normal; // unit length, outward facing
    float t;
    const Material* mat_ptr = nullptr;
};
