#pragma once

#include <glm/glm.hpp>

#include "ray.hpp"
#include "hit_info.hpp"
#include "interval.hpp"
#include "material.hpp"

struct Sphere {
    glm::vec3 center;
    float radius;
    Material material;

    Sphere() = default;
    Sphere(const glm::vec3& center, float radius, const Material& material);

    // Nearest root strictly inside ray_t.
    bool hit(const Ray& r, const Interval& ray_t, HitInfo& hit) const;
};
