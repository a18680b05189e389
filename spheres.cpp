#include "spheres.hpp"

#include <glm/glm.hpp>
#include <cmath>

Sphere::Sphere(const glm::vec3& center, float radius, const Material& material)
    : center(center), radius(radius), material(material) {}

bool Sphere::hit(const Ray& r, const Interval& ray_t, HitInfo& hit) const {
    const glm::vec3 oc = r.origin() - center;
    const float a = glm::dot(r.direction(), r.direction());
    const float half_b = glm::dot(oc, r.direction());
    const float c = glm::dot(oc, oc) - radius * radius;

    const float discriminant = half_b * half_b - a * c;
    if (discriminant < 0.0f) {
        return false;
    }

    const float sqrtd = std::sqrt(discriminant);

    // Roots are ordered, so the first one inside the interval is the nearest.
    float root = (-half_b - sqrtd) / a;
    if (!ray_t.surrounds(root)) {
        root = (-half_b + sqrtd) / a;
        if (!ray_t.surrounds(root)) {
            return false;
        }
    }

    hit.t = root;
    hit.position = r.at(root);
    hit.normal = (hit.position - center) / radius;
    hit.mat_ptr = &material;

    return true;
}
