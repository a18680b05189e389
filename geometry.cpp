#include "geometry.hpp"

#include <glm/glm.hpp>
#include <cmath>
#include <utility>
#include <vector>

#include "constants.hpp"

Triangle::Triangle(const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2, const Material& material)
	: v0(v0), v1(v1), v2(v2), material(material) {
	const glm::vec3 n = glm::cross(v1 - v0, v2 - v0);
	const float length = glm::length(n);
	_normal = length < PARALLEL_EPSILON ? glm::vec3(0.0f) : n / length;
}

const glm::vec3& Triangle::normal() const {
	return _normal;
}

bool Triangle::is_degenerate() const {
	return _normal == glm::vec3(0.0f);
}

bool Triangle::hit(const Ray& r, const Interval& ray_t, HitInfo& hit) const {
	// Not normalized, the edge tests below only need its orientation.
	const glm::vec3 n = glm::cross(v1 - v0, v2 - v0);

	const float denom = glm::dot(n, r.direction());
	if (std::fabs(denom) < PARALLEL_EPSILON) {
		return false; // parallel, also rejects rays lying in the plane
	}

	const float t = (glm::dot(n, v0) - glm::dot(n, r.origin())) / denom;
	if (!ray_t.contains(t)) {
		return false;
	}

	const glm::vec3 p = r.at(t);

	// Edge 0
	const glm::vec3 e0 = v1 - v0;
	const glm::vec3 vp0 = p - v0;
	if (glm::dot(n, glm::cross(e0, vp0)) < 0.0f) return false;

	// Edge 1
	const glm::vec3 e1 = v2 - v1;
	const glm::vec3 vp1 = p - v1;
	if (glm::dot(n, glm::cross(e1, vp1)) < 0.0f) return false;

	// Edge 2
	const glm::vec3 e2 = v0 - v2;
	const glm::vec3 vp2 = p - v2;
	if (glm::dot(n, glm::cross(e2, vp2)) < 0.0f) return false;

	hit.t = t;
	hit.position = p;
	hit.normal = _normal;
	hit.mat_ptr = &material;

	return true;
}

Mesh::Mesh(std::vector<Triangle> triangles) : _triangles(std::move(triangles)) {}

const std::vector<Triangle>& Mesh::triangles() const {
	return _triangles;
}

void Mesh::add(const Triangle& triangle) {
	_triangles.push_back(triangle);
}

bool Mesh::empty() const {
	return _triangles.empty();
}

bool Mesh::hit(const Ray& r, const Interval& ray_t, HitInfo& hit) const {
	HitInfo temp;
	bool hit_anything = false;
	float closest_so_far = ray_t.max;

	for (const auto& triangle : _triangles) {
		if (triangle.hit(r, Interval(ray_t.min, closest_so_far), temp)) {
			hit_anything = true;
			closest_so_far = temp.t;
			hit = temp;
		}
	}

	return hit_anything;
}
