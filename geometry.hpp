#pragma once

#include <glm/glm.hpp>
#include <vector>

#include "ray.hpp"
#include "hit_info.hpp"
#include "interval.hpp"
#include "material.hpp"

struct Triangle {
	glm::vec3 v0, v1, v2;
	Material material;

	Triangle() = default;

	Triangle(const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2, const Material& material);

	// Flat face normal from the winding order.
	const glm::vec3& normal() const;

	// Zero-area triangles have no usable normal.
	bool is_degenerate() const;

	bool hit(const Ray& r, const Interval& ray_t, HitInfo& hit) const;

private:
	glm::vec3 _normal{ 0.0f };
};

inline Triangle operator+(const Triangle& t, const glm::vec3& v) {
	return Triangle(t.v0 + v, t.v1 + v, t.v2 + v, t.material);
}

class Mesh {
public:
	Mesh() = default;
	explicit Mesh(std::vector<Triangle> triangles);

	const std::vector<Triangle>& triangles() const;
	void add(const Triangle& triangle);
	bool empty() const;

	// Linear scan, returns the closest triangle inside ray_t.
	bool hit(const Ray& r, const Interval& ray_t, HitInfo& hit) const;

private:
	std::vector<Triangle> _triangles;
};
