#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <variant>

#include "ray.hpp"
#include "random.hpp"

struct HitInfo;

// An empty next_ray means the ray was absorbed.
struct ScatterData {
	glm::vec3 attenuation;
	std::optional<Ray> next_ray;
};

struct Diffuse {
	glm::vec3 albedo;

	ScatterData scatter(const Ray& r_in, const HitInfo& hit, Random& rng) const;
};

struct Metal {
	glm::vec3 albedo;
	float fuzz;

	Metal(const glm::vec3& albedo, float fuzz); // fuzz is clamped to [0, 1]

	ScatterData scatter(const Ray& r_in, const HitInfo& hit, Random& rng) const;
};

struct Dielectric {
	float ir; // index of refraction

	ScatterData scatter(const Ray& r_in, const HitInfo& hit, Random& rng) const;
};

struct Material {
	std::variant<Diffuse, Metal, Dielectric> kind;

	Material();
	Material(const Diffuse& m);
	Material(const Metal& m);
	Material(const Dielectric& m);

	ScatterData scatter(const Ray& r_in, const HitInfo& hit, Random& rng) const;
};
