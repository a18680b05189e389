#include "material.hpp"

#include <glm/glm.hpp>
#include <cmath>
#include <optional>
#include <variant>

#include "ray.hpp"
#include "hit_info.hpp"
#include "util.hpp"

ScatterData Diffuse::scatter(const Ray& r_in, const HitInfo& hit, Random& rng) const {
	glm::vec3 scatter_dir = hit.normal + random_in_unit_sphere(rng);

	// Catch degenerate scatter direction
	if (near_zero(scatter_dir)) {
		scatter_dir = hit.normal;
	}

	return ScatterData{ albedo, Ray(hit.position, glm::normalize(scatter_dir)) };
}

Metal::Metal(const glm::vec3& albedo, float fuzz)
	: albedo(albedo), fuzz(fuzz < 0.0f ? 0.0f : (fuzz > 1.0f ? 1.0f : fuzz)) {}

ScatterData Metal::scatter(const Ray& r_in, const HitInfo& hit, Random& rng) const {
	glm::vec3 reflected = reflect(r_in.direction(), hit.normal);
	glm::vec3 perturbed = reflected + fuzz * random_in_unit_sphere(rng);

	// Grazing fuzz pushed the reflection below the surface.
	if (near_zero(perturbed) || glm::dot(perturbed, hit.normal) <= 0.0f) {
		return ScatterData{ albedo, std::nullopt };
	}

	return ScatterData{ albedo, Ray(hit.position, glm::normalize(perturbed)) };
}

ScatterData Dielectric::scatter(const Ray& r_in, const HitInfo& hit, Random& rng) const {
	const glm::vec3 unit_direction = glm::normalize(r_in.direction());
	const bool front_face = glm::dot(unit_direction, hit.normal) < 0.0f;
	const glm::vec3 normal = front_face ? hit.normal : -hit.normal;
	const float refraction_ratio = front_face ? (1.0f / ir) : ir;

	const float cos_theta = std::fmin(glm::dot(-unit_direction, normal), 1.0f);
	const float sin_theta = std::sqrt(std::fmax(0.0f, 1.0f - cos_theta * cos_theta));

	const bool cannot_refract = refraction_ratio * sin_theta > 1.0f;
	glm::vec3 direction;
	if (cannot_refract || reflectance(cos_theta, refraction_ratio) > rng.random_float()) {
		direction = reflect(unit_direction, normal);
	}
	else {
		direction = refract(unit_direction, normal, refraction_ratio);
	}

	return ScatterData{ glm::vec3(1.0f), Ray(hit.position, glm::normalize(direction)) };
}

Material::Material() : kind(Diffuse{ glm::vec3(0.5f) }) {}

Material::Material(const Diffuse& m) : kind(m) {}

Material::Material(const Metal& m) : kind(m) {}

Material::Material(const Dielectric& m) : kind(m) {}

ScatterData Material::scatter(const Ray& r_in, const HitInfo& hit, Random& rng) const {
	return std::visit([&](const auto& m) { return m.scatter(r_in, hit, rng); }, kind);
}
