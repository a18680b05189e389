#include "util.hpp"

#include <glm/glm.hpp>
#include <cmath>

#include "random.hpp"

glm::vec3 random_in_unit_sphere(Random& rng) {
	glm::vec3 p;
	do {
		p = glm::vec3(rng.random_bilateral(), rng.random_bilateral(), rng.random_bilateral());
	} while (glm::dot(p, p) >= 1.0f);
	return p;
}

glm::vec3 reflect(const glm::vec3& v, const glm::vec3& n) {
	return v - 2.0f * glm::dot(v, n) * n;
}

bool near_zero(const glm::vec3& v) {
	const float theta = 1e-8f;
	return (std::fabs(v[0]) < theta) && (std::fabs(v[1]) < theta) && (std::fabs(v[2]) < theta);
}

glm::vec3 refract(const glm::vec3& uv, const glm::vec3& n, float etai_over_etat) {
	float cos_theta = std::fmin(glm::dot(-uv, n), 1.0f);
	glm::vec3 r_out_perp = etai_over_etat * (uv + cos_theta * n);
	glm::vec3 r_out_parallel = -std::sqrt(std::fabs(1.0f - glm::dot(r_out_perp, r_out_perp))) * n;
	return r_out_perp + r_out_parallel;
}

float reflectance(float cosine, float refraction_ratio) {
	float r0 = (1.0f - refraction_ratio) / (1.0f + refraction_ratio);
	r0 = r0 * r0;
	return r0 + (1.0f - r0) * std::pow(1.0f - cosine, 5.0f);
}
