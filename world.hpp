#pragma once

#include <glm/glm.hpp>
#include <string>
#include <vector>

#include "ray.hpp"
#include "hit_info.hpp"
#include "material.hpp"
#include "spheres.hpp"
#include "geometry.hpp"

class World
{
	public:
	std::vector<Sphere> spheres;
	std::vector<Mesh> meshes;

	World(); // constructor makes an empty world
	World(std::vector<Sphere> spheres, std::vector<Mesh> meshes);

	void add_sphere(const Sphere& sphere);
	void add_mesh(Mesh mesh);

	// Loads an OBJ as one mesh translated by position. A non-null material
	// overrides the MTL materials. Returns false if the file can't be read.
	bool place_obj(const std::string& file_path, glm::vec3 position, const Material* material = nullptr);

	// Nearest hit over every primitive, starting at T_MIN.
	bool hit(const Ray& ray, HitInfo& hit) const;

	size_t triangle_count() const;
};
