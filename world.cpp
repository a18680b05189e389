#include "world.hpp"

#include <glm/glm.hpp>
#include <tiny_obj_loader.h>
#include <iostream>
#include <utility>
#include <vector>

#include "constants.hpp"
#include "interval.hpp"

World::World() {
	spheres = {};
	meshes = {};
}

World::World(std::vector<Sphere> spheres, std::vector<Mesh> meshes)
	: spheres(std::move(spheres)), meshes(std::move(meshes)) {}

void World::add_sphere(const Sphere& sphere) {
	spheres.push_back(sphere);
}

void World::add_mesh(Mesh mesh) {
	meshes.push_back(std::move(mesh));
}

static Material convert_material(const tinyobj::material_t& mat) {
	const glm::vec3 diffuse(mat.diffuse[0], mat.diffuse[1], mat.diffuse[2]);

	// Glass-like illumination models, or anything see-through
	if (mat.illum == 4 || mat.illum == 6 || mat.illum == 7 || mat.dissolve < 1.0f) {
		return Material(Dielectric{ mat.ior > 0.0f ? mat.ior : 1.5f });
	}

	if (mat.illum == 3) {
		const glm::vec3 specular(mat.specular[0], mat.specular[1], mat.specular[2]);
		return Material(Metal(specular, mat.roughness));
	}

	return Material(Diffuse{ diffuse });
}

bool World::place_obj(const std::string& file_path, glm::vec3 position, const Material* material) {
	// Load the OBJ file using tinyobjloader
	tinyobj::ObjReaderConfig reader_config;
	reader_config.triangulate = true; // Ensure triangles are created
	reader_config.vertex_color = false; // Disable vertex colors
	tinyobj::ObjReader reader;
	if (!reader.ParseFromFile(file_path, reader_config)) {
		if (!reader.Error().empty()) {
			std::cerr << "TinyObjReader: " << reader.Error() << std::endl;
		}
		return false;
	}
	if (!reader.Warning().empty()) {
		std::cerr << "TinyObjReader: " << reader.Warning() << std::endl;
	}

	const auto& shapes = reader.GetShapes();
	const auto& attrib = reader.GetAttrib();

	std::vector<Material> materials;
	for (const tinyobj::material_t& mat : reader.GetMaterials()) {
		materials.push_back(convert_material(mat));
	}

	Mesh mesh;
	size_t skipped = 0;

	// Iterate through the shapes and extract the triangles
	for (const tinyobj::shape_t& shape : shapes) {
		size_t face_id = 0;
		size_t index_offset = 0;
		for (int fv : shape.mesh.num_face_vertices) {
			if (fv != 3) {
				std::cerr << "Warning: Non-triangle face found in OBJ file." << std::endl;
				index_offset += fv;
				face_id++;
				continue;
			}

			Material face_material;
			if (material != nullptr) {
				face_material = *material;
			}
			else if (face_id < shape.mesh.material_ids.size()) {
				const int material_id = shape.mesh.material_ids[face_id];
				if (material_id >= 0 && material_id < static_cast<int>(materials.size())) {
					face_material = materials[material_id];
				}
			}

			glm::vec3 verts[3];
			for (size_t v = 0; v < 3; v++) {
				tinyobj::index_t idx = shape.mesh.indices[index_offset + v];

				auto pos_base = 3 * idx.vertex_index;
				verts[v] = glm::vec3(
					attrib.vertices[pos_base + 0],
					attrib.vertices[pos_base + 1],
					attrib.vertices[pos_base + 2]
				);
			}

			Triangle triangle = Triangle(verts[0], verts[1], verts[2], face_material) + position;
			if (triangle.is_degenerate()) {
				skipped++;
			}
			else {
				mesh.add(triangle);
			}

			index_offset += fv;
			face_id++;
		}
	}

	std::clog << "Loaded " << mesh.triangles().size() << " triangles from " << file_path << std::endl;
	if (skipped > 0) {
		std::cerr << "Skipped " << skipped << " degenerate triangles in " << file_path << std::endl;
	}

	meshes.push_back(std::move(mesh));
	return true;
}

bool World::hit(const Ray& ray, HitInfo& hit) const {
	HitInfo temp;
	bool hit_anything = false;
	float closest_so_far = infinity;

	for (const auto& sphere : spheres) {
		if (sphere.hit(ray, Interval(T_MIN, closest_so_far), temp)) {
			hit_anything = true;
			closest_so_far = temp.t;
			hit = temp;
		}
	}

	for (const auto& mesh : meshes) {
		if (mesh.hit(ray, Interval(T_MIN, closest_so_far), temp)) {
			hit_anything = true;
			closest_so_far = temp.t;
			hit = temp;
		}
	}

	return hit_anything;
}

size_t World::triangle_count() const {
	size_t count = 0;
	for (const auto& mesh : meshes) {
		count += mesh.triangles().size();
	}
	return count;
}
