#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include "camera.hpp"
#include "world.hpp"

enum class ParseError {
	CouldntOpenFile,
	MissingCamera,
	WrongSyntax,
	UnknownMaterial,
	MalformedNumber,
	InvalidValue,
	MeshLoadFailed
};

const char* to_string(ParseError kind);

class SceneError : public std::runtime_error {
public:
	SceneError(ParseError kind, const std::string& detail);

	ParseError kind() const;

private:
	ParseError _kind;
};

struct Scene {
	Camera camera;
	World world;
};

// --- Syntax ----
// program    :  <camera> (<material> | <sphere> | <triangle> | <mesh>)*
// camera     :  camera origin <f32> <f32> <f32> aspect <f32> ;
// material   :  material <name> : <diffuse> | <metal> | <dielectric> ;
// diffuse    :  Diffuse color <f32> <f32> <f32>
// metal      :  Metal color <f32> <f32> <f32> fuzz <f32>
// dielectric :  Dielectric ir <f32>
// sphere     :  sphere center <f32> <f32> <f32> radius <f32> material <name> ;
// triangle   :  triangle v0 <f32> <f32> <f32> v1 <f32> <f32> <f32> v2 <f32> <f32> <f32> material <name> ;
// mesh       :  mesh file "<path>" [offset <f32> <f32> <f32>] [material <name>] ;
// Lines starting with // are comments. Mesh paths are resolved against base_dir.
Scene parse_scene(std::string_view source, const std::filesystem::path& base_dir = {});

Scene load_scene_file(const std::filesystem::path& path);
