#include "scene_parser.hpp"

#include <glm/glm.hpp>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "geometry.hpp"
#include "material.hpp"
#include "spheres.hpp"

const char* to_string(ParseError kind) {
	switch (kind) {
		case ParseError::CouldntOpenFile: return "couldn't open file";
		case ParseError::MissingCamera: return "missing camera";
		case ParseError::WrongSyntax: return "wrong syntax";
		case ParseError::UnknownMaterial: return "unknown material";
		case ParseError::MalformedNumber: return "malformed number";
		case ParseError::InvalidValue: return "invalid value";
		case ParseError::MeshLoadFailed: return "mesh load failed";
	}
	return "unknown error";
}

SceneError::SceneError(ParseError kind, const std::string& detail)
	: std::runtime_error(std::string(to_string(kind)) + ": " + detail), _kind(kind) {}

ParseError SceneError::kind() const {
	return _kind;
}

namespace {

class SceneParser {
public:
	SceneParser(std::string_view source, std::filesystem::path base_dir)
		: source(source), base_dir(std::move(base_dir)) {}

	Scene parse() {
		Scene scene;

		skip_whitespace();
		if (!accept("camera")) {
			fail(ParseError::MissingCamera, "scene must start with a camera");
		}
		scene.camera = parse_camera();

		Mesh triangles;
		skip_whitespace();
		while (!at_end()) {
			if (accept("material")) {
				parse_material();
			}
			else if (accept("sphere")) {
				scene.world.add_sphere(parse_sphere());
			}
			else if (accept("triangle")) {
				triangles.add(parse_triangle());
			}
			else if (accept("mesh")) {
				parse_mesh(scene.world);
			}
			else if (accept("camera")) {
				fail(ParseError::WrongSyntax, "only one camera is allowed");
			}
			else {
				fail(ParseError::WrongSyntax, "unexpected '" + std::string(peek_word()) + "'");
			}
			skip_whitespace();
		}

		if (!triangles.empty()) {
			scene.world.add_mesh(std::move(triangles));
		}

		return scene;
	}

private:
	std::string_view source;
	std::filesystem::path base_dir;
	size_t pos = 0;
	int line = 1;
	std::map<std::string, Material, std::less<>> materials;

	bool at_end() const {
		return pos >= source.size();
	}

	[[noreturn]] void fail(ParseError kind, const std::string& what) const {
		throw SceneError(kind, "line " + std::to_string(line) + ": " + what);
	}

	// Skips whitespace and // comments.
	void skip_whitespace() {
		while (!at_end()) {
			const char c = source[pos];
			if (c == '\n') {
				line++;
				pos++;
			}
			else if (std::isspace(static_cast<unsigned char>(c))) {
				pos++;
			}
			else if (source.substr(pos, 2) == "//") {
				while (!at_end() && source[pos] != '\n') pos++;
			}
			else {
				break;
			}
		}
	}

	std::string_view peek_word() const {
		size_t end = pos;
		while (end < source.size() && !std::isspace(static_cast<unsigned char>(source[end]))) end++;
		return source.substr(pos, end - pos);
	}

	static bool is_identifier_char(char c) {
		return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
	}

	// Consumes a keyword or punctuation token if it comes next.
	bool accept(std::string_view token) {
		if (source.substr(pos, token.size()) != token) {
			return false;
		}
		const size_t end = pos + token.size();
		if (is_identifier_char(token.back()) && end < source.size() && is_identifier_char(source[end])) {
			return false;
		}
		pos = end;
		return true;
	}

	void expect(std::string_view token) {
		skip_whitespace();
		if (!accept(token)) {
			fail(ParseError::WrongSyntax, "expected '" + std::string(token) + "'");
		}
	}

	std::string identifier() {
		skip_whitespace();
		const size_t start = pos;
		while (!at_end() && is_identifier_char(source[pos])) pos++;
		if (start == pos) {
			fail(ParseError::WrongSyntax, "expected a name");
		}
		return std::string(source.substr(start, pos - start));
	}

	std::string quoted_string() {
		skip_whitespace();
		if (!accept("\"")) {
			fail(ParseError::WrongSyntax, "expected a quoted path");
		}
		const size_t start = pos;
		while (!at_end() && source[pos] != '"' && source[pos] != '\n') pos++;
		if (at_end() || source[pos] != '"') {
			fail(ParseError::WrongSyntax, "unterminated string");
		}
		std::string value(source.substr(start, pos - start));
		pos++;
		return value;
	}

	float number() {
		skip_whitespace();
		const char* first = source.data() + pos;
		const char* last = source.data() + source.size();

		float value = 0.0f;
		auto [ptr, ec] = std::from_chars(first, last, value);
		if (ec != std::errc() || (ptr != last && is_identifier_char(*ptr))) {
			fail(ParseError::MalformedNumber, "expected a number, got '" + std::string(peek_word()) + "'");
		}
		if (!std::isfinite(value)) {
			fail(ParseError::MalformedNumber, "'" + std::string(peek_word()) + "' is not a finite number");
		}
		pos += static_cast<size_t>(ptr - first);
		return value;
	}

	glm::vec3 vec3() {
		const float x = number();
		const float y = number();
		const float z = number();
		return glm::vec3(x, y, z);
	}

	const Material& lookup_material(const std::string& name) const {
		auto it = materials.find(name);
		if (it == materials.end()) {
			fail(ParseError::UnknownMaterial, "'" + name + "' is not declared");
		}
		return it->second;
	}

	Camera parse_camera() {
		expect("origin");
		const glm::vec3 origin = vec3();
		expect("aspect");
		const float aspect = number();
		expect(";");

		if (!(aspect > 0.0f)) {
			fail(ParseError::InvalidValue, "camera aspect must be positive");
		}
		return Camera(origin, aspect);
	}

	void parse_material() {
		const std::string name = identifier();
		expect(":");
		skip_whitespace();

		Material material;
		if (accept("Diffuse")) {
			expect("color");
			material = Material(Diffuse{ vec3() });
		}
		else if (accept("Metal")) {
			expect("color");
			const glm::vec3 color = vec3();
			expect("fuzz");
			material = Material(Metal(color, number()));
		}
		else if (accept("Dielectric")) {
			expect("ir");
			const float ir = number();
			if (!(ir > 0.0f)) {
				fail(ParseError::InvalidValue, "index of refraction must be positive");
			}
			material = Material(Dielectric{ ir });
		}
		else {
			fail(ParseError::WrongSyntax, "unknown material type '" + std::string(peek_word()) + "'");
		}
		expect(";");

		materials.insert_or_assign(name, material);
	}

	Sphere parse_sphere() {
		expect("center");
		const glm::vec3 center = vec3();
		expect("radius");
		const float radius = number();
		expect("material");
		const Material& material = lookup_material(identifier());
		expect(";");

		if (!(radius > 0.0f)) {
			fail(ParseError::InvalidValue, "sphere radius must be positive");
		}
		return Sphere(center, radius, material);
	}

	Triangle parse_triangle() {
		expect("v0");
		const glm::vec3 v0 = vec3();
		expect("v1");
		const glm::vec3 v1 = vec3();
		expect("v2");
		const glm::vec3 v2 = vec3();
		expect("material");
		const Material& material = lookup_material(identifier());
		expect(";");

		Triangle triangle(v0, v1, v2, material);
		if (triangle.is_degenerate()) {
			fail(ParseError::InvalidValue, "triangle has zero area");
		}
		return triangle;
	}

	void parse_mesh(World& world) {
		expect("file");
		std::filesystem::path path = quoted_string();
		if (path.is_relative() && !base_dir.empty()) {
			path = base_dir / path;
		}

		glm::vec3 offset(0.0f);
		const Material* material = nullptr;

		skip_whitespace();
		if (accept("offset")) {
			offset = vec3();
			skip_whitespace();
		}
		if (accept("material")) {
			material = &lookup_material(identifier());
		}
		expect(";");

		if (!world.place_obj(path.string(), offset, material)) {
			fail(ParseError::MeshLoadFailed, "couldn't load '" + path.string() + "'");
		}
	}
};

}

Scene parse_scene(std::string_view source, const std::filesystem::path& base_dir) {
	SceneParser parser(source, base_dir);
	return parser.parse();
}

Scene load_scene_file(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw SceneError(ParseError::CouldntOpenFile, path.string());
	}

	std::stringstream buffer;
	buffer << file.rdbuf();

	return parse_scene(buffer.str(), path.parent_path());
}
