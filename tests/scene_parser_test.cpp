#include <gtest/gtest.h>

#include <glm/glm.hpp>
#include <string>
#include <variant>

#include "geometry.hpp"
#include "material.hpp"
#include "scene_parser.hpp"

namespace {

ParseError error_kind(const std::string& source) {
	try {
		parse_scene(source);
	}
	catch (const SceneError& e) {
		return e.kind();
	}
	ADD_FAILURE() << "expected a SceneError for: " << source;
	return ParseError::WrongSyntax;
}

const char* MINIMAL_SCENE =
	"camera origin 1.0 2.0 3.0 aspect 1.5 ;\n"
	"material grey : Diffuse color 0.5 0.5 0.5 ;\n"
	"sphere center 0.0 0.0 -1.0 radius 0.5 material grey ;\n";

}

TEST(SceneParserTest, MinimalSceneRoundTrip) {
	Scene scene = parse_scene(MINIMAL_SCENE);

	EXPECT_EQ(scene.camera.position(), glm::vec3(1.0f, 2.0f, 3.0f));
	EXPECT_FLOAT_EQ(scene.camera.aspect_ratio(), 1.5f);

	ASSERT_EQ(scene.world.spheres.size(), 1u);
	const Sphere& sphere = scene.world.spheres[0];
	EXPECT_EQ(sphere.center, glm::vec3(0.0f, 0.0f, -1.0f));
	EXPECT_FLOAT_EQ(sphere.radius, 0.5f);
	ASSERT_TRUE(std::holds_alternative<Diffuse>(sphere.material.kind));
	EXPECT_EQ(std::get<Diffuse>(sphere.material.kind).albedo, glm::vec3(0.5f));

	EXPECT_TRUE(scene.world.meshes.empty());
}

TEST(SceneParserTest, ParsesAllMaterialKindsAndTriangles) {
	Scene scene = parse_scene(
		"// leading comment\n"
		"camera origin 0 0 0 aspect 2 ; // trailing comment\n"
		"material glass : Dielectric ir 1.5 ;\n"
		"material gold : Metal color 0.8 0.6 0.2 fuzz 0.3 ;\n"
		"material rough : Metal color 1 1 1 fuzz 4.0 ;\n"
		"sphere center -1 0 -1 radius 0.5 material glass ;\n"
		"sphere center 1 0 -1 radius 0.5 material gold ;\n"
		"triangle v0 -1 -1 -2 v1 1 -1 -2 v2 0 1 -2 material rough ;\n"
		"triangle v0 -1 -1 -3 v1 1 -1 -3 v2 0 1 -3 material glass ;\n");

	ASSERT_EQ(scene.world.spheres.size(), 2u);
	ASSERT_TRUE(std::holds_alternative<Dielectric>(scene.world.spheres[0].material.kind));
	EXPECT_FLOAT_EQ(std::get<Dielectric>(scene.world.spheres[0].material.kind).ir, 1.5f);

	ASSERT_TRUE(std::holds_alternative<Metal>(scene.world.spheres[1].material.kind));
	const Metal& gold = std::get<Metal>(scene.world.spheres[1].material.kind);
	EXPECT_EQ(gold.albedo, glm::vec3(0.8f, 0.6f, 0.2f));
	EXPECT_FLOAT_EQ(gold.fuzz, 0.3f);

	// All triangle statements form one mesh.
	ASSERT_EQ(scene.world.meshes.size(), 1u);
	const auto& triangles = scene.world.meshes[0].triangles();
	ASSERT_EQ(triangles.size(), 2u);
	EXPECT_EQ(triangles[0].v2, glm::vec3(0.0f, 1.0f, -2.0f));
	ASSERT_TRUE(std::holds_alternative<Metal>(triangles[0].material.kind));
	EXPECT_FLOAT_EQ(std::get<Metal>(triangles[0].material.kind).fuzz, 1.0f);
	EXPECT_EQ(scene.world.triangle_count(), 2u);
}

TEST(SceneParserTest, RedeclaredMaterialReplacesEarlierOne) {
	Scene scene = parse_scene(
		"camera origin 0 0 0 aspect 1 ;\n"
		"material m : Diffuse color 1 0 0 ;\n"
		"material m : Diffuse color 0 1 0 ;\n"
		"sphere center 0 0 -1 radius 1 material m ;\n");

	ASSERT_EQ(scene.world.spheres.size(), 1u);
	EXPECT_EQ(std::get<Diffuse>(scene.world.spheres[0].material.kind).albedo, glm::vec3(0.0f, 1.0f, 0.0f));
}

TEST(SceneParserTest, CameraOnlySceneIsEmptyWorld) {
	Scene scene = parse_scene("camera origin 0 1 0 aspect 1.0 ;");
	EXPECT_TRUE(scene.world.spheres.empty());
	EXPECT_TRUE(scene.world.meshes.empty());
}

TEST(SceneParserTest, ReportsMissingCamera) {
	EXPECT_EQ(error_kind(""), ParseError::MissingCamera);
	EXPECT_EQ(error_kind("material m : Diffuse color 1 1 1 ;"), ParseError::MissingCamera);
}

TEST(SceneParserTest, ReportsSyntaxErrors) {
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1"), ParseError::WrongSyntax);
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1 ; cube size 1 ;"), ParseError::WrongSyntax);
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1 ; material m : Plastic color 1 1 1 ;"), ParseError::WrongSyntax);
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1 ; camera origin 0 0 0 aspect 1 ;"), ParseError::WrongSyntax);
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1 ; mesh file \"unterminated ;"), ParseError::WrongSyntax);
}

TEST(SceneParserTest, ReportsUnknownMaterial) {
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1 ; sphere center 0 0 -1 radius 1 material nope ;"),
		ParseError::UnknownMaterial);
}

TEST(SceneParserTest, ReportsMalformedNumbers) {
	EXPECT_EQ(error_kind("camera origin 0 x 0 aspect 1 ;"), ParseError::MalformedNumber);
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1.5abc ;"), ParseError::MalformedNumber);
}

TEST(SceneParserTest, RejectsInvalidGeometry) {
	const std::string header = "camera origin 0 0 0 aspect 1 ; material m : Diffuse color 1 1 1 ;\n";
	EXPECT_EQ(error_kind(header + "sphere center 0 0 -1 radius 0 material m ;"), ParseError::InvalidValue);
	EXPECT_EQ(error_kind(header + "sphere center 0 0 -1 radius -2 material m ;"), ParseError::InvalidValue);
	EXPECT_EQ(error_kind(header + "triangle v0 0 0 0 v1 1 0 0 v2 2 0 0 material m ;"), ParseError::InvalidValue);
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 0 ;"), ParseError::InvalidValue);
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1 ; material g : Dielectric ir 0 ;"), ParseError::InvalidValue);
}

TEST(SceneParserTest, ErrorMessageNamesKindAndLine) {
	try {
		parse_scene("camera origin 0 0 0 aspect 1 ;\n\nsphere center 0 0 -1 radius 1 material nope ;\n");
		FAIL() << "expected a SceneError";
	}
	catch (const SceneError& e) {
		const std::string message = e.what();
		EXPECT_NE(message.find("unknown material"), std::string::npos);
		EXPECT_NE(message.find("line 3"), std::string::npos);
	}
}

TEST(SceneParserTest, MissingMeshFileFailsToLoad) {
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect 1 ; mesh file \"does/not/exist.obj\" ;"),
		ParseError::MeshLoadFailed);
}

TEST(SceneParserTest, MissingSceneFileCantBeOpened) {
	try {
		load_scene_file("does/not/exist.txt");
		FAIL() << "expected a SceneError";
	}
	catch (const SceneError& e) {
		EXPECT_EQ(e.kind(), ParseError::CouldntOpenFile);
	}
}

TEST(SceneParserTest, LoadsExampleSceneWithObjMesh) {
	Scene scene = load_scene_file(std::string(SCENES_DIR) + "/world.txt");

	EXPECT_EQ(scene.world.spheres.size(), 4u);
	// Inline triangle mesh plus the OBJ tetrahedron.
	ASSERT_EQ(scene.world.meshes.size(), 2u);
	EXPECT_EQ(scene.world.triangle_count(), 5u);

	const auto& tetrahedron = scene.world.meshes[0].triangles();
	ASSERT_EQ(tetrahedron.size(), 4u);
	ASSERT_TRUE(std::holds_alternative<Diffuse>(tetrahedron[0].material.kind));
	EXPECT_NEAR(std::get<Diffuse>(tetrahedron[0].material.kind).albedo.r, 0.7f, 1e-6f);
	EXPECT_NEAR(tetrahedron[0].v0.x, 0.6f, 1e-6f);
}

TEST(SceneParserTest, ConvertsMtlMaterials) {
	Scene scene = parse_scene("camera origin 0 0 0 aspect 1 ;\nmesh file \"panels.obj\" ;\n", SCENES_DIR);

	ASSERT_EQ(scene.world.meshes.size(), 1u);
	const auto& panels = scene.world.meshes[0].triangles();
	ASSERT_EQ(panels.size(), 3u);

	// illum 3 is a mirror: specular color and roughness become a Metal.
	ASSERT_TRUE(std::holds_alternative<Metal>(panels[0].material.kind));
	const Metal& steel = std::get<Metal>(panels[0].material.kind);
	EXPECT_NEAR(steel.albedo.r, 0.9f, 1e-6f);
	EXPECT_NEAR(steel.albedo.g, 0.8f, 1e-6f);
	EXPECT_NEAR(steel.albedo.b, 0.7f, 1e-6f);
	EXPECT_NEAR(steel.fuzz, 0.25f, 1e-6f);

	ASSERT_TRUE(std::holds_alternative<Dielectric>(panels[1].material.kind));
	EXPECT_NEAR(std::get<Dielectric>(panels[1].material.kind).ir, 1.45f, 1e-6f);

	// Partially transparent, even with a diffuse illumination model.
	ASSERT_TRUE(std::holds_alternative<Dielectric>(panels[2].material.kind));
	EXPECT_NEAR(std::get<Dielectric>(panels[2].material.kind).ir, 1.3f, 1e-6f);
}

TEST(SceneParserTest, MeshMaterialOverridesMtl) {
	Scene scene = parse_scene(
		"camera origin 0 0 0 aspect 1 ;\n"
		"material paint : Diffuse color 0.1 0.9 0.1 ;\n"
		"mesh file \"panels.obj\" offset 0 0 -5 material paint ;\n",
		SCENES_DIR);

	ASSERT_EQ(scene.world.meshes.size(), 1u);
	const auto& panels = scene.world.meshes[0].triangles();
	ASSERT_EQ(panels.size(), 3u);
	for (const Triangle& panel : panels) {
		ASSERT_TRUE(std::holds_alternative<Diffuse>(panel.material.kind));
		EXPECT_EQ(std::get<Diffuse>(panel.material.kind).albedo, glm::vec3(0.1f, 0.9f, 0.1f));
		EXPECT_FLOAT_EQ(panel.v0.z, -5.0f);
	}
}

TEST(SceneParserTest, RejectsNonFiniteNumbers) {
	const std::string header = "camera origin 0 0 0 aspect 1 ; material m : Diffuse color 1 1 1 ;\n";
	EXPECT_EQ(error_kind("camera origin inf 0 0 aspect 1 ;"), ParseError::MalformedNumber);
	EXPECT_EQ(error_kind("camera origin 0 0 0 aspect infinity ;"), ParseError::MalformedNumber);
	EXPECT_EQ(error_kind(header + "sphere center nan 0 -1 radius 1 material m ;"), ParseError::MalformedNumber);
	EXPECT_EQ(error_kind(header + "sphere center 0 0 -1 radius 1e60 material m ;"), ParseError::MalformedNumber);
}
