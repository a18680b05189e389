#include <gtest/gtest.h>

#include <vector>

#include "capi.hpp"

namespace {

const char* SKY_SCENE =
	"camera origin 0 0 0 aspect 1 ;\n"
	"material grey : Diffuse color 0.5 0.5 0.5 ;\n"
	"sphere center 0 0 -1 radius 0.5 material grey ;\n";

}

TEST(CApiTest, RendersIntoCallerBuffer) {
	PtWorldHandle* handle = pt_load_world(SKY_SCENE);
	ASSERT_NE(handle, nullptr);

	std::vector<PtColor> pixels(4 * 4, PtColor{ 0, 0, 0, 0 });
	PtFramebuffer framebuffer{ 4, 4, pixels.data() };

	EXPECT_EQ(pt_render(framebuffer, handle), PT_OK);
	for (const PtColor& pixel : pixels) {
		EXPECT_EQ(pixel.a, 255);
	}
	// Top corners look past the sphere into the sky.
	EXPECT_GT(pixels[0].b, 200);
	EXPECT_GT(pixels[3].b, 200);

	pt_free_world(handle);
}

TEST(CApiTest, InvalidSceneReturnsNull) {
	EXPECT_EQ(pt_load_world("sphere center 0 0 0 radius 1 material m ;"), nullptr);
	EXPECT_EQ(pt_load_world(nullptr), nullptr);
}

TEST(CApiTest, RejectsBadArguments) {
	PtWorldHandle* handle = pt_load_world(SKY_SCENE);
	ASSERT_NE(handle, nullptr);

	std::vector<PtColor> pixels(4);
	EXPECT_EQ(pt_render(PtFramebuffer{ 2, 2, nullptr }, handle), PT_NULL_ARGUMENT);
	EXPECT_EQ(pt_render(PtFramebuffer{ 2, 2, pixels.data() }, nullptr), PT_NULL_ARGUMENT);
	EXPECT_EQ(pt_render(PtFramebuffer{ 0, 2, pixels.data() }, handle), PT_INVALID_SIZE);

	pt_free_world(handle);
	pt_free_world(nullptr);
}
