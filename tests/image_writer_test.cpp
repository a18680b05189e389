#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "framebuffer.hpp"
#include "image_writer.hpp"

TEST(ImageWriterTest, WritesPlainPpm) {
	Framebuffer framebuffer(2, 2);
	framebuffer.at(0, 0) = ColorU8{ 255, 0, 0, 255 };
	framebuffer.at(0, 1) = ColorU8{ 0, 255, 0, 255 };
	framebuffer.at(1, 0) = ColorU8{ 0, 0, 255, 255 };
	framebuffer.at(1, 1) = ColorU8{ 12, 34, 56, 7 };

	std::ostringstream out;
	ASSERT_TRUE(save_ppm(framebuffer, out));

	EXPECT_EQ(out.str(),
		"P3\n"
		"2 2\n"
		"255\n"
		"255 0 0\n"
		"0 255 0\n"
		"0 0 255\n"
		"12 34 56\n");
}

TEST(ImageWriterTest, WritesPpmFile) {
	const std::filesystem::path dir = std::filesystem::temp_directory_path() / "pathtracer_image_writer_test";
	const std::filesystem::path file = dir / "out.ppm";
	std::filesystem::remove_all(dir);

	Framebuffer framebuffer(3, 1);
	framebuffer.at(0, 2) = ColorU8{ 1, 2, 3, 255 };
	ASSERT_TRUE(save_ppm(framebuffer, file.string()));

	std::ifstream in(file);
	std::string magic;
	int width = 0, height = 0, max_value = 0;
	in >> magic >> width >> height >> max_value;
	EXPECT_EQ(magic, "P3");
	EXPECT_EQ(width, 3);
	EXPECT_EQ(height, 1);
	EXPECT_EQ(max_value, 255);

	std::filesystem::remove_all(dir);
}

TEST(ImageWriterTest, WritesPngFile) {
	const std::filesystem::path dir = std::filesystem::temp_directory_path() / "pathtracer_png_test";
	const std::filesystem::path file = dir / "nested" / "out.png";
	std::filesystem::remove_all(dir);

	Framebuffer framebuffer(4, 4);
	ASSERT_TRUE(save_png(framebuffer, file.string()));
	EXPECT_TRUE(std::filesystem::exists(file));
	EXPECT_GT(std::filesystem::file_size(file), 0u);

	std::filesystem::remove_all(dir);
}
