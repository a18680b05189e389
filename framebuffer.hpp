#pragma once

#include <cstdint>
#include <span>
#include <vector>

struct ColorU8 {
	std::uint8_t r, g, b, a;
};

static_assert(sizeof(ColorU8) == 4, "ColorU8 must be tightly packed RGBA");

inline bool operator==(const ColorU8& lhs, const ColorU8& rhs) {
	return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

// Row-major RGBA8 pixels, row 0 first.
class Framebuffer {
public:
	Framebuffer(int width, int height);

	// Copies a borrowed buffer of exactly width * height pixels.
	static Framebuffer from_pixels(std::span<const ColorU8> pixels, int width, int height);

	int width() const;
	int height() const;

	ColorU8& at(int row, int column);
	const ColorU8& at(int row, int column) const;

	std::span<ColorU8> pixels();
	std::span<const ColorU8> pixels() const;

	// Copies into a borrowed buffer; false if the sizes differ.
	bool copy_to(std::span<ColorU8> destination) const;

private:
	int _width;
	int _height;
	std::vector<ColorU8> _pixels;
};
