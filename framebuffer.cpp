#include "framebuffer.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>
#include <vector>

Framebuffer::Framebuffer(int width, int height)
	: _width(width), _height(height) {
	if (width < 0 || height < 0) {
		throw std::invalid_argument("Framebuffer dimensions must not be negative");
	}
	_pixels.resize(static_cast<size_t>(width) * static_cast<size_t>(height), ColorU8{ 0, 0, 0, 0 });
}

Framebuffer Framebuffer::from_pixels(std::span<const ColorU8> pixels, int width, int height) {
	Framebuffer framebuffer(width, height);
	if (pixels.size() != framebuffer._pixels.size()) {
		throw std::invalid_argument("Pixel buffer does not match framebuffer dimensions");
	}
	std::copy(pixels.begin(), pixels.end(), framebuffer._pixels.begin());
	return framebuffer;
}

int Framebuffer::width() const { return _width; }

int Framebuffer::height() const { return _height; }

ColorU8& Framebuffer::at(int row, int column) {
	return _pixels[static_cast<size_t>(row) * _width + column];
}

const ColorU8& Framebuffer::at(int row, int column) const {
	return _pixels[static_cast<size_t>(row) * _width + column];
}

std::span<ColorU8> Framebuffer::pixels() {
	return _pixels;
}

std::span<const ColorU8> Framebuffer::pixels() const {
	return _pixels;
}

bool Framebuffer::copy_to(std::span<ColorU8> destination) const {
	if (destination.size() != _pixels.size()) {
		return false;
	}
	std::copy(_pixels.begin(), _pixels.end(), destination.begin());
	return true;
}
