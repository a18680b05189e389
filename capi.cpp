#include "capi.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <limits>
#include <span>

#include "constants.hpp"
#include "framebuffer.hpp"
#include "render.hpp"
#include "scene_parser.hpp"

struct PtWorldHandle {
	Scene scene;
};

PtWorldHandle* pt_load_world(const char* source) {
	if (source == nullptr) {
		std::cerr << "pt_load_world: source is null" << std::endl;
		return nullptr;
	}

	try {
		return new PtWorldHandle{ parse_scene(source) };
	}
	catch (const SceneError& e) {
		std::cerr << "pt_load_world: " << e.what() << std::endl;
	}
	catch (const std::exception& e) {
		std::cerr << "pt_load_world: unexpected error: " << e.what() << std::endl;
	}
	return nullptr;
}

int pt_render(PtFramebuffer framebuffer, const PtWorldHandle* handle) {
	if (handle == nullptr || framebuffer.pixels == nullptr) {
		return PT_NULL_ARGUMENT;
	}
	constexpr size_t max_dimension = static_cast<size_t>(std::numeric_limits<int>::max());
	if (framebuffer.width == 0 || framebuffer.height == 0 ||
		framebuffer.width > max_dimension || framebuffer.height > max_dimension) {
		return PT_INVALID_SIZE;
	}

	Options options;
	options.samples_per_pixel = CAPI_SAMPLES_PER_PIXEL;
	options.max_ray_bounces = CAPI_MAX_RAY_BOUNCES;
	options.positive_is_up = true;
	options.logger = nullptr;

	const int width = static_cast<int>(framebuffer.width);
	const int height = static_cast<int>(framebuffer.height);
	std::span<PtColor> destination(framebuffer.pixels, framebuffer.width * framebuffer.height);

	try {
		Framebuffer rendered = ray_trace(handle->scene.world, handle->scene.camera, Framebuffer(width, height), options);
		std::span<const ColorU8> source = rendered.pixels();
		if (source.size() != destination.size()) {
			return PT_INVALID_SIZE;
		}
		std::transform(source.begin(), source.end(), destination.begin(), [](const ColorU8& pixel) {
			return PtColor{ pixel.r, pixel.g, pixel.b, pixel.a };
		});
	}
	catch (const std::exception& e) {
		std::cerr << "pt_render: " << e.what() << std::endl;
		return PT_RENDER_FAILED;
	}

	return PT_OK;
}

void pt_free_world(PtWorldHandle* handle) {
	delete handle;
}
