#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <string>

#include "camera.hpp"
#include "cli.hpp"
#include "constants.hpp"
#include "framebuffer.hpp"
#include "image_writer.hpp"
#include "render.hpp"
#include "scene_parser.hpp"
#include "viewer.hpp"

static void print_usage(const char* program) {
	std::cerr << "Usage: " << program << " <scene> [options]\n"
		<< "  -o <file>     output image, .ppm or .png (default: PPM on stdout)\n"
		<< "  -w <width>    image width in pixels (default " << RENDER_WIDTH << ")\n"
		<< "  -s <samples>  samples per pixel (default " << DEFAULT_SAMPLES_PER_PIXEL << ")\n"
		<< "  -d <depth>    maximum ray bounces (default " << DEFAULT_MAX_RAY_BOUNCES << ")\n"
		<< "  --seed <n>    fixed random seed\n"
		<< "  --flip        write rows bottom-up\n"
		<< "  --live        progressive preview window\n";
}

static bool ends_with(const std::string& value, const std::string& suffix) {
	return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int main(int argc, char* argv[]) {
	if (argc < 2) {
		print_usage(argv[0]);
		return 1;
	}

	std::string scene_path;
	std::string output_path;
	long long width = RENDER_WIDTH;
	bool live = false;
	Options options;

	constexpr long long int_limit = std::numeric_limits<int>::max();
	constexpr long long seed_limit = std::numeric_limits<std::uint32_t>::max();

	for (int i = 1; i < argc; i++) {
		const std::string arg = argv[i];
		const bool has_value = i + 1 < argc;
		long long value = 0;

		if (arg == "-o" && has_value) {
			output_path = argv[++i];
		}
		else if (arg == "-w" && has_value && parse_int_arg(argv[++i], 1, int_limit, value)) {
			width = value;
		}
		else if (arg == "-s" && has_value && parse_int_arg(argv[++i], 1, int_limit, value)) {
			options.samples_per_pixel = static_cast<int>(value);
		}
		else if (arg == "-d" && has_value && parse_int_arg(argv[++i], 0, int_limit, value)) {
			options.max_ray_bounces = static_cast<int>(value);
		}
		else if (arg == "--seed" && has_value && parse_int_arg(argv[++i], 0, seed_limit, value)) {
			options.seed = static_cast<std::uint32_t>(value);
		}
		else if (arg == "--flip") {
			options.positive_is_up = false;
		}
		else if (arg == "--live") {
			live = true;
		}
		else if (scene_path.empty() && !arg.empty() && arg[0] != '-') {
			scene_path = arg;
		}
		else {
			std::cerr << "Invalid argument: " << arg << "\n";
			print_usage(argv[0]);
			return 1;
		}
	}

	if (scene_path.empty()) {
		print_usage(argv[0]);
		return 1;
	}

	Scene scene;
	try {
		scene = load_scene_file(scene_path);
	}
	catch (const SceneError& e) {
		std::cerr << "Error loading " << scene_path << ": " << e.what() << std::endl;
		return 1;
	}

	const int image_width = static_cast<int>(width);
	const int image_height = std::max(1, static_cast<int>(image_width / scene.camera.aspect_ratio()));

	std::clog << "Loaded " << scene.world.spheres.size() << " spheres and "
		<< scene.world.triangle_count() << " triangles from " << scene_path << std::endl;

	if (live) {
		return render_live(scene.world, scene.camera, image_width, image_height, options) ? 0 : 1;
	}

	Framebuffer framebuffer(0, 0);
	try {
		framebuffer = ray_trace(scene.world, scene.camera, Framebuffer(image_width, image_height), options);
	}
	catch (const std::exception& e) {
		std::cerr << "Rendering failed: " << e.what() << std::endl;
		return 1;
	}

	bool written = false;
	if (output_path.empty()) {
		written = save_ppm(framebuffer, std::cout);
	}
	else if (ends_with(output_path, ".png")) {
		written = save_png(framebuffer, output_path);
	}
	else {
		written = save_ppm(framebuffer, output_path);
	}

	if (!written) {
		return 1;
	}
	if (!output_path.empty()) {
		std::clog << "Wrote " << output_path << std::endl;
	}
	return 0;
}
