#pragma once

#include <glm/vec3.hpp>
#include <cstdint>
#include <iostream>
#include <optional>

#include "camera.hpp"
#include "constants.hpp"
#include "framebuffer.hpp"
#include "random.hpp"
#include "ray.hpp"
#include "world.hpp"

struct Options {
    int samples_per_pixel = DEFAULT_SAMPLES_PER_PIXEL;
    int max_ray_bounces = DEFAULT_MAX_RAY_BOUNCES;
    bool positive_is_up = true; // framebuffer row 0 is the top of the image
    std::ostream* logger = &std::clog; // progress sink, nullptr for silence
    std::optional<std::uint32_t> seed; // empty seeds from std::random_device
};

// Vertical gradient from horizon white to zenith blue.
glm::vec3 sky_color(const glm::vec3& direction);

// Bounded random walk; black once max_ray_bounces scatters are exhausted.
glm::vec3 ray_color(const Ray& ray, const World& world, Random& rng, int max_ray_bounces);

// Sum (not the mean) of the radiance of `samples` jittered rays through a pixel.
glm::vec3 trace_pixel(const World& world, const Camera& cam, int column, int row, int width, int height,
                      int samples, int max_ray_bounces, Random& rng);

// Averages, gamma corrects and quantizes an accumulated pixel.
ColorU8 resolve_color(const glm::vec3& sum, int samples);

Framebuffer ray_trace(const World& world, const Camera& cam, Framebuffer framebuffer, Options options);
