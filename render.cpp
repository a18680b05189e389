#include "render.hpp"

#include <glm/glm.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>

#include "camera.hpp"
#include "hit_info.hpp"
#include "interval.hpp"
#include "material.hpp"
#include "world.hpp"

glm::vec3 sky_color(const glm::vec3& direction) {
    float t = 0.5f * (glm::normalize(direction).y + 1.0f);
    glm::vec3 top = glm::vec3(0.5f, 0.7f, 1.0f);    // Sky blue
    glm::vec3 bottom = glm::vec3(1.0f);            // Horizon white
    return (1.0f - t) * bottom + t * top;
}

glm::vec3 ray_color(const Ray& ray, const World& world, Random& rng, int max_ray_bounces) {
    Ray current = ray;
    glm::vec3 throughput(1.0f);

    for (int depth = 0; depth < max_ray_bounces; depth++) {
        HitInfo hit;
        if (!world.hit(current, hit)) {
            return throughput * sky_color(current.direction());
        }

        ScatterData scatter = hit.mat_ptr->scatter(current, hit, rng);
        throughput *= scatter.attenuation;

        if (!scatter.next_ray) {
            return throughput; // absorbed
        }
        current = *scatter.next_ray;
    }

    return glm::vec3(0.0f);
}

glm::vec3 trace_pixel(const World& world, const Camera& cam, int column, int row, int width, int height,
                      int samples, int max_ray_bounces, Random& rng) {
    const float u_scale = 1.0f / static_cast<float>(std::max(width - 1, 1));
    const float v_scale = 1.0f / static_cast<float>(std::max(height - 1, 1));

    glm::vec3 color(0.0f);
    for (int s = 0; s < samples; s++) {
        const float u = (static_cast<float>(column) + rng.random_float()) * u_scale;
        const float v = (static_cast<float>(row) + rng.random_float()) * v_scale;
        color += ray_color(cam.cast_ray(u, v), world, rng, max_ray_bounces);
    }
    return color;
}

ColorU8 resolve_color(const glm::vec3& sum, int samples) {
    static const Interval intensity(0.0f, 1.0f);
    const float scale = samples > 0 ? 1.0f / static_cast<float>(samples) : 0.0f;

    // Gamma correction (approximate to sqrt).
    const float r = std::sqrt(std::fmax(sum.r * scale, 0.0f));
    const float g = std::sqrt(std::fmax(sum.g * scale, 0.0f));
    const float b = std::sqrt(std::fmax(sum.b * scale, 0.0f));

    return ColorU8{
        static_cast<std::uint8_t>(intensity.clamp(r) * 255.999f),
        static_cast<std::uint8_t>(intensity.clamp(g) * 255.999f),
        static_cast<std::uint8_t>(intensity.clamp(b) * 255.999f),
        255
    };
}

Framebuffer ray_trace(const World& world, const Camera& cam, Framebuffer framebuffer, Options options) {
    Random rng = options.seed ? Random(*options.seed) : Random();

    const int width = framebuffer.width();
    const int height = framebuffer.height();

    auto render_start = std::chrono::high_resolution_clock::now();

    for (int row = 0; row < height; row++) {
        if (options.logger) {
            *options.logger << "\rScanlines remaining: " << std::left << std::setw(4) << (height - row - 1)
                            << std::right << std::flush;
        }

        const int target_row = options.positive_is_up ? height - row - 1 : row;

        for (int column = 0; column < width; column++) {
            glm::vec3 color = trace_pixel(world, cam, column, row, width, height,
                                          options.samples_per_pixel, options.max_ray_bounces, rng);
            framebuffer.at(target_row, column) = resolve_color(color, options.samples_per_pixel);
        }
    }

    auto render_stop = std::chrono::high_resolution_clock::now();

    if (options.logger) {
        *options.logger << "\nRendering took "
                        << std::chrono::duration_cast<std::chrono::milliseconds>(render_stop - render_start).count()
                        << " milliseconds" << std::endl;
    }

    return framebuffer;
}
