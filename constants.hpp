#pragma once

constexpr auto DEFAULT_SAMPLES_PER_PIXEL = 32;
constexpr auto DEFAULT_MAX_RAY_BOUNCES = 8;

constexpr auto CAPI_SAMPLES_PER_PIXEL = 16;
constexpr auto CAPI_MAX_RAY_BOUNCES = 8;

constexpr auto ASPECT_RATIO = 16.0f / 9.0f;
constexpr auto RENDER_WIDTH = 400;

// Lower bound of every world query, keeps scattered rays off their own surface.
constexpr float T_MIN = 0.001f;
constexpr float PARALLEL_EPSILON = 1e-8f;
