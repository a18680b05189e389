#pragma once

#include <cstdint>
#include <random>

// Private random stream. One instance per render call, never shared.
class Random {
public:
    Random();
    explicit Random(std::uint32_t seed);

    float random_float();     // [0, 1)
    float random_bilateral(); // [-1, 1)

private:
    std::mt19937 engine;
    std::uniform_real_distribution<float> dist{0.0f, 1.0f};
};
