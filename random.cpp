#include "random.hpp"

#include <cstdint>
#include <random>

Random::Random() : engine(std::random_device{}()) {}

Random::Random(std::uint32_t seed) : engine(seed) {}

float Random::random_float() {
    return dist(engine);
}

float Random::random_bilateral() {
    return 2.0f * dist(engine) - 1.0f;
}
