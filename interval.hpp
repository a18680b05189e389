#pragma once

#include <limits>

const float infinity = std::numeric_limits<float>::infinity();

class Interval {
public:
    float min, max;

    Interval(float min, float max);

    bool contains(float x) const;

    bool surrounds(float x) const;

    float clamp(float x) const;
};
