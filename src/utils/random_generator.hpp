#pragma once

#include <algorithm>
#include <random>
#include <vector>

#include "../core/point.hpp"

class RandomGenerator {
private:
    std::mt19937 gen;
    unsigned int seed_value;

public:
    explicit RandomGenerator(unsigned int seed = std::random_device{}());

    unsigned int seed() const { return seed_value; }
    void reseed(unsigned int seed);

    // Uniform in [min, max).
    double uniform(double min = 0.0, double max = 1.0);
    Point generateUniformPoint(size_t dimensions, double min = -1.0, double max = 1.0);

    template <typename T>
    void shuffle(std::vector<T>& values) {
        std::shuffle(values.begin(), values.end(), gen);
    }
};
