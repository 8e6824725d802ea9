// src/utils/random_generator.cpp

#include "random_generator.hpp"

RandomGenerator::RandomGenerator(unsigned int seed) : gen(seed), seed_value(seed) {}

void RandomGenerator::reseed(unsigned int seed) {
    gen.seed(seed);
    seed_value = seed;
}

double RandomGenerator::uniform(double min, double max) {
    std::uniform_real_distribution<double> dist(min, max);
    return dist(gen);
}

Point RandomGenerator::generateUniformPoint(size_t dimensions, double min, double max) {
    Point p(dimensions);
    std::uniform_real_distribution<double> dist(min, max);
    for (size_t i = 0; i < dimensions; ++i) {
        p[i] = dist(gen);
    }
    return p;
}
