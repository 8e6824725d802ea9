// src/classify/perceptron_common.hpp

#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "../core/labeled_point.hpp"
#include "../core/point.hpp"

struct PerceptronOptions {
    double learning_rate  = 1.0;
    double threshold      = 0.0;
    size_t max_iterations = 10'000; // hard cap, data may not be separable
    bool verbose = false;
};

struct TrainingStatistics {
    size_t passes{0};
    size_t misclassified{0};  // during the last pass
    bool converged{false};    // stopped before hitting max_iterations
};

namespace perceptron_detail {

template <typename Label>
Point trainingCentroid(const std::vector<LabeledPoint<Label>>& train) {
    Point sum;
    for (const auto& d : train) {
        sum.addInPlace(d.point);
    }
    return sum.scale(1.0 / static_cast<double>(train.size()));
}

// [1, x - mean]
inline Point augment(const Point& point, const Point& mean) {
    Point result = point.subtract(mean);
    result.prepend(Complex(1.0));
    return result;
}

// A pass with no mistakes always ends training, even with threshold 0.
inline bool shouldStop(size_t misclassified, size_t training_size, double threshold) {
    return misclassified == 0 ||
           static_cast<double>(misclassified) < threshold * static_cast<double>(training_size);
}

inline void logTraining(const std::string& name, const TrainingStatistics& stats) {
    std::cerr << name << " training " << (stats.converged ? "converged" : "stopped") << " after "
              << stats.passes << " passes with " << stats.misclassified << " misclassified" << std::endl;
}

} // namespace perceptron_detail
