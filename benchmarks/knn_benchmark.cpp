// benchmarks/knn_benchmark.cpp
#include "../include/point_classifier.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

std::vector<LabeledPoint<std::string>> generateLabeledPoints(RandomGenerator& rng, size_t count, size_t dimensions,
                                                             size_t num_labels) {
    std::vector<LabeledPoint<std::string>> points;
    points.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        points.emplace_back(rng.generateUniformPoint(dimensions), "class_" + std::to_string(i % num_labels));
    }
    return points;
}

void benchmark_knn(size_t dimensions, size_t num_train, size_t num_test, size_t k) {
    RandomGenerator rng(42);
    auto train = generateLabeledPoints(rng, num_train, dimensions, 5);
    auto test = generateLabeledPoints(rng, num_test, dimensions, 5);

    KNearestNeighbor<std::string> sequential(k);
    KNearestNeighbor<std::string> parallel(k);
    parallel.enableParallelInference(true);

    // Benchmark sequential inference
    auto start = std::chrono::high_resolution_clock::now();
    auto sequential_results = sequential.classify(train, test);
    auto end = std::chrono::high_resolution_clock::now();
    auto sequential_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    // Benchmark parallel inference
    start = std::chrono::high_resolution_clock::now();
    auto parallel_results = parallel.classify(train, test);
    end = std::chrono::high_resolution_clock::now();
    auto parallel_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    size_t mismatches = 0;
    for (size_t i = 0; i < sequential_results.size(); ++i) {
        if (sequential_results[i].predicted_label != parallel_results[i].predicted_label) {
            ++mismatches;
        }
    }

    std::cout << "Dimension: " << dimensions << ", Training points: " << num_train << ", Test points: " << num_test << ", k: " << k << std::endl;
    std::cout << "Sequential time: " << sequential_duration.count() << " ms" << std::endl;
    std::cout << "Parallel time: " << parallel_duration.count() << " ms" << std::endl;
    if (parallel_duration.count() > 0) {
        std::cout << "Speedup: " << static_cast<double>(sequential_duration.count()) / parallel_duration.count() << "x" << std::endl;
    }
    std::cout << "Mismatched predictions: " << mismatches << std::endl << std::endl;
}

int main() {
    benchmark_knn(8, 2000, 500, 1);
    benchmark_knn(8, 2000, 500, 15);
    benchmark_knn(64, 5000, 200, 5);
    return 0;
}
