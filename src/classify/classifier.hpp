// src/classify/classifier.hpp

#pragma once

#include <string>
#include <vector>

#include "../core/classification.hpp"
#include "../core/labeled_point.hpp"
#include "../optimizations/parallel_processing.hpp"

template <typename Label>
class Classifier {
public:
    using Dataset = std::vector<LabeledPoint<Label>>;
    using Results = std::vector<Classification<Label>>;

    virtual ~Classifier() = default;

    virtual std::string name() const = 0;

    // Learns from `train`, replacing whatever was learned before.
    virtual void fit(const Dataset& train) = 0;
    virtual Label predict(const Point& point) const = 0;

    // fit() then predict() every test point. Results are in test order and
    // refer back into `test`.
    Results classify(const Dataset& train, const Dataset& test) {
        fit(train);
        return predictAll(test);
    }

    Results predictAll(const Dataset& test) const {
        Results results(test.size());
        auto task = [&](size_t start, size_t end) {
            for (size_t i = start; i < end; ++i) {
                results[i] = Classification<Label>(test[i], predict(test[i].point));
            }
        };
        // prediction only reads the fitted model, so chunks can run concurrently
        if (parallel) {
            parallel_ops::parallel_for(test.size(), task);
        } else {
            task(0, test.size());
        }
        return results;
    }

    void enableParallelInference(bool enable) { parallel = enable; }
    bool isParallelInferenceEnabled() const { return parallel; }

protected:
    bool parallel = false;
};
