// src/classify/single_layer_perceptron.hpp

#pragma once

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../core/errors.hpp"
#include "../utils/random_generator.hpp"
#include "classifier.hpp"
#include "perceptron_common.hpp"

/**
 * Two-class single-layer perceptron.
 *
 * The label of the first training point is the positive class, the first
 * different label is the negative class and any further labels are also
 * treated as negative. Points are centred on the training mean and augmented
 * to [1, x] so the bias is the first weight.
 *
 * Each pass visits the training set in a fresh random order and, for every
 * misclassified point, adds learning_rate * (t - sign(w.y)) * y to the
 * weights, t being +1 / -1.
 */
template <typename Label>
class SingleLayerPerceptron : public Classifier<Label> {
public:
    using typename Classifier<Label>::Dataset;

    explicit SingleLayerPerceptron(PerceptronOptions options = {},
                                   std::shared_ptr<RandomGenerator> rng = std::make_shared<RandomGenerator>())
        : options(options), rng(std::move(rng)) {}

    std::string name() const override { return "slp"; }

    // Throws PreconditionError unless the training data holds two labels.
    void fit(const Dataset& train) override {
        if (train.empty()) {
            throw PreconditionError("the perceptron needs at least one training point");
        }
        const Label& first = train.front().label;
        auto other = std::find_if(train.begin(), train.end(),
                                  [&](const LabeledPoint<Label>& d) { return !(d.label == first); });
        if (other == train.end()) {
            throw PreconditionError("the perceptron training data does not have two classifications");
        }
        positive = first;
        negative = other->label;

        mean = perceptron_detail::trainingCentroid(train);

        struct Sample {
            Point point;
            double target;
        };
        std::vector<Sample> samples;
        samples.reserve(train.size());
        for (const auto& d : train) {
            samples.push_back(Sample{perceptron_detail::augment(d.point, mean), d.label == positive ? 1.0 : -1.0});
        }

        weights = rng->generateUniformPoint(mean.size() + 1);
        stats = TrainingStatistics{};

        for (size_t pass = 0; pass < options.max_iterations; ++pass) {
            rng->shuffle(samples);

            size_t misclassified = 0;
            for (const auto& s : samples) {
                double value = weights.dot(s.point).re;
                // sign(+0.0) is +1, same as the decision rule during training
                double error = s.target - std::copysign(1.0, value);
                if (error != 0.0) {
                    ++misclassified;
                    weights.addInPlace(s.point.scale(error).scale(options.learning_rate));
                }
            }

            stats.passes = pass + 1;
            stats.misclassified = misclassified;
            if (perceptron_detail::shouldStop(misclassified, train.size(), options.threshold)) {
                stats.converged = true;
                break;
            }
        }
        trained = true;

        if (options.verbose) {
            perceptron_detail::logTraining("Binary perceptron", stats);
        }
    }

    // Strictly positive discriminant -> positive class.
    Label predict(const Point& point) const override {
        if (!trained) {
            throw PreconditionError("the perceptron has not been trained");
        }
        double value = weights.dot(perceptron_detail::augment(point, mean)).re;
        return value > 0.0 ? positive : negative;
    }

    const TrainingStatistics& lastTrainingStatistics() const { return stats; }
    const Point& getWeights() const { return weights; }
    const Label& positiveLabel() const { return positive; }
    const Label& negativeLabel() const { return negative; }

private:
    PerceptronOptions options;
    std::shared_ptr<RandomGenerator> rng;

    bool trained = false;
    Label positive{};
    Label negative{};
    Point mean;
    Point weights;
    TrainingStatistics stats;
};
