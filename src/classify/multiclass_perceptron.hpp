// src/classify/multiclass_perceptron.hpp

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../utils/partial_sort.hpp"
#include "../utils/random_generator.hpp"
#include "classifier.hpp"
#include "perceptron_common.hpp"

// One-vs-rest perceptron: one weight vector per label over the same centred,
// [1, x] augmented points as the binary perceptron. The predicted label is the
// arg-max of w_c . y; a wrong guess adds learning_rate * y to the true label's
// weights and subtracts it from every other label's.
//
// Labels are kept in order of first appearance in the training set and score
// ties go to the earlier label. Labels need std::hash and operator==.
template <typename Label>
class MulticlassPerceptron : public Classifier<Label> {
public:
    using typename Classifier<Label>::Dataset;

    explicit MulticlassPerceptron(PerceptronOptions options = {},
                                  std::shared_ptr<RandomGenerator> rng = std::make_shared<RandomGenerator>())
        : options(options), rng(std::move(rng)) {}

    std::string name() const override { return "multiclass-slp"; }

    void fit(const Dataset& train) override {
        labels.clear();
        weights.clear();
        mean = Point();
        stats = TrainingStatistics{};
        if (train.empty()) {
            return;
        }

        std::unordered_map<Label, size_t> index;
        for (const auto& d : train) {
            if (index.emplace(d.label, labels.size()).second) {
                labels.push_back(d.label);
            }
        }

        mean = perceptron_detail::trainingCentroid(train);

        std::vector<std::pair<Point, size_t>> samples;
        samples.reserve(train.size());
        for (const auto& d : train) {
            samples.emplace_back(perceptron_detail::augment(d.point, mean), index.at(d.label));
        }

        for (size_t i = 0; i < labels.size(); ++i) {
            weights.push_back(rng->generateUniformPoint(mean.size() + 1));
        }

        for (size_t pass = 0; pass < options.max_iterations; ++pass) {
            rng->shuffle(samples);

            size_t misclassified = 0;
            for (const auto& [point, actual] : samples) {
                if (bestClass(point) == actual) {
                    continue;
                }
                ++misclassified;

                Point adjustment = point.scale(options.learning_rate);
                for (size_t c = 0; c < weights.size(); ++c) {
                    if (c == actual) {
                        weights[c].addInPlace(adjustment);
                    } else {
                        weights[c].subtractInPlace(adjustment);
                    }
                }
            }

            stats.passes = pass + 1;
            stats.misclassified = misclassified;
            if (perceptron_detail::shouldStop(misclassified, train.size(), options.threshold)) {
                stats.converged = true;
                break;
            }
        }

        if (options.verbose) {
            perceptron_detail::logTraining("Multiclass perceptron", stats);
        }
    }

    // Label{} when nothing was learned.
    Label predict(const Point& point) const override {
        if (weights.empty()) {
            return Label{};
        }
        return labels[bestClass(perceptron_detail::augment(point, mean))];
    }

    const TrainingStatistics& lastTrainingStatistics() const { return stats; }
    const std::vector<Label>& getLabels() const { return labels; }
    const std::vector<Point>& getWeights() const { return weights; }

private:
    PerceptronOptions options;
    std::shared_ptr<RandomGenerator> rng;

    std::vector<Label> labels;
    std::vector<Point> weights;  // parallel to labels
    Point mean;
    TrainingStatistics stats;

    size_t bestClass(const Point& augmented) const {
        size_t best = 0;
        double best_score = weights[0].dot(augmented).re;
        for (size_t c = 1; c < weights.size(); ++c) {
            double score = weights[c].dot(augmented).re;
            if (total_order_less(best_score, score)) {
                best = c;
                best_score = score;
            }
        }
        return best;
    }
};
