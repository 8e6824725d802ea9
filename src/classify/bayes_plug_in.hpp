// src/classify/bayes_plug_in.hpp

#pragma once

#include <map>
#include <string>
#include <vector>

#include "../utils/partial_sort.hpp"
#include "classifier.hpp"

/**
 * Bayesian plug-in rule for Gaussian classes sharing an identity covariance.
 *
 * With equal covariances the log-likelihood ratio is linear, so each class only
 * needs its mean mu:
 *     g(x) = w . x - w0,   w = 2 conj(mu),   w0 = mu . conj(mu)
 * and the class with the largest Re g(x) wins.
 *
 * Labels need operator< (classes are grouped with std::map). Ties go to the
 * class that appears first in the training set. With no training data every
 * prediction is Label{}.
 */
template <typename Label>
class BayesPlugIn : public Classifier<Label> {
public:
    using typename Classifier<Label>::Dataset;

    struct Weights {
        Label label;
        Point w;
        Complex w0;
    };

    std::string name() const override { return "bayes"; }

    void fit(const Dataset& train) override {
        std::map<Label, size_t> groups;
        std::vector<Label> labels;
        std::vector<Point> sums;
        std::vector<size_t> counts;

        for (const auto& d : train) {
            auto it = groups.find(d.label);
            if (it == groups.end()) {
                it = groups.emplace(d.label, labels.size()).first;
                labels.push_back(d.label);
                sums.emplace_back();
                counts.push_back(0);
            }
            sums[it->second].addInPlace(d.point);
            ++counts[it->second];
        }

        weights.clear();
        weights.reserve(labels.size());
        for (size_t g = 0; g < labels.size(); ++g) {
            Point mean = sums[g].scale(1.0 / static_cast<double>(counts[g]));
            Point mean_conj = mean.conjugate();
            weights.push_back(Weights{labels[g], mean_conj.scale(2.0), mean.dot(mean_conj)});
        }
    }

    Label predict(const Point& point) const override {
        if (weights.empty()) {
            return Label{};
        }

        size_t best = 0;
        double best_score = score(weights[0], point);
        for (size_t i = 1; i < weights.size(); ++i) {
            double s = score(weights[i], point);
            if (total_order_less(best_score, s)) {
                best = i;
                best_score = s;
            }
        }
        return weights[best].label;
    }

    const std::vector<Weights>& getWeights() const { return weights; }

private:
    std::vector<Weights> weights;

    static double score(const Weights& w, const Point& point) {
        return (w.w.dot(point) - w.w0).re;
    }
};
