// src/classify/k_nearest_neighbor.hpp

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "../core/errors.hpp"
#include "../utils/partial_sort.hpp"
#include "classifier.hpp"

// Majority vote among the k training points closest (Euclidean) to the query.
// Labels need std::hash and operator==.
template <typename Label>
class KNearestNeighbor : public Classifier<Label> {
public:
    using typename Classifier<Label>::Dataset;

    explicit KNearestNeighbor(size_t k) : k(k) {}

    std::string name() const override { return "knn"; }

    // Throws PreconditionError when there are fewer than k training points.
    void fit(const Dataset& train) override {
        if (train.size() < k) {
            throw PreconditionError("not enough training data for " + std::to_string(k) + " neighbors (have " +
                                    std::to_string(train.size()) + ")");
        }
        training = train;
    }

    // Vote ties go to the label seen first while walking the neighbours in
    // increasing distance, i.e. the label of the closest tied neighbour.
    Label predict(const Point& point) const override {
        if (k == 0) {
            return Label{};
        }

        struct Neighbor {
            const LabeledPoint<Label>* data;
            double distance;
        };

        std::vector<Neighbor> distances;
        distances.reserve(training.size());
        for (const auto& d : training) {
            distances.push_back(Neighbor{&d, d.point.subtract(point).magnitude()});
        }
        partial_sort_by(distances, k, [](const Neighbor& a, const Neighbor& b) {
            return total_order_less(a.distance, b.distance);
        });

        std::unordered_map<Label, size_t> votes;
        votes.reserve(k);
        std::vector<const Label*> order;
        for (size_t i = 0; i < k; ++i) {
            const Label& label = distances[i].data->label;
            auto result = votes.emplace(label, 0);
            if (result.second) {
                order.push_back(&label);
            }
            ++result.first->second;
        }

        const Label* winner = order.front();
        size_t most = votes.at(*winner);
        for (const Label* label : order) {
            size_t count = votes.at(*label);
            if (count > most) {
                winner = label;
                most = count;
            }
        }
        return *winner;
    }

    size_t getK() const { return k; }

private:
    size_t k;
    Dataset training;
};
