// src/core/classification.hpp

#pragma once

#include <ostream>
#include <utility>

#include "labeled_point.hpp"

// One classifier output. `data` points into the caller's test set and is only
// valid while that set is alive and unmodified.
template <typename Label>
struct Classification {
    const LabeledPoint<Label>* data = nullptr;
    Label predicted_label{};

    Classification() = default;
    Classification(const LabeledPoint<Label>& point, Label guess)
        : data(&point), predicted_label(std::move(guess)) {}
};

// "<components>   <predicted label>"
template <typename Label>
std::ostream& operator<<(std::ostream& os, const Classification<Label>& result) {
    if (result.data && !result.data->point.empty()) {
        os << result.data->point << "   ";
    }
    return os << result.predicted_label;
}
