// src/utils/partial_sort.hpp

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "../core/errors.hpp"

// IEEE-754 totalOrder: -NaN < -inf < ... < -0.0 < +0.0 < ... < +inf < +NaN.
// Unlike operator<, this is a strict weak (in fact total) order even with NaN.
inline bool total_order_less(double a, double b) {
    int64_t ia;
    int64_t ib;
    std::memcpy(&ia, &a, sizeof(a));
    std::memcpy(&ib, &b, sizeof(b));
    // flip the magnitude bits of negatives so they compare as two's complement
    ia ^= static_cast<int64_t>(static_cast<uint64_t>(ia >> 63) >> 1);
    ib ^= static_cast<int64_t>(static_cast<uint64_t>(ib >> 63) >> 1);
    return ia < ib;
}

// Moves the k smallest elements (by `less`) to the front of `values`, in
// ascending order. The remaining elements end up in unspecified order.
//
// Reverse bubble selection: each pass walks from the back and carries the
// minimum of the unsorted tail down to position i. O(k * n), which is what we
// want for k-NN where k is much smaller than the training set.
template <typename T, typename Less>
void partial_sort_by(std::vector<T>& values, size_t k, Less less) {
    if (k > values.size()) {
        throw PreconditionError("cannot sort " + std::to_string(k) + " of " +
                                std::to_string(values.size()) + " elements");
    }
    for (size_t i = 0; i < k; ++i) {
        for (size_t j = values.size() - 1; j > i; --j) {
            if (less(values[j], values[j - 1])) {
                std::swap(values[j], values[j - 1]);
            }
        }
    }
}

template <typename T>
void partial_sort_by(std::vector<T>& values, size_t k) {
    partial_sort_by(values, k, [](const T& a, const T& b) { return a < b; });
}
