// src/config/classifier_config.hpp

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct ClassifierConfig {
    // One of "bayes", "knn", "slp", "multiclass-slp"
    std::string algorithm = "knn";

    // k-NN
    size_t neighbors = 1;

    // Perceptrons
    double learning_rate  = 1.0;
    double threshold      = 0.0;   // fraction of the training set allowed to stay misclassified
    size_t max_iterations = 10'000;
    std::optional<unsigned int> seed; // unset: seeded from std::random_device

    // Misc toggles
    bool parallel = false;            // split inference across threads
    std::string output_format = "text"; // "text" or "json"
    bool verbose = false;

    // Throws std::invalid_argument on values no classifier can use.
    void validate() const;
};

void to_json(json& j, const ClassifierConfig& c);
// Keys missing from `j` keep their current value in `c`.
void from_json(const json& j, ClassifierConfig& c);

// Reads a JSON config file on top of the defaults.
ClassifierConfig loadConfig(const std::string& filename);
