// src/config/classifier_config.cpp

#include "classifier_config.hpp"

#include <fstream>
#include <stdexcept>

void ClassifierConfig::validate() const {
    if (algorithm != "bayes" && algorithm != "knn" && algorithm != "slp" && algorithm != "multiclass-slp") {
        throw std::invalid_argument("Unknown algorithm: " + algorithm);
    }
    if (!(learning_rate > 0.0)) {
        throw std::invalid_argument("Learning rate must be positive");
    }
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument("Threshold must be within [0, 1]");
    }
    if (max_iterations == 0) {
        throw std::invalid_argument("max_iterations must be at least 1");
    }
    if (output_format != "text" && output_format != "json") {
        throw std::invalid_argument("Unknown output format: " + output_format);
    }
}

void to_json(json& j, const ClassifierConfig& c) {
    j = json{
        {"algorithm", c.algorithm},
        {"neighbors", c.neighbors},
        {"learning_rate", c.learning_rate},
        {"threshold", c.threshold},
        {"max_iterations", c.max_iterations},
        {"parallel", c.parallel},
        {"output_format", c.output_format},
        {"verbose", c.verbose}
    };
    if (c.seed) {
        j["seed"] = *c.seed;
    } else {
        j["seed"] = nullptr;
    }
}

void from_json(const json& j, ClassifierConfig& c) {
    c.algorithm      = j.value("algorithm", c.algorithm);
    c.neighbors      = j.value("neighbors", c.neighbors);
    c.learning_rate  = j.value("learning_rate", c.learning_rate);
    c.threshold      = j.value("threshold", c.threshold);
    c.max_iterations = j.value("max_iterations", c.max_iterations);
    c.parallel       = j.value("parallel", c.parallel);
    c.output_format  = j.value("output_format", c.output_format);
    c.verbose        = j.value("verbose", c.verbose);

    auto it = j.find("seed");
    if (it != j.end()) {
        if (it->is_null()) {
            c.seed.reset();
        } else {
            c.seed = it->get<unsigned int>();
        }
    }
}

ClassifierConfig loadConfig(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw std::runtime_error("Could not open config file: " + filename);
    }

    ClassifierConfig config;
    try {
        json j = json::parse(in);
        from_json(j, config);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + filename + ": " + e.what());
    }
    return config;
}
