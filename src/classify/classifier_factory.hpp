// src/classify/classifier_factory.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "../config/classifier_config.hpp"
#include "../utils/random_generator.hpp"
#include "bayes_plug_in.hpp"
#include "classifier.hpp"
#include "k_nearest_neighbor.hpp"
#include "multiclass_perceptron.hpp"
#include "single_layer_perceptron.hpp"

template <typename Label>
class ClassifierFactory {
public:
    // Builds the classifier named by config.algorithm. The perceptrons draw
    // from `rng`; when it is null one is made from config.seed.
    static std::unique_ptr<Classifier<Label>> create(const ClassifierConfig& config,
                                                     std::shared_ptr<RandomGenerator> rng = nullptr) {
        config.validate();

        if (!rng) {
            rng = config.seed ? std::make_shared<RandomGenerator>(*config.seed)
                              : std::make_shared<RandomGenerator>();
        }

        PerceptronOptions options;
        options.learning_rate = config.learning_rate;
        options.threshold = config.threshold;
        options.max_iterations = config.max_iterations;
        options.verbose = config.verbose;

        std::unique_ptr<Classifier<Label>> classifier;
        if (config.algorithm == "bayes") {
            classifier = std::make_unique<BayesPlugIn<Label>>();
        } else if (config.algorithm == "knn") {
            classifier = std::make_unique<KNearestNeighbor<Label>>(config.neighbors);
        } else if (config.algorithm == "slp") {
            classifier = std::make_unique<SingleLayerPerceptron<Label>>(options, rng);
        } else if (config.algorithm == "multiclass-slp") {
            classifier = std::make_unique<MulticlassPerceptron<Label>>(options, rng);
        } else {
            throw std::invalid_argument("Unknown algorithm: " + config.algorithm);
        }

        classifier->enableParallelInference(config.parallel);
        return classifier;
    }
};
