//examples/basic_usage.cpp
#include "../include/point_classifier.hpp"
#include <iostream>

int main() {
    // Two labelled clusters in the plane
    auto train = dataset_io::parseDataset<std::string>(
        "0 0 red\n"
        "1 0 red\n"
        "0 1 red\n"
        "10 10 blue\n"
        "11 10 blue\n"
        "10 11 blue\n");
    auto test = dataset_io::parseDataset<std::string>(
        "0.5 0.5 ?\n"
        "9.5 10.5 ?\n"
        "4 6 ?\n");

    // A seeded generator makes the perceptron runs repeatable
    auto rng = std::make_shared<RandomGenerator>(2024);

    ClassifierConfig config;
    config.neighbors = 3;
    for (const char* algorithm : {"bayes", "knn", "slp", "multiclass-slp"}) {
        config.algorithm = algorithm;
        auto classifier = ClassifierFactory<std::string>::create(config, rng);
        auto results = classifier->classify(train, test);

        std::cout << classifier->name() << ":" << std::endl;
        std::cout << dataset_io::formatResults(results) << std::endl;
    }

    return 0;
}
