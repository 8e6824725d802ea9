#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "../src/classify/classifier_factory.hpp"
#include "../src/config/classifier_config.hpp"

TEST(ClassifierConfigTest, DefaultsAreValid) {
    ClassifierConfig config;
    EXPECT_EQ(config.algorithm, "knn");
    EXPECT_EQ(config.neighbors, 1u);
    EXPECT_DOUBLE_EQ(config.learning_rate, 1.0);
    EXPECT_DOUBLE_EQ(config.threshold, 0.0);
    EXPECT_EQ(config.max_iterations, 10'000u);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_NO_THROW(config.validate());
}

TEST(ClassifierConfigTest, JsonRoundTripKeepsEveryField) {
    ClassifierConfig config;
    config.algorithm = "multiclass-slp";
    config.neighbors = 5;
    config.learning_rate = 0.25;
    config.threshold = 0.1;
    config.max_iterations = 300;
    config.seed = 17u;
    config.parallel = true;
    config.output_format = "json";
    config.verbose = true;

    json j = config;
    ClassifierConfig back = j.get<ClassifierConfig>();

    EXPECT_EQ(back.algorithm, "multiclass-slp");
    EXPECT_EQ(back.neighbors, 5u);
    EXPECT_DOUBLE_EQ(back.learning_rate, 0.25);
    EXPECT_DOUBLE_EQ(back.threshold, 0.1);
    EXPECT_EQ(back.max_iterations, 300u);
    ASSERT_TRUE(back.seed.has_value());
    EXPECT_EQ(*back.seed, 17u);
    EXPECT_TRUE(back.parallel);
    EXPECT_EQ(back.output_format, "json");
    EXPECT_TRUE(back.verbose);
}

TEST(ClassifierConfigTest, PartialJsonKeepsDefaults) {
    ClassifierConfig config;
    config.seed = 3u;
    from_json(json{{"algorithm", "bayes"}, {"seed", nullptr}}, config);

    EXPECT_EQ(config.algorithm, "bayes");
    EXPECT_EQ(config.neighbors, 1u);
    EXPECT_DOUBLE_EQ(config.learning_rate, 1.0);
    EXPECT_FALSE(config.seed.has_value());
}

TEST(ClassifierConfigTest, ValidateRejectsBadValues) {
    ClassifierConfig config;
    config.algorithm = "svm";
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ClassifierConfig{};
    config.learning_rate = 0.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ClassifierConfig{};
    config.threshold = 1.5;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ClassifierConfig{};
    config.max_iterations = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ClassifierConfig{};
    config.output_format = "xml";
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ClassifierConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "point_classifier_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"algorithm": "slp", "learning_rate": 0.5, "seed": 8})";
    }

    ClassifierConfig config = loadConfig(path.string());
    EXPECT_EQ(config.algorithm, "slp");
    EXPECT_DOUBLE_EQ(config.learning_rate, 0.5);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 8u);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(loadConfig(path.string()), std::runtime_error);

    std::filesystem::remove(path);
    EXPECT_THROW(loadConfig(path.string()), std::runtime_error);
}

TEST(ClassifierFactoryTest, BuildsEveryAlgorithm) {
    ClassifierConfig config;
    for (const std::string name : {"bayes", "knn", "slp", "multiclass-slp"}) {
        config.algorithm = name;
        auto classifier = ClassifierFactory<std::string>::create(config);
        ASSERT_TRUE(classifier != nullptr);
        EXPECT_EQ(classifier->name(), name);
        EXPECT_FALSE(classifier->isParallelInferenceEnabled());
    }

    config.algorithm = "knn";
    config.parallel = true;
    EXPECT_TRUE(ClassifierFactory<std::string>::create(config)->isParallelInferenceEnabled());

    config.algorithm = "tree";
    EXPECT_THROW(ClassifierFactory<std::string>::create(config), std::invalid_argument);
}

TEST(ClassifierFactoryTest, SeededConfigIsReproducible) {
    std::vector<LabeledPoint<std::string>> train{
        {Point{0.0, 0.0}, "A"}, {Point{1.0, 0.0}, "A"}, {Point{3.0, 3.0}, "B"}, {Point{3.0, 4.0}, "B"}};
    std::vector<LabeledPoint<std::string>> test{{Point{0.5, 0.1}, "?"}, {Point{3.1, 3.5}, "?"}};

    ClassifierConfig config;
    config.algorithm = "slp";
    config.seed = 21u;

    auto first = ClassifierFactory<std::string>::create(config)->classify(train, test);
    auto second = ClassifierFactory<std::string>::create(config)->classify(train, test);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].predicted_label, second[i].predicted_label);
    }
}
