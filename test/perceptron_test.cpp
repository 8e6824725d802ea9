#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "../src/classify/multiclass_perceptron.hpp"
#include "../src/classify/single_layer_perceptron.hpp"

using Dataset = std::vector<LabeledPoint<std::string>>;

namespace {

// Three points of a unit right triangle with its corner at (x, y).
void addCluster(Dataset& data, double x, double y, const std::string& label) {
    data.push_back({Point{x, y}, label});
    data.push_back({Point{x + 1.0, y}, label});
    data.push_back({Point{x, y + 1.0}, label});
}

} // namespace

TEST(SingleLayerPerceptronTest, SeparatesTwoClusters) {
    Dataset train;
    addCluster(train, 0.0, 0.0, "A");
    addCluster(train, 10.0, 10.0, "B");
    // inside each training triangle
    Dataset test{{Point{0.2, 0.2}, "?"}, {Point{10.2, 10.2}, "?"}, {Point{0.5, 0.3}, "?"}};

    SingleLayerPerceptron<std::string> slp({}, std::make_shared<RandomGenerator>(42));
    auto results = slp.classify(train, test);

    const auto& stats = slp.lastTrainingStatistics();
    EXPECT_TRUE(stats.converged);
    EXPECT_EQ(stats.misclassified, 0u);
    EXPECT_LE(stats.passes, 10'000u);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].predicted_label, "A");
    EXPECT_EQ(results[1].predicted_label, "B");
    EXPECT_EQ(results[2].predicted_label, "A");
    EXPECT_EQ(slp.positiveLabel(), "A");
    EXPECT_EQ(slp.negativeLabel(), "B");
    EXPECT_EQ(slp.getWeights().size(), 3u);
}

TEST(SingleLayerPerceptronTest, ExtraLabelsJoinTheNegativeClass) {
    Dataset train;
    addCluster(train, 0.0, 0.0, "A");
    train.push_back({Point{10.0, 10.0}, "B"});
    train.push_back({Point{11.0, 10.0}, "C"});
    train.push_back({Point{10.0, 11.0}, "C"});

    SingleLayerPerceptron<std::string> slp({}, std::make_shared<RandomGenerator>(3));
    slp.fit(train);
    EXPECT_TRUE(slp.lastTrainingStatistics().converged);
    EXPECT_EQ(slp.predict(Point{10.2, 10.2}), "B");
    EXPECT_EQ(slp.predict(Point{0.2, 0.2}), "A");
}

TEST(SingleLayerPerceptronTest, SameSeedGivesSameModel) {
    Dataset train;
    addCluster(train, 0.0, 0.0, "A");
    addCluster(train, 4.0, 1.0, "B");

    SingleLayerPerceptron<std::string> first({}, std::make_shared<RandomGenerator>(1234));
    SingleLayerPerceptron<std::string> second({}, std::make_shared<RandomGenerator>(1234));
    first.fit(train);
    second.fit(train);

    EXPECT_EQ(first.getWeights(), second.getWeights());
    EXPECT_EQ(first.lastTrainingStatistics().passes, second.lastTrainingStatistics().passes);
}

TEST(SingleLayerPerceptronTest, StopsAtIterationCapOnInseparableData) {
    // XOR
    Dataset train{{Point{0.0, 0.0}, "A"}, {Point{1.0, 1.0}, "A"}, {Point{1.0, 0.0}, "B"}, {Point{0.0, 1.0}, "B"}};

    PerceptronOptions options;
    options.max_iterations = 50;
    SingleLayerPerceptron<std::string> slp(options, std::make_shared<RandomGenerator>(9));
    slp.fit(train);

    const auto& stats = slp.lastTrainingStatistics();
    EXPECT_FALSE(stats.converged);
    EXPECT_EQ(stats.passes, 50u);
    EXPECT_GT(stats.misclassified, 0u);
}

TEST(SingleLayerPerceptronTest, ThresholdAllowsEarlyStop) {
    Dataset train{{Point{0.0, 0.0}, "A"}, {Point{1.0, 1.0}, "A"}, {Point{1.0, 0.0}, "B"}, {Point{0.0, 1.0}, "B"}};

    PerceptronOptions options;
    options.threshold = 1.0;  // any pass with fewer than 4 mistakes is good enough
    options.max_iterations = 10'000;
    SingleLayerPerceptron<std::string> slp(options, std::make_shared<RandomGenerator>(5));
    slp.fit(train);

    EXPECT_TRUE(slp.lastTrainingStatistics().converged);
    EXPECT_LT(slp.lastTrainingStatistics().passes, 10'000u);
}

TEST(SingleLayerPerceptronTest, RejectsDegenerateTrainingData) {
    SingleLayerPerceptron<std::string> slp({}, std::make_shared<RandomGenerator>(1));
    EXPECT_THROW(slp.fit({}), PreconditionError);

    Dataset one_class{{Point{0.0}, "A"}, {Point{1.0}, "A"}};
    EXPECT_THROW(slp.fit(one_class), PreconditionError);

    EXPECT_THROW(slp.predict(Point{0.0}), PreconditionError);
}

TEST(MulticlassPerceptronTest, SeparatesThreeClusters) {
    Dataset train;
    addCluster(train, 0.0, 0.0, "A");
    addCluster(train, 20.0, 0.0, "B");
    addCluster(train, 0.0, 20.0, "C");
    Dataset test{{Point{0.3, 0.3}, "?"}, {Point{20.3, 0.3}, "?"}, {Point{0.3, 20.3}, "?"}};

    for (int run = 0; run < 2; ++run) {
        MulticlassPerceptron<std::string> slp({}, std::make_shared<RandomGenerator>(7));
        auto results = slp.classify(train, test);

        EXPECT_TRUE(slp.lastTrainingStatistics().converged);
        EXPECT_EQ(slp.lastTrainingStatistics().misclassified, 0u);
        ASSERT_EQ(results.size(), 3u);
        EXPECT_EQ(results[0].predicted_label, "A");
        EXPECT_EQ(results[1].predicted_label, "B");
        EXPECT_EQ(results[2].predicted_label, "C");
    }
}

TEST(MulticlassPerceptronTest, LabelsKeepFirstAppearanceOrder) {
    Dataset train;
    addCluster(train, 0.0, 20.0, "C");
    addCluster(train, 0.0, 0.0, "A");
    addCluster(train, 20.0, 0.0, "B");

    MulticlassPerceptron<std::string> slp({}, std::make_shared<RandomGenerator>(11));
    slp.fit(train);
    EXPECT_EQ(slp.getLabels(), (std::vector<std::string>{"C", "A", "B"}));
    EXPECT_EQ(slp.getWeights().size(), 3u);
}

TEST(MulticlassPerceptronTest, SameSeedGivesSameWeights) {
    Dataset train;
    addCluster(train, 0.0, 0.0, "A");
    addCluster(train, 3.0, 0.0, "B");
    addCluster(train, 0.0, 3.0, "C");

    MulticlassPerceptron<std::string> first({}, std::make_shared<RandomGenerator>(99));
    MulticlassPerceptron<std::string> second({}, std::make_shared<RandomGenerator>(99));
    first.fit(train);
    second.fit(train);
    EXPECT_EQ(first.getWeights(), second.getWeights());
}

TEST(MulticlassPerceptronTest, NoTrainingDataGivesDefaultLabel) {
    Dataset test{{Point{1.0, 1.0}, "?"}};

    MulticlassPerceptron<std::string> slp({}, std::make_shared<RandomGenerator>(1));
    auto results = slp.classify({}, test);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].predicted_label, "");
}

TEST(MulticlassPerceptronTest, SingleClassStopsAfterOnePass) {
    Dataset train{{Point{0.0}, "only"}, {Point{1.0}, "only"}};

    MulticlassPerceptron<std::string> slp({}, std::make_shared<RandomGenerator>(1));
    slp.fit(train);
    EXPECT_EQ(slp.lastTrainingStatistics().passes, 1u);
    EXPECT_EQ(slp.predict(Point{5.0}), "only");
}
