#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/classify/k_nearest_neighbor.hpp"
#include "../src/utils/dataset_io.hpp"

TEST(DatasetIoTest, SplitLines) {
    EXPECT_EQ(dataset_io::splitLines("a\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(dataset_io::splitLines("a\r\nb"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(dataset_io::splitLines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_TRUE(dataset_io::splitLines("").empty());
}

TEST(DatasetIoTest, ParsesEveryLine) {
    auto data = dataset_io::parseDataset<std::string>("1 2 red\n0.5+1i 3 blue\n");
    ASSERT_EQ(data.size(), 2u);
    EXPECT_EQ(data[0].point, (Point{1.0, 2.0}));
    EXPECT_EQ(data[0].label, "red");
    EXPECT_EQ(data[1].point[0], Complex(0.5, 1.0));
    EXPECT_EQ(data[1].label, "blue");
}

TEST(DatasetIoTest, FirstBadLineAbortsWithLocation) {
    try {
        dataset_io::parseDataset<std::string>("1 2 red\n1 y blue\n3 4 green\n", "train.txt");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("train.txt:2"), std::string::npos);
    }

    EXPECT_THROW(dataset_io::parseDataset<std::string>("1 2 red\n\n3 4 green\n"), ParseError);
    EXPECT_THROW(dataset_io::parseDataset<int>("1 2 red\n"), ParseError);
}

TEST(DatasetIoTest, FormatsResults) {
    auto train = dataset_io::parseDataset<std::string>("0 0 A\n10 10 B\n");
    auto test = dataset_io::parseDataset<std::string>("1 1 ?\n9 9.5 ?\n");

    KNearestNeighbor<std::string> knn(1);
    auto results = knn.classify(train, test);

    EXPECT_EQ(dataset_io::formatResults(results), "1   1   A\n9   9.5   B\n");

    nlohmann::json j = dataset_io::resultsToJson(results);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["label"].get<std::string>(), "A");
    EXPECT_EQ(j[1]["point"], nlohmann::json::array({"9", "9.5"}));
}

TEST(DatasetIoTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "point_classifier_dataset_test.txt";
    {
        std::ofstream out(path);
        out << "0 0 A\n10 10 B\n";
    }

    auto data = dataset_io::loadDataset<std::string>(path.string());
    ASSERT_EQ(data.size(), 2u);
    EXPECT_EQ(data[1].label, "B");

    std::filesystem::remove(path);
    EXPECT_THROW(dataset_io::loadDataset<std::string>(path.string()), std::runtime_error);
}
