// src/utils/dataset_io.hpp

#pragma once

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/classification.hpp"
#include "../core/errors.hpp"
#include "../core/labeled_point.hpp"

namespace dataset_io {

using json = nlohmann::json;

// Whole file as a string. Throws std::runtime_error if it cannot be read.
std::string readFile(const std::string& filename);

// Splits on '\n' and drops a trailing '\r' from each line. A final newline
// does not produce an empty last line.
std::vector<std::string> splitLines(const std::string& text);

// One labeled point per line; stops at the first bad line with a ParseError
// naming `source` and the 1-based line number.
template <typename Label>
std::vector<LabeledPoint<Label>> parseDataset(const std::string& text, const std::string& source = "<input>") {
    std::vector<std::string> lines = splitLines(text);
    std::vector<LabeledPoint<Label>> dataset;
    dataset.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        try {
            dataset.push_back(LabeledPoint<Label>::parse(lines[i]));
        } catch (const ParseError& e) {
            throw ParseError(source + ":" + std::to_string(i + 1) + ": " + e.what());
        }
    }
    return dataset;
}

template <typename Label>
std::vector<LabeledPoint<Label>> loadDataset(const std::string& filename) {
    return parseDataset<Label>(readFile(filename), filename);
}

// One "<components>   <label>" line per result.
template <typename Label>
std::string formatResults(const std::vector<Classification<Label>>& results) {
    std::ostringstream os;
    for (const auto& r : results) {
        os << r << '\n';
    }
    return os.str();
}

// [{"point": ["1", "0.5+2i"], "label": ...}, ...]
template <typename Label>
json resultsToJson(const std::vector<Classification<Label>>& results) {
    json out = json::array();
    for (const auto& r : results) {
        json item;
        item["point"] = json::array();
        if (r.data) {
            for (const auto& x : r.data->point) {
                item["point"].push_back(x.toString());
            }
        }
        item["label"] = r.predicted_label;
        out.push_back(item);
    }
    return out;
}

} // namespace dataset_io
