// src/core/labeled_point.hpp

#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "point.hpp"

// Converts the trailing token of a dataset line into a label.
// Specialise for label types that cannot be read with operator>>.
template <typename Label>
struct LabelTraits {
    static Label parse(const std::string& token) {
        // operator>> wraps "-1" around for unsigned types
        if constexpr (std::is_unsigned_v<Label>) {
            if (!token.empty() && token.front() == '-') {
                throw ParseError("invalid label '" + token + "'");
            }
        }
        std::istringstream is(token);
        Label label{};
        is >> label;
        if (is.fail() || is.peek() != std::char_traits<char>::eof()) {
            throw ParseError("invalid label '" + token + "'");
        }
        return label;
    }
};

template <>
struct LabelTraits<std::string> {
    static std::string parse(const std::string& token) {
        return token;
    }
};

template <typename Label>
struct LabeledPoint {
    Point point;
    Label label{};

    LabeledPoint() = default;
    LabeledPoint(Point p, Label l) : point(std::move(p)), label(std::move(l)) {}

    // Whitespace separated tokens; the last one is the label, the rest
    // are scalar components. Throws ParseError.
    static LabeledPoint parse(const std::string& line) {
        std::istringstream is(line);
        std::vector<std::string> tokens;
        std::string token;
        while (is >> token) {
            tokens.push_back(token);
        }
        if (tokens.empty()) {
            throw ParseError("cannot parse empty line of data");
        }

        Label label = LabelTraits<Label>::parse(tokens.back());
        std::vector<Complex> components;
        components.reserve(tokens.size() - 1);
        for (size_t i = 0; i + 1 < tokens.size(); ++i) {
            components.push_back(Complex::parse(tokens[i]));
        }
        return LabeledPoint(Point(std::move(components)), std::move(label));
    }

    bool operator==(const LabeledPoint& other) const {
        return point == other.point && label == other.label;
    }
};

template <typename Label>
std::ostream& operator<<(std::ostream& os, const LabeledPoint<Label>& data) {
    if (!data.point.empty()) {
        os << data.point << "   ";
    }
    return os << data.label;
}
