// src/core/point.cpp

#include "point.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <stdexcept>
#include <utility>

Point::Point(size_t size) : data(size) {}

Point::Point(std::vector<Complex> values) : data(std::move(values)) {}

Point::Point(std::initializer_list<double> values) : data(values.begin(), values.end()) {}

Complex& Point::operator[](size_t index) {
    if (index >= data.size()) {
        throw std::out_of_range("Index out of range");
    }
    return data[index];
}

const Complex& Point::operator[](size_t index) const {
    if (index >= data.size()) {
        throw std::out_of_range("Index out of range");
    }
    return data[index];
}

size_t Point::size() const {
    return data.size();
}

Point Point::add(const Point& other) const {
    Point result(*this);
    result.addInPlace(other);
    return result;
}

Point Point::subtract(const Point& other) const {
    Point result(*this);
    result.subtractInPlace(other);
    return result;
}

Point Point::scale(double factor) const {
    Point result(*this);
    for (auto& x : result.data) {
        x = x.scale(factor);
    }
    return result;
}

Point Point::negate() const {
    return scale(-1.0);
}

Point Point::conjugate() const {
    Point result(*this);
    for (auto& x : result.data) {
        x = x.conjugate();
    }
    return result;
}

Complex Point::dot(const Point& other) const {
    Complex result;
    size_t overlap = std::min(data.size(), other.data.size());
    for (size_t i = 0; i < overlap; ++i) {
        result += data[i] * other.data[i];
    }
    return result;
}

double Point::magnitude() const {
    Complex squares;
    for (const auto& x : data) {
        squares += x * x.conjugate();
    }
    return std::sqrt(squares.magnitude());
}

void Point::addInPlace(const Point& other) {
    size_t overlap = std::min(data.size(), other.data.size());
    for (size_t i = 0; i < overlap; ++i) {
        data[i] += other.data[i];
    }
    // dimensions missing from this point count as zero
    for (size_t i = overlap; i < other.data.size(); ++i) {
        data.push_back(other.data[i]);
    }
}

void Point::subtractInPlace(const Point& other) {
    size_t overlap = std::min(data.size(), other.data.size());
    for (size_t i = 0; i < overlap; ++i) {
        data[i] -= other.data[i];
    }
    for (size_t i = overlap; i < other.data.size(); ++i) {
        data.push_back(-other.data[i]);
    }
}

void Point::prepend(const Complex& value) {
    data.insert(data.begin(), value);
}

Point Point::sum(const std::vector<Point>& points) {
    Point result;
    for (const auto& p : points) {
        result.addInPlace(p);
    }
    return result;
}

Point Point::centroid(const std::vector<Point>& points) {
    if (points.empty()) {
        return Point();
    }
    return sum(points).scale(1.0 / static_cast<double>(points.size()));
}

std::ostream& operator<<(std::ostream& os, const Point& point) {
    bool first = true;
    for (const auto& x : point) {
        if (!first) {
            os << "   ";
        }
        os << x;
        first = false;
    }
    return os;
}
