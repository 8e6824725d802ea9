// src/core/point.hpp

#pragma once
#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <vector>

#include "complex.hpp"

// Variable-length vector of Complex components.
//
// Binary operations never require matching dimensions: the shorter operand
// behaves as if it were zero-padded, so add/subtract return max(dim) components.
// dot() only visits the overlapping prefix.
class Point {
private:
    std::vector<Complex> data;

public:
    Point() = default;
    explicit Point(size_t size);
    Point(std::vector<Complex> values);
    Point(std::initializer_list<double> values);

    Complex& operator[](size_t index);
    const Complex& operator[](size_t index) const;
    size_t size() const;
    bool empty() const { return data.empty(); }

    Point add(const Point& other) const;
    Point subtract(const Point& other) const;
    Point scale(double factor) const;
    Point negate() const;
    Point conjugate() const;
    Complex dot(const Point& other) const;
    double magnitude() const;

    void addInPlace(const Point& other);
    void subtractInPlace(const Point& other);
    void prepend(const Complex& value);

    static Point sum(const std::vector<Point>& points);
    // Mean of the points; the empty point when there are none.
    static Point centroid(const std::vector<Point>& points);

    bool operator==(const Point& other) const {
        return data == other.data;
    }
    bool operator!=(const Point& other) const {
        return !(*this == other);
    }

    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
    const std::vector<Complex>& components() const { return data; }
};

// Components separated by three spaces.
std::ostream& operator<<(std::ostream& os, const Point& point);
