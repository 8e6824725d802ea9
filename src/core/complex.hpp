// src/core/complex.hpp

#pragma once

#include <iosfwd>
#include <string>

// Scalar used by every Point component. Real data simply has im == 0.
class Complex {
public:
    double re = 0.0;
    double im = 0.0;

    Complex() = default;
    Complex(double real) : re(real) {} // implicit so plain doubles can be used as components
    Complex(double real, double imag) : re(real), im(imag) {}

    // Angle is in radians.
    static Complex fromPolar(double r, double theta);

    // Accepts "re" or "re+imi". Throws ParseError.
    static Complex parse(const std::string& text);

    // Returns re unchanged for real values, so a negative real keeps its sign.
    double magnitude() const;
    double angle() const;
    Complex conjugate() const;
    Complex scale(double factor) const;

    Complex operator-() const;
    Complex& operator+=(const Complex& rhs);
    Complex& operator-=(const Complex& rhs);
    Complex& operator*=(const Complex& rhs);
    Complex& operator/=(const Complex& rhs);

    bool operator==(const Complex& other) const {
        return re == other.re && im == other.im;
    }
    bool operator!=(const Complex& other) const {
        return !(*this == other);
    }

    std::string toString() const;
};

Complex operator+(Complex lhs, const Complex& rhs);
Complex operator-(Complex lhs, const Complex& rhs);
Complex operator*(Complex lhs, const Complex& rhs);
Complex operator/(Complex lhs, const Complex& rhs);

std::ostream& operator<<(std::ostream& os, const Complex& value);
