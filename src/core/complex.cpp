// src/core/complex.cpp

#include "complex.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ostream>
#include <sstream>

#include "errors.hpp"

namespace {

double parseReal(const std::string& text, const std::string& original) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
        throw ParseError("invalid scalar '" + original + "'");
    }
    // decimal literals only, strtod would also take hex floats
    size_t digits = (text[0] == '+' || text[0] == '-') ? 1 : 0;
    if (text.size() > digits + 1 && text[digits] == '0' && (text[digits + 1] == 'x' || text[digits + 1] == 'X')) {
        throw ParseError("invalid scalar '" + original + "'");
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        throw ParseError("invalid scalar '" + original + "'");
    }
    return value;
}

} // namespace

Complex Complex::fromPolar(double r, double theta) {
    return Complex(r * std::cos(theta), r * std::sin(theta));
}

Complex Complex::parse(const std::string& text) {
    size_t plus = text.find('+');
    if (plus == std::string::npos) {
        return Complex(parseReal(text, text), 0.0);
    }

    std::string real_part = text.substr(0, plus);
    std::string imag_part = text.substr(plus + 1);
    // everything from the first 'i' on is the imaginary unit
    size_t unit = imag_part.find('i');
    if (unit != std::string::npos) {
        imag_part.erase(unit);
    }
    return Complex(parseReal(real_part, text), parseReal(imag_part, text));
}

double Complex::magnitude() const {
    if (im == 0.0) {
        return re;
    }
    return std::hypot(re, im);
}

double Complex::angle() const {
    return std::atan2(im, re);
}

Complex Complex::conjugate() const {
    return Complex(re, -im);
}

Complex Complex::scale(double factor) const {
    return Complex(re * factor, im * factor);
}

Complex Complex::operator-() const {
    return scale(-1.0);
}

Complex& Complex::operator+=(const Complex& rhs) {
    re += rhs.re;
    im += rhs.im;
    return *this;
}

Complex& Complex::operator-=(const Complex& rhs) {
    re -= rhs.re;
    im -= rhs.im;
    return *this;
}

Complex& Complex::operator*=(const Complex& rhs) {
    double real = re * rhs.re - im * rhs.im;
    double imag = re * rhs.im + im * rhs.re;
    re = real;
    im = imag;
    return *this;
}

Complex& Complex::operator/=(const Complex& rhs) {
    Complex rhs_conj = rhs.conjugate();
    // z * conj(z) is real
    double denom = (rhs * rhs_conj).re;
    *this = (*this * rhs_conj).scale(1.0 / denom);
    return *this;
}

std::string Complex::toString() const {
    std::ostringstream os;
    os << *this;
    return os.str();
}

Complex operator+(Complex lhs, const Complex& rhs) {
    lhs += rhs;
    return lhs;
}

Complex operator-(Complex lhs, const Complex& rhs) {
    lhs -= rhs;
    return lhs;
}

Complex operator*(Complex lhs, const Complex& rhs) {
    lhs *= rhs;
    return lhs;
}

Complex operator/(Complex lhs, const Complex& rhs) {
    lhs /= rhs;
    return lhs;
}

std::ostream& operator<<(std::ostream& os, const Complex& value) {
    if (value.im == 0.0) {
        return os << value.re;
    }
    return os << value.re << '+' << value.im << 'i';
}
