// src/core/errors.hpp

#pragma once

#include <stdexcept>
#include <string>

// Malformed input text: a bad scalar, label or dataset line.
// Callers are expected to catch this and report it.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message) : std::runtime_error(message) {}
};

// A classifier was called with inputs it cannot work with
// (not enough neighbours, a single training class, ...).
class PreconditionError : public std::logic_error {
public:
    explicit PreconditionError(const std::string& message) : std::logic_error("Precondition violated: " + message) {}
};
