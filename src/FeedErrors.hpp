#pragma once
#include <stdexcept>
#include <string>

// Rejected submission: empty author, oversize field. Reported to the submitter only.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

// The store reached its configured post limit.
class StoreFullError : public std::runtime_error {
public:
    explicit StoreFullError(const std::string& message) : std::runtime_error(message) {}
};

// A core guarantee was broken (e.g. a snapshot went backward). Always a bug.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message) : std::logic_error(message) {}
};
