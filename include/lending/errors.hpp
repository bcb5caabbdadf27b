#pragma once

#include <stdexcept>
#include <string>

namespace lending {

// Base for every failure raised by the matching core.
class MatchingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or self-contradictory input, rejected before enumeration.
class InvalidInput : public MatchingError {
public:
    explicit InvalidInput(const std::string& what)
        : MatchingError("invalid input: " + what) {}
};

// Best-result selection was asked to choose from nothing.
class EmptyResultSet : public MatchingError {
public:
    EmptyResultSet()
        : MatchingError("empty result set: no candidate results to select from") {}
};

// An amount or rate left the representable range; the whole batch is aborted.
class ArithmeticOverflow : public MatchingError {
public:
    explicit ArithmeticOverflow(const std::string& what)
        : MatchingError("arithmetic overflow: " + what) {}
};

} // namespace lending
