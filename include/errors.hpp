#pragma once

#include <stdexcept>
#include <string>

namespace fixdec {

/// Checked arithmetic produced a result outside the int64_t range.
class OverflowError : public std::overflow_error {
public:
    explicit OverflowError(const std::string& what) : std::overflow_error(what) {}
};

/// A division (or inversion) by zero was requested.
class DivisionByZeroError : public std::domain_error {
public:
    explicit DivisionByZeroError(const std::string& what) : std::domain_error(what) {}
};

/// Rounding mode UNNECESSARY was in effect but digits had to be discarded.
class RoundingRequiredError : public std::domain_error {
public:
    explicit RoundingRequiredError(const std::string& what) : std::domain_error(what) {}
};

/// An operand outside the domain of an operation (negative square root,
/// NaN, unsupported scale, ...).
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

/// Malformed decimal text or mode name.
class ParseError : public InvalidArgumentError {
public:
    explicit ParseError(const std::string& what) : InvalidArgumentError(what) {}
};

} // namespace fixdec
