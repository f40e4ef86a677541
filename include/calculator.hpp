#pragma once

#include "decimal_engine.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace fixdec {

// ============================================================================
// Line calculator
// ============================================================================
//
// Evaluates scripts of `op,a[,b]` lines with one engine. Operands are decimal
// text except the second operand of pow, shl, shr and round, which is an
// integer (exponent, bit distance or precision).

struct CalculatorSummary {
    std::size_t evaluated{0};
    std::size_t failed{0};
};

/// Split a line on commas; an empty trailing field is dropped
std::vector<std::string> split_fields(const std::string& line);

/// Parse a plain integer operand
/// @throws ParseError if the text is not an int
int parse_int_operand(const std::string& text);

/// Evaluate one split line and format the result
/// @throws InvalidArgumentError for an unknown op or a wrong operand count
/// @throws ParseError, OverflowError and the other engine errors from the op
std::string evaluate(const DecimalEngine& engine, const std::vector<std::string>& fields);

/// Evaluate every line of input. Blank lines and lines starting with '#' are
/// skipped; each result is written to out as "op(a, b) = result" and each
/// failure to err.
CalculatorSummary run_calculator(const DecimalEngine& engine, std::istream& input,
                                 std::ostream& out, std::ostream& err);

} // namespace fixdec
