#pragma once

#include <cstdint>
#include <string>

namespace fixdec {

/// How the discarded digits of an inexact result are resolved
enum class RoundingMode {
    UP,          // away from zero
    DOWN,        // toward zero (truncation)
    CEILING,     // toward positive infinity
    FLOOR,       // toward negative infinity
    HALF_UP,     // nearest, ties away from zero
    HALF_DOWN,   // nearest, ties toward zero
    HALF_EVEN,   // nearest, ties to the even neighbour
    UNNECESSARY  // exact result required
};

/// Upper-case enumerator name, e.g. "HALF_EVEN"
const char* to_string(RoundingMode mode);

/// Case-insensitive inverse of to_string()
/// @throws ParseError for unknown names
RoundingMode parse_rounding_mode(const std::string& name);

/// Classification of the discarded part of a truncated result relative to
/// one unit in the last kept place.
enum class TruncatedPart {
    ZERO,
    LESS_THAN_HALF_BUT_NOT_ZERO,
    EQUAL_TO_HALF,
    GREATER_THAN_HALF
};

/// Classify abs_remainder / abs_divisor (requires abs_remainder < abs_divisor)
TruncatedPart truncated_part_of(uint64_t abs_remainder, uint64_t abs_divisor);

/// Classify discarded decimal digits from the first discarded digit and
/// whether all digits after it are zero
TruncatedPart truncated_part_of_digits(int first_digit, bool zero_after_first_digit);

/// Computes the increment (-1, 0 or 1) that turns a value truncated toward
/// zero into the value rounded with a given mode.
///
/// A strategy is a small immutable value; one exists per rounding mode and
/// it may be shared freely between threads.
class RoundingStrategy {
public:
    constexpr explicit RoundingStrategy(RoundingMode mode) : mode_(mode) {}

    constexpr RoundingMode mode() const { return mode_; }

    /// Core rule.
    /// @param sign sign of the exact (unrounded) result, -1 or 1
    /// @param truncated the truncated result, only its lowest bit is used
    /// @param part the discarded fraction
    /// @throws RoundingRequiredError for UNNECESSARY and a non-zero part
    int increment(int sign, int64_t truncated, TruncatedPart part) const;

    /// Increment for truncated = x / scale_factor, remainder = x % scale_factor
    int increment(int64_t truncated, int64_t remainder, int64_t scale_factor) const;

    /// Increment for a quotient truncated = dividend / divisor with
    /// remainder = dividend - truncated * divisor; the divisor may be negative
    int increment_for_division(int64_t truncated, int64_t remainder,
                               int64_t divisor) const;

    /// Digit-granular variant used while parsing text with more fractional
    /// digits than the scale.
    int increment_for_digits(int sign, int64_t truncated, int first_digit,
                             bool zero_after_first_digit) const;

private:
    RoundingMode mode_;
};

} // namespace fixdec
