#include "rounding.hpp"
#include "errors.hpp"
#include "int128.hpp"

#include <cctype>

namespace fixdec {

namespace {

constexpr RoundingMode ALL_MODES[] = {
    RoundingMode::UP,        RoundingMode::DOWN,      RoundingMode::CEILING,
    RoundingMode::FLOOR,     RoundingMode::HALF_UP,   RoundingMode::HALF_DOWN,
    RoundingMode::HALF_EVEN, RoundingMode::UNNECESSARY,
};

std::string to_upper(const std::string& text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return upper;
}

} // namespace

const char* to_string(RoundingMode mode) {
    switch (mode) {
    case RoundingMode::UP:
        return "UP";
    case RoundingMode::DOWN:
        return "DOWN";
    case RoundingMode::CEILING:
        return "CEILING";
    case RoundingMode::FLOOR:
        return "FLOOR";
    case RoundingMode::HALF_UP:
        return "HALF_UP";
    case RoundingMode::HALF_DOWN:
        return "HALF_DOWN";
    case RoundingMode::HALF_EVEN:
        return "HALF_EVEN";
    case RoundingMode::UNNECESSARY:
        return "UNNECESSARY";
    }
    return "UNKNOWN";
}

RoundingMode parse_rounding_mode(const std::string& name) {
    const std::string upper = to_upper(name);
    for (RoundingMode mode : ALL_MODES) {
        if (upper == to_string(mode)) {
            return mode;
        }
    }
    throw ParseError("Unknown rounding mode: '" + name + "'");
}

TruncatedPart truncated_part_of(uint64_t abs_remainder, uint64_t abs_divisor) {
    if (abs_remainder == 0) {
        return TruncatedPart::ZERO;
    }
    // Compare remainder with divisor - remainder instead of 2 * remainder
    // with divisor, which could overflow
    const uint64_t rest = abs_divisor - abs_remainder;
    if (abs_remainder < rest) {
        return TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO;
    }
    return abs_remainder == rest ? TruncatedPart::EQUAL_TO_HALF
                                 : TruncatedPart::GREATER_THAN_HALF;
}

TruncatedPart truncated_part_of_digits(int first_digit, bool zero_after_first_digit) {
    if (first_digit == 0) {
        return zero_after_first_digit ? TruncatedPart::ZERO
                                      : TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO;
    }
    if (first_digit < 5) {
        return TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO;
    }
    if (first_digit == 5 && zero_after_first_digit) {
        return TruncatedPart::EQUAL_TO_HALF;
    }
    return TruncatedPart::GREATER_THAN_HALF;
}

int RoundingStrategy::increment(int sign, int64_t truncated, TruncatedPart part) const {
    if (part == TruncatedPart::ZERO) {
        return 0;
    }
    switch (mode_) {
    case RoundingMode::UP:
        return sign;
    case RoundingMode::DOWN:
        return 0;
    case RoundingMode::CEILING:
        return sign > 0 ? 1 : 0;
    case RoundingMode::FLOOR:
        return sign < 0 ? -1 : 0;
    case RoundingMode::HALF_UP:
        return part == TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO ? 0 : sign;
    case RoundingMode::HALF_DOWN:
        return part == TruncatedPart::GREATER_THAN_HALF ? sign : 0;
    case RoundingMode::HALF_EVEN:
        if (part == TruncatedPart::GREATER_THAN_HALF) {
            return sign;
        }
        if (part == TruncatedPart::EQUAL_TO_HALF) {
            return (truncated & 1) != 0 ? sign : 0;
        }
        return 0;
    case RoundingMode::UNNECESSARY:
        throw RoundingRequiredError(
            "Rounding necessary: truncated value " + std::to_string(truncated) +
            " has a non-zero discarded part and rounding mode is UNNECESSARY");
    }
    return 0;
}

int RoundingStrategy::increment(int64_t truncated, int64_t remainder,
                                int64_t scale_factor) const {
    if (remainder == 0) {
        return 0;
    }
    const int sign = remainder < 0 ? -1 : 1;
    return increment(sign, truncated,
                     truncated_part_of(detail::unsigned_abs(remainder),
                                       static_cast<uint64_t>(scale_factor)));
}

int RoundingStrategy::increment_for_division(int64_t truncated, int64_t remainder,
                                             int64_t divisor) const {
    if (remainder == 0) {
        return 0;
    }
    // The exact quotient has the sign of remainder / divisor
    const int sign = (remainder ^ divisor) < 0 ? -1 : 1;
    return increment(sign, truncated,
                     truncated_part_of(detail::unsigned_abs(remainder),
                                       detail::unsigned_abs(divisor)));
}

int RoundingStrategy::increment_for_digits(int sign, int64_t truncated, int first_digit,
                                           bool zero_after_first_digit) const {
    return increment(sign, truncated,
                     truncated_part_of_digits(first_digit, zero_after_first_digit));
}

} // namespace fixdec
