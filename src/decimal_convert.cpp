#include "decimal_engine.hpp"
#include "errors.hpp"
#include "int128.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace fixdec {

using boost::multiprecision::cpp_int;
using detail::Int128;

namespace {

const cpp_int TWO_POW_64 = cpp_int(1) << 64;

// ============================================================================
// Text helpers
// ============================================================================

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

ParseError parse_error(const std::string& text, const std::string& reason) {
    return ParseError("Cannot parse '" + text + "': " + reason);
}

} // namespace

// ============================================================================
// Integer conversions
// ============================================================================

int64_t DecimalEngine::from_long(int64_t value) const {
    if (overflow_.checked() && !metrics_->is_valid_integer_value(value)) {
        overflow_.fail("from_long(" + std::to_string(value) + ")");
    }
    return metrics_->multiply_by_scale_factor(value);
}

int64_t DecimalEngine::to_long(int64_t u) const {
    const int64_t truncated = metrics_->divide_by_scale_factor(u);
    const int64_t remainder = metrics_->modulo_by_scale_factor(u);
    return truncated + rounding_.increment(truncated, remainder, one());
}

int64_t DecimalEngine::from_unscaled(int64_t unscaled, int source_scale) const {
    const int64_t diff = static_cast<int64_t>(scale()) - source_scale;
    if (diff == 0) {
        return unscaled;
    }
    return diff > 0 ? scale_up(unscaled, diff) : scale_down(unscaled, -diff);
}

// ============================================================================
// Arbitrary precision conversions
// ============================================================================

int64_t DecimalEngine::from_big_integer(const cpp_int& value) const {
    return narrow(value * one(), "from_big_integer");
}

int64_t DecimalEngine::from_big_decimal(const BigDecimal& value) const {
    return narrow(value.with_scale(scale(), rounding_).unscaled_value(), "from_big_decimal");
}

BigDecimal DecimalEngine::to_big_decimal(int64_t u) const {
    return BigDecimal(scale(), cpp_int(u));
}

BigDecimal DecimalEngine::to_big_decimal(int64_t u, int target_scale) const {
    return to_big_decimal(u).with_scale(target_scale, rounding_);
}

int64_t DecimalEngine::narrow(const cpp_int& value, const char* operation) const {
    if (value >= INT64_MIN && value <= INT64_MAX) {
        return value.convert_to<int64_t>();
    }
    if (overflow_.checked()) {
        overflow_.fail(std::string(operation) + " = " + value.str());
    }
    // Two's complement low 64 bits
    cpp_int low = value % TWO_POW_64;
    if (low < 0) {
        low += TWO_POW_64;
    }
    return static_cast<int64_t>(low.convert_to<uint64_t>());
}

// ============================================================================
// Floating point conversions
// ============================================================================

// |value| = mantissa * 2^shift exactly, with mantissa < 2^53. The scaled
// magnitude mantissa * 10^scale * 2^shift is computed in 128 bits and
// rounded once.
int64_t DecimalEngine::from_double(double value) const {
    if (!std::isfinite(value)) {
        throw InvalidArgumentError("Cannot convert " + std::to_string(value) + " [" +
                                   describe() + "]");
    }
    if (value == 0.0) {
        return 0;
    }

    int exponent = 0;
    const double fraction = std::frexp(std::fabs(value), &exponent);
    const int64_t mantissa = static_cast<int64_t>(std::ldexp(fraction, 53));
    const int shift = exponent - 53;
    const int sign = value < 0 ? -1 : 1;
    // < 2^53 * 10^18 < 2^113
    const Int128 scaled = detail::multiply_64x64_to_128(mantissa, one());

    if (shift >= 0) {
        const uint64_t limit = sign < 0 ? static_cast<uint64_t>(1) << 63
                                        : static_cast<uint64_t>(INT64_MAX);
        const bool fits = shift < 64 &&
                          detail::compare_128(scaled, Int128(0, limit >> shift)) <= 0;
        if (!fits && overflow_.checked()) {
            overflow_.fail("from_double(" + std::to_string(value) + ")");
        }
        // A shift of 64 or more leaves nothing in the low 64 bits
        const int64_t low =
            shift >= 64 ? 0 : detail::low_int64(detail::shift_left_128(scaled, shift));
        return sign < 0 ? wrapping_negate(low) : low;
    }

    const int right = -shift;
    Int128 truncated;
    TruncatedPart part = TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO;
    if (right < 128) {
        truncated = detail::shift_right_128(scaled, right);
        const Int128 rest =
            detail::subtract_128(scaled, detail::shift_left_128(truncated, right));
        const Int128 half = detail::shift_left_128(Int128(0, 1), right - 1);
        const int cmp = detail::compare_128(rest, half);
        if (detail::signum(rest) == 0) {
            part = TruncatedPart::ZERO;
        } else if (cmp == 0) {
            part = TruncatedPart::EQUAL_TO_HALF;
        } else if (cmp > 0) {
            part = TruncatedPart::GREATER_THAN_HALF;
        }
    }

    const int inc = rounding_.increment(sign, detail::low_int64(truncated), part);
    const Int128 signed_truncated = sign < 0 ? detail::negate_128(truncated) : truncated;
    return overflow_.narrow(detail::add_128(signed_truncated, detail::from_int64(inc)),
                            "from_double");
}

double DecimalEngine::to_double(int64_t u) const {
    return std::strtod(to_string(u).c_str(), nullptr);
}

float DecimalEngine::to_float(int64_t u) const {
    return std::strtof(to_string(u).c_str(), nullptr);
}

// ============================================================================
// Text
// ============================================================================

int64_t DecimalEngine::parse(const std::string& text) const {
    const std::size_t length = text.size();
    std::size_t pos = 0;
    bool negative = false;
    if (pos < length && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    // Integer digits, bounded by the int64_t range
    const uint64_t limit = negative ? static_cast<uint64_t>(1) << 63
                                    : static_cast<uint64_t>(INT64_MAX);
    uint64_t integer_magnitude = 0;
    bool has_digits = false;
    for (; pos < length && is_digit(text[pos]); ++pos) {
        const uint64_t digit = static_cast<uint64_t>(text[pos] - '0');
        if (integer_magnitude > (limit - digit) / 10) {
            throw parse_error(text, "integer part out of range");
        }
        integer_magnitude = integer_magnitude * 10 + digit;
        has_digits = true;
    }

    // Fraction digits: keep scale() of them, remember the first dropped digit
    // and whether anything non-zero follows it
    int64_t fraction = 0;
    int fraction_digits = 0;
    bool dropped_any = false;
    int first_dropped = 0;
    bool zero_after_first = true;
    if (pos < length && text[pos] == '.') {
        ++pos;
        for (; pos < length && is_digit(text[pos]); ++pos) {
            const int digit = text[pos] - '0';
            if (fraction_digits < scale()) {
                fraction = fraction * 10 + digit;
                ++fraction_digits;
            } else if (!dropped_any) {
                first_dropped = digit;
                dropped_any = true;
            } else if (digit != 0) {
                zero_after_first = false;
            }
            has_digits = true;
        }
    }
    if (!has_digits) {
        throw parse_error(text, "no digits");
    }
    if (pos != length) {
        throw parse_error(text, std::string("unexpected character '") + text[pos] + "'");
    }
    for (; fraction_digits < scale(); ++fraction_digits) {
        fraction *= 10;
    }

    // Exact truncated value: +-(integer * 10^scale + fraction)
    const int64_t integer_part =
        static_cast<int64_t>(negative ? 0 - integer_magnitude : integer_magnitude);
    const Int128 truncated =
        detail::add_128(detail::multiply_64x64_to_128(integer_part, one()),
                        detail::from_int64(negative ? -fraction : fraction));
    int inc = 0;
    if (dropped_any) {
        inc = rounding_.increment_for_digits(negative ? -1 : 1, detail::low_int64(truncated),
                                             first_dropped, zero_after_first);
    }
    const Int128 rounded = detail::add_128(truncated, detail::from_int64(inc));
    if (overflow_.checked() && !detail::fits_in_int64(rounded)) {
        overflow_.fail("parse(\"" + text + "\")");
    }
    return detail::low_int64(rounded);
}

std::string DecimalEngine::to_string(int64_t u) const {
    const uint64_t magnitude = detail::unsigned_abs(u);
    const uint64_t factor = static_cast<uint64_t>(one());
    std::string text = u < 0 ? "-" : "";
    text += std::to_string(magnitude / factor);
    if (scale() > 0) {
        const std::string digits = std::to_string(magnitude % factor);
        text += '.';
        text.append(static_cast<std::size_t>(scale()) - digits.size(), '0');
        text += digits;
    }
    return text;
}

} // namespace fixdec
