#include "big_decimal.hpp"
#include "errors.hpp"

#include <utility>

namespace fixdec {

using boost::multiprecision::cpp_int;

namespace {

cpp_int power_of_ten(int64_t exponent) {
    return boost::multiprecision::pow(cpp_int(10), static_cast<unsigned>(exponent));
}

} // namespace

BigDecimal::BigDecimal() : scale_(0), unscaled_value_(0) {}

BigDecimal::BigDecimal(int32_t scale, cpp_int unscaled_value)
    : scale_(scale), unscaled_value_(std::move(unscaled_value)) {}

BigDecimal::BigDecimal(const std::string& text) : scale_(0), unscaled_value_(0) {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    // Digits are accumulated by hand: cpp_int's string constructor reads a
    // leading zero as an octal prefix
    bool seen_digit = false;
    bool seen_point = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c >= '0' && c <= '9') {
            unscaled_value_ = unscaled_value_ * 10 + (c - '0');
            seen_digit = true;
            if (seen_point) {
                ++scale_;
            }
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            throw ParseError("Invalid decimal text: '" + text + "'");
        }
    }
    if (!seen_digit) {
        throw ParseError("Invalid decimal text: '" + text + "'");
    }
    if (negative) {
        unscaled_value_ = -unscaled_value_;
    }
}

BigDecimal BigDecimal::with_scale(int32_t new_scale, const RoundingStrategy& rounding) const {
    if (new_scale >= scale_) {
        return BigDecimal(new_scale, unscaled_value_ *
                                         power_of_ten(static_cast<int64_t>(new_scale) - scale_));
    }

    const cpp_int divisor = power_of_ten(static_cast<int64_t>(scale_) - new_scale);
    const cpp_int truncated = unscaled_value_ / divisor;
    const cpp_int remainder = unscaled_value_ % divisor;
    if (remainder == 0) {
        return BigDecimal(new_scale, truncated);
    }

    const cpp_int twice_remainder = 2 * boost::multiprecision::abs(remainder);
    TruncatedPart part = TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO;
    if (twice_remainder == divisor) {
        part = TruncatedPart::EQUAL_TO_HALF;
    } else if (twice_remainder > divisor) {
        part = TruncatedPart::GREATER_THAN_HALF;
    }
    const int sign = unscaled_value_ < 0 ? -1 : 1;
    const int64_t low_bit = boost::multiprecision::abs(truncated) % 2 == 0 ? 0 : 1;
    return BigDecimal(new_scale, truncated + rounding.increment(sign, low_bit, part));
}

std::string BigDecimal::to_string() const {
    std::string digits = cpp_int(boost::multiprecision::abs(unscaled_value_)).str();
    const bool negative = unscaled_value_ < 0;

    if (scale_ <= 0) {
        if (unscaled_value_ != 0) {
            digits.append(static_cast<std::size_t>(-static_cast<int64_t>(scale_)), '0');
        }
    } else {
        const std::size_t fraction_digits = static_cast<std::size_t>(scale_);
        if (digits.size() <= fraction_digits) {
            digits.insert(0, fraction_digits + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - fraction_digits, 1, '.');
    }
    return negative ? "-" + digits : digits;
}

bool BigDecimal::operator==(const BigDecimal& other) const {
    return scale_ == other.scale_ && unscaled_value_ == other.unscaled_value_;
}

} // namespace fixdec
