#pragma once

#include "rounding.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

namespace fixdec {

/// Arbitrary-precision decimal: unscaled_value * 10^-scale.
///
/// Boundary type for conversions into and out of the engine. Nothing here is
/// performance critical; operations allocate freely.
class BigDecimal {
public:
    BigDecimal();
    BigDecimal(int32_t scale, boost::multiprecision::cpp_int unscaled_value);

    /// Parse plain decimal notation: [+-]digits[.digits] (".5" and "5." allowed)
    /// @throws ParseError on malformed text
    explicit BigDecimal(const std::string& text);

    int32_t scale() const { return scale_; }
    const boost::multiprecision::cpp_int& unscaled_value() const { return unscaled_value_; }

    /// The same value with new_scale fractional digits, rounded if digits
    /// are discarded.
    /// @throws RoundingRequiredError for UNNECESSARY when digits are lost
    BigDecimal with_scale(int32_t new_scale, const RoundingStrategy& rounding) const;

    /// Plain notation with exactly scale() fractional digits (no exponent);
    /// a negative scale renders the trailing zeros
    std::string to_string() const;

    /// Same scale and unscaled value (1.0 and 1.00 differ)
    bool operator==(const BigDecimal& other) const;
    bool operator!=(const BigDecimal& other) const { return !(*this == other); }

private:
    int32_t scale_;
    boost::multiprecision::cpp_int unscaled_value_;
};

} // namespace fixdec
