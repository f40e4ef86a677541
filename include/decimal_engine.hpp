#pragma once

#include "big_decimal.hpp"
#include "overflow.hpp"
#include "rounding.hpp"
#include "scale_metrics.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

namespace fixdec {

/// Engine configuration: the (scale, rounding, overflow) triple
struct EngineConfig {
    int scale{2};
    RoundingMode rounding{RoundingMode::HALF_UP};
    OverflowMode overflow{OverflowMode::UNCHECKED};
};

/// Fixed-point decimal arithmetic on unscaled 64-bit values.
///
/// An unscaled value u at scale f represents the decimal u * 10^-f. All
/// operations take and return unscaled values of the engine's scale unless
/// a parameter is documented as a plain integer ("long"). Results are exact
/// where possible and otherwise rounded once with the engine's rounding
/// mode; results outside the int64_t range wrap (UNCHECKED) or throw
/// OverflowError (CHECKED).
///
/// Engines are immutable and stateless, so a single instance may be shared
/// by any number of threads. They are cheap to construct; callers that need
/// many configurations may cache them by EngineConfig.
///
/// Every operation may throw:
///   - OverflowError in CHECKED mode when the exact result does not fit
///   - RoundingRequiredError in UNNECESSARY mode when digits are discarded
///   - DivisionByZeroError for any division by zero
class DecimalEngine {
public:
    /// @throws InvalidArgumentError if scale is not in [0, 18]
    DecimalEngine(int scale, RoundingMode rounding, OverflowMode overflow);
    explicit DecimalEngine(const EngineConfig& config);

    int scale() const { return metrics_->scale(); }
    const ScaleMetrics& scale_metrics() const { return *metrics_; }
    RoundingMode rounding_mode() const { return rounding_.mode(); }
    OverflowMode overflow_mode() const { return overflow_.mode(); }
    EngineConfig config() const;

    /// "scale=4 rounding=HALF_UP overflow=CHECKED"
    std::string describe() const;

    /// Unscaled representation of 1, i.e. 10^scale
    int64_t one() const { return metrics_->scale_factor(); }

    // ------------------------------------------------------------------------
    // Comparison
    // ------------------------------------------------------------------------

    int signum(int64_t u) const;
    int compare(int64_t a, int64_t b) const;
    int64_t min(int64_t a, int64_t b) const;
    int64_t max(int64_t a, int64_t b) const;

    // ------------------------------------------------------------------------
    // Arithmetic
    // ------------------------------------------------------------------------

    int64_t add(int64_t a, int64_t b) const;
    int64_t subtract(int64_t minuend, int64_t subtrahend) const;

    /// a * b, rounded to the engine scale
    int64_t multiply(int64_t a, int64_t b) const;

    /// u * value where value is a plain integer; never rounds
    int64_t multiply_by_long(int64_t u, int64_t value) const;

    /// u * 10^n; a negative n divides with rounding
    int64_t multiply_by_power_of_10(int64_t u, int n) const;

    /// dividend / divisor, rounded to the engine scale
    int64_t divide(int64_t dividend, int64_t divisor) const;

    /// u / divisor where divisor is a plain integer
    int64_t divide_by_long(int64_t u, int64_t divisor) const;

    /// u / 10^n; a negative n multiplies
    int64_t divide_by_power_of_10(int64_t u, int n) const;

    /// (a + b) / 2 without intermediate overflow
    int64_t average(int64_t a, int64_t b) const;

    int64_t absolute(int64_t u) const;
    int64_t negate(int64_t u) const;

    /// 1 / u
    int64_t invert(int64_t u) const;

    int64_t square(int64_t u) const;

    /// @throws InvalidArgumentError if u is negative
    int64_t square_root(int64_t u) const;

    /// u^exponent by binary exponentiation. Every intermediate
    /// multiplication is rounded, so results for inexact powers may differ
    /// from the correctly rounded value in the last digit. A negative
    /// exponent inverts the positive power.
    int64_t power(int64_t u, int exponent) const;

    /// u * 2^n; a negative n shifts right
    int64_t shift_left(int64_t u, int n) const;

    /// u / 2^n rounded with the engine mode; a negative n shifts left
    int64_t shift_right(int64_t u, int n) const;

    /// u rounded to precision fractional digits, keeping the engine scale.
    /// precision may be negative to round to tens, hundreds, ...
    /// @throws InvalidArgumentError if scale - precision > 18
    int64_t round(int64_t u, int precision) const;

    // ------------------------------------------------------------------------
    // Conversion
    // ------------------------------------------------------------------------

    int64_t from_long(int64_t value) const;

    /// Exact binary value of the double, rounded once.
    /// @throws InvalidArgumentError for NaN and infinities
    int64_t from_double(double value) const;

    int64_t from_big_integer(const boost::multiprecision::cpp_int& value) const;
    int64_t from_big_decimal(const BigDecimal& value) const;

    /// Rescale an unscaled value of another scale to this engine's scale
    int64_t from_unscaled(int64_t unscaled, int source_scale) const;

    /// Parse [+-][digits][.digits] with at least one digit. Digits beyond
    /// the scale are rounded away.
    /// @throws ParseError on malformed text or an integer part outside int64_t
    int64_t parse(const std::string& text) const;

    /// Integer part, rounded with the engine mode
    int64_t to_long(int64_t u) const;

    float to_float(int64_t u) const;
    double to_double(int64_t u) const;
    BigDecimal to_big_decimal(int64_t u) const;
    BigDecimal to_big_decimal(int64_t u, int target_scale) const;

    /// Canonical text with exactly scale() fractional digits, e.g. "-0.2500"
    std::string to_string(int64_t u) const;

private:
    int64_t multiply_unchecked(int64_t a, int64_t b) const;
    int64_t multiply_exact(int64_t a, int64_t b, const char* operation) const;
    int64_t square_unchecked(int64_t u) const;
    int64_t divide_general(int64_t dividend, int64_t divisor) const;
    int64_t divide_by_power_of_10_divisor(int64_t dividend, int64_t divisor,
                                          const ScaleMetrics& pow10) const;
    int64_t scale_down(int64_t u, int64_t n) const;
    int64_t scale_up(int64_t u, int64_t n) const;
    int64_t shift_left_by(int64_t u, int64_t n) const;
    int64_t shift_right_by(int64_t u, int64_t n) const;
    int64_t narrow(const boost::multiprecision::cpp_int& value, const char* operation) const;

    const ScaleMetrics* metrics_;
    RoundingStrategy rounding_;
    OverflowPolicy overflow_;
};

} // namespace fixdec
