#include "decimal_engine.hpp"
#include "errors.hpp"
#include "int128.hpp"
#include "special_cases.hpp"

#include <string>

namespace fixdec {

using detail::Int128;

namespace {

/// floor(sqrt(INT64_MAX)): fractional parts up to this square natively
constexpr int64_t SQRT_INT64_MAX = 3037000499LL;

/// Largest power of four representable in Int128 (2^126)
constexpr Int128 HIGHEST_SQRT_BIT(static_cast<int64_t>(1) << 62, 0);

std::string describe_config(int scale, RoundingMode rounding, OverflowMode overflow) {
    return "scale=" + std::to_string(scale) + " rounding=" + to_string(rounding) +
           " overflow=" + to_string(overflow);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

DecimalEngine::DecimalEngine(int scale, RoundingMode rounding, OverflowMode overflow)
    : metrics_(&ScaleMetrics::for_scale(scale)), rounding_(rounding),
      overflow_(overflow, describe_config(scale, rounding, overflow)) {}

DecimalEngine::DecimalEngine(const EngineConfig& config)
    : DecimalEngine(config.scale, config.rounding, config.overflow) {}

EngineConfig DecimalEngine::config() const {
    EngineConfig config;
    config.scale = scale();
    config.rounding = rounding_mode();
    config.overflow = overflow_mode();
    return config;
}

std::string DecimalEngine::describe() const {
    return describe_config(scale(), rounding_mode(), overflow_mode());
}

// ============================================================================
// Comparison
// ============================================================================

int DecimalEngine::signum(int64_t u) const {
    return u > 0 ? 1 : (u < 0 ? -1 : 0);
}

int DecimalEngine::compare(int64_t a, int64_t b) const {
    return a < b ? -1 : (a > b ? 1 : 0);
}

int64_t DecimalEngine::min(int64_t a, int64_t b) const {
    return a <= b ? a : b;
}

int64_t DecimalEngine::max(int64_t a, int64_t b) const {
    return a >= b ? a : b;
}

// ============================================================================
// Addition
// ============================================================================

int64_t DecimalEngine::add(int64_t a, int64_t b) const {
    return overflow_.add(a, b);
}

int64_t DecimalEngine::subtract(int64_t minuend, int64_t subtrahend) const {
    return overflow_.subtract(minuend, subtrahend);
}

// ============================================================================
// Multiplication
// ============================================================================

int64_t DecimalEngine::multiply(int64_t a, int64_t b) const {
    switch (classify_multiplication(one(), a, b)) {
    case SpecialMultiplication::ZERO:
        return 0;
    case SpecialMultiplication::LEFT_IS_ONE:
        return b;
    case SpecialMultiplication::RIGHT_IS_ONE:
        return a;
    case SpecialMultiplication::LEFT_IS_MINUS_ONE:
        return overflow_.negate(b);
    case SpecialMultiplication::RIGHT_IS_MINUS_ONE:
        return overflow_.negate(a);
    case SpecialMultiplication::EQUAL_OPERANDS:
        return square(a);
    case SpecialMultiplication::NONE:
        break;
    }
    return overflow_.checked() ? multiply_exact(a, b, "multiply") : multiply_unchecked(a, b);
}

// Splits both operands into integral and fractional parts. Every partial
// product carries the sign of the full product, so the sum is the product
// truncated toward zero (mod 2^64) and the remainder has the product's sign.
int64_t DecimalEngine::multiply_unchecked(int64_t a, int64_t b) const {
    const ScaleMetrics& m = *metrics_;
    const int64_t i1 = m.divide_by_scale_factor(a);
    const int64_t i2 = m.divide_by_scale_factor(b);
    const int64_t f1 = a - m.multiply_by_scale_factor(i1);
    const int64_t f2 = b - m.multiply_by_scale_factor(i2);

    const int64_t integral = m.multiply_by_scale_factor(wrapping_multiply(i1, i2));
    const int64_t cross = wrapping_add(wrapping_multiply(i1, f2), wrapping_multiply(i2, f1));

    if (m.scale() <= 9) {
        // |f1 * f2| < 10^18
        const int64_t f1xf2 = f1 * f2;
        const int64_t f1xf2d = m.divide_by_scale_factor(f1xf2);
        const int64_t f1xf2r = f1xf2 - m.multiply_by_scale_factor(f1xf2d);
        const int64_t unrounded = wrapping_add(wrapping_add(integral, cross), f1xf2d);
        return wrapping_add(unrounded, rounding_.increment(unrounded, f1xf2r, one()));
    }

    // f1 * f2 needs up to 2 * scale digits: split the fractions at 10^9
    const ScaleMetrics& scale9 = ScaleMetrics::for_scale(9);
    const ScaleMetrics& diff09 = ScaleMetrics::for_scale(m.scale() - 9);
    const ScaleMetrics& diff18 = ScaleMetrics::for_scale(18 - m.scale());
    const int64_t hf1 = scale9.divide_by_scale_factor(f1);
    const int64_t hf2 = scale9.divide_by_scale_factor(f2);
    const int64_t lf1 = f1 - scale9.multiply_by_scale_factor(hf1);
    const int64_t lf2 = f2 - scale9.multiply_by_scale_factor(hf2);

    const int64_t ll = lf1 * lf2;
    const int64_t lld = scale9.divide_by_scale_factor(ll);
    const int64_t llr = ll - scale9.multiply_by_scale_factor(lld);
    const int64_t mid = hf1 * lf2 + hf2 * lf1 + lld;
    const int64_t midd = diff09.divide_by_scale_factor(mid);
    const int64_t midr = mid - diff09.multiply_by_scale_factor(midd);
    const int64_t f1xf2 = diff18.multiply_by_scale_factor(hf1 * hf2) + midd;

    const int64_t unrounded = wrapping_add(wrapping_add(integral, cross), f1xf2);
    const int64_t remainder = scale9.multiply_by_scale_factor(midr) + llr;
    return wrapping_add(unrounded, rounding_.increment(unrounded, remainder, one()));
}

int64_t DecimalEngine::multiply_exact(int64_t a, int64_t b, const char* operation) const {
    const Int128 product = detail::multiply_64x64_to_128(a, b);
    Int128 truncated;
    int64_t remainder = 0;
    if (detail::fits_in_int64(product)) {
        const int64_t p = detail::low_int64(product);
        truncated = detail::from_int64(metrics_->divide_by_scale_factor(p));
        remainder = metrics_->modulo_by_scale_factor(p);
    } else {
        truncated = detail::divide_128_by_64(product, one(), &remainder);
    }
    const int inc = rounding_.increment(detail::low_int64(truncated), remainder, one());
    return overflow_.narrow(detail::add_128(truncated, detail::from_int64(inc)), operation, a, b);
}

int64_t DecimalEngine::multiply_by_long(int64_t u, int64_t value) const {
    return overflow_.multiply(u, value);
}

int64_t DecimalEngine::multiply_by_power_of_10(int64_t u, int n) const {
    if (n == 0) {
        return u;
    }
    return n > 0 ? scale_up(u, n) : scale_down(u, -static_cast<int64_t>(n));
}

int64_t DecimalEngine::square(int64_t u) const {
    return overflow_.checked() ? multiply_exact(u, u, "square") : square_unchecked(u);
}

int64_t DecimalEngine::square_unchecked(int64_t u) const {
    const ScaleMetrics& m = *metrics_;
    const int64_t i = m.divide_by_scale_factor(u);
    const int64_t f = u - m.multiply_by_scale_factor(i);

    const int64_t integral = m.multiply_by_scale_factor(wrapping_multiply(i, i));
    const int64_t cross = wrapping_multiply(wrapping_multiply(i, f), 2);

    if (f >= -SQRT_INT64_MAX && f <= SQRT_INT64_MAX) {
        const int64_t fxf = f * f;
        const int64_t fxfd = m.divide_by_scale_factor(fxf);
        const int64_t fxfr = fxf - m.multiply_by_scale_factor(fxfd);
        const int64_t unrounded = wrapping_add(wrapping_add(integral, cross), fxfd);
        return wrapping_add(unrounded, rounding_.increment(unrounded, fxfr, one()));
    }

    // Only reachable for scale > 9
    const ScaleMetrics& scale9 = ScaleMetrics::for_scale(9);
    const ScaleMetrics& diff09 = ScaleMetrics::for_scale(m.scale() - 9);
    const ScaleMetrics& diff18 = ScaleMetrics::for_scale(18 - m.scale());
    const int64_t hf = scale9.divide_by_scale_factor(f);
    const int64_t lf = f - scale9.multiply_by_scale_factor(hf);

    const int64_t ll = lf * lf;
    const int64_t lld = scale9.divide_by_scale_factor(ll);
    const int64_t llr = ll - scale9.multiply_by_scale_factor(lld);
    const int64_t mid = 2 * hf * lf + lld;
    const int64_t midd = diff09.divide_by_scale_factor(mid);
    const int64_t midr = mid - diff09.multiply_by_scale_factor(midd);
    const int64_t fxf = diff18.multiply_by_scale_factor(hf * hf) + midd;

    const int64_t unrounded = wrapping_add(wrapping_add(integral, cross), fxf);
    const int64_t remainder = scale9.multiply_by_scale_factor(midr) + llr;
    return wrapping_add(unrounded, rounding_.increment(unrounded, remainder, one()));
}

// ============================================================================
// Division
// ============================================================================

int64_t DecimalEngine::divide(int64_t dividend, int64_t divisor) const {
    switch (classify_division(one(), dividend, divisor)) {
    case SpecialDivision::DIVISOR_IS_ZERO:
        throw DivisionByZeroError("Division by zero: " + to_string(dividend) + " / 0 [" +
                                  describe() + "]");
    case SpecialDivision::DIVIDEND_IS_ZERO:
        return 0;
    case SpecialDivision::DIVISOR_IS_ONE:
        return dividend;
    case SpecialDivision::DIVISOR_IS_MINUS_ONE:
        return overflow_.negate(dividend);
    case SpecialDivision::DIVIDEND_EQUALS_DIVISOR:
        return one();
    case SpecialDivision::DIVIDEND_EQUALS_MINUS_DIVISOR:
        return -one();
    case SpecialDivision::NONE:
        break;
    }

    const ScaleMetrics* pow10 = ScaleMetrics::find_by_scale_factor(detail::unsigned_abs(divisor));
    if (pow10 != nullptr) {
        return divide_by_power_of_10_divisor(dividend, divisor, *pow10);
    }
    return divide_general(dividend, divisor);
}

// |divisor| = 10^k and divisor != +-one(): the quotient is a plain rescale
int64_t DecimalEngine::divide_by_power_of_10_divisor(int64_t dividend, int64_t divisor,
                                                     const ScaleMetrics& pow10) const {
    const int scale_diff = scale() - pow10.scale();
    if (scale_diff < 0) {
        const ScaleMetrics& scaler = ScaleMetrics::for_scale(-scale_diff);
        const int64_t truncated = scaler.divide_by_scale_factor(dividend);
        const int64_t remainder = scaler.modulo_by_scale_factor(dividend);
        if (divisor > 0) {
            return truncated + rounding_.increment(truncated, remainder, scaler.scale_factor());
        }
        return -truncated + rounding_.increment(-truncated, -remainder, scaler.scale_factor());
    }
    const int64_t scaled = overflow_.multiply(dividend, ScaleMetrics::for_scale(scale_diff).scale_factor());
    return divisor > 0 ? scaled : overflow_.negate(scaled);
}

int64_t DecimalEngine::divide_general(int64_t dividend, int64_t divisor) const {
    const ScaleMetrics& m = *metrics_;
    if (m.is_valid_integer_value(dividend)) {
        const int64_t scaled = m.multiply_by_scale_factor(dividend);
        const int64_t quotient = scaled / divisor;
        const int64_t remainder = scaled - quotient * divisor;
        return quotient + rounding_.increment_for_division(quotient, remainder, divisor);
    }

    // Component wise: integral part first, then the scaled remainder
    const int64_t integral = dividend / divisor;
    const int64_t remainder = dividend - integral * divisor;
    int64_t fraction = 0;
    int64_t sub_remainder = 0;
    if (m.is_valid_integer_value(remainder)) {
        const int64_t scaled_remainder = m.multiply_by_scale_factor(remainder);
        fraction = scaled_remainder / divisor;
        sub_remainder = scaled_remainder - fraction * divisor;
    } else {
        // |remainder| < |divisor| so the quotient is below one()
        const Int128 scaled_remainder = detail::multiply_64x64_to_128(remainder, one());
        fraction = detail::low_int64(
            detail::divide_128_by_64(scaled_remainder, divisor, &sub_remainder));
    }

    const int64_t truncated = wrapping_add(m.multiply_by_scale_factor(integral), fraction);
    const int inc = rounding_.increment_for_division(truncated, sub_remainder, divisor);
    if (overflow_.checked()) {
        const Int128 exact = detail::add_128(
            detail::add_128(detail::multiply_64x64_to_128(integral, one()),
                            detail::from_int64(fraction)),
            detail::from_int64(inc));
        return overflow_.narrow(exact, "divide", dividend, divisor);
    }
    return wrapping_add(truncated, inc);
}

int64_t DecimalEngine::divide_by_long(int64_t u, int64_t divisor) const {
    if (divisor == 0) {
        throw DivisionByZeroError("Division by zero: " + to_string(u) + " / 0 [" + describe() +
                                  "]");
    }
    if (divisor == -1) {
        return overflow_.negate(u);
    }
    const int64_t quotient = u / divisor;
    const int64_t remainder = u - quotient * divisor;
    return quotient + rounding_.increment_for_division(quotient, remainder, divisor);
}

int64_t DecimalEngine::divide_by_power_of_10(int64_t u, int n) const {
    if (n == 0) {
        return u;
    }
    return n > 0 ? scale_down(u, n) : scale_up(u, -static_cast<int64_t>(n));
}

int64_t DecimalEngine::scale_up(int64_t u, int64_t n) const {
    if (u == 0) {
        return 0;
    }
    if (n <= MAX_SCALE) {
        const ScaleMetrics& scaler = ScaleMetrics::for_scale(static_cast<int>(n));
        if (overflow_.checked() && !scaler.is_valid_integer_value(u)) {
            overflow_.fail(std::to_string(u) + " * 10^" + std::to_string(n));
        }
        return scaler.multiply_by_scale_factor(u);
    }
    // 10^n > INT64_MAX for n > 18
    if (overflow_.checked()) {
        overflow_.fail(std::to_string(u) + " * 10^" + std::to_string(n));
    }
    // 10^n = 2^n * 5^n is a multiple of 2^64 for n >= 64
    if (n >= 64) {
        return 0;
    }
    int64_t result = u;
    for (int64_t rest = n; rest > 0; rest -= MAX_SCALE) {
        const int step = static_cast<int>(rest < MAX_SCALE ? rest : MAX_SCALE);
        result = wrapping_multiply(result, ScaleMetrics::for_scale(step).scale_factor());
    }
    return result;
}

int64_t DecimalEngine::scale_down(int64_t u, int64_t n) const {
    if (n <= MAX_SCALE) {
        const ScaleMetrics& scaler = ScaleMetrics::for_scale(static_cast<int>(n));
        const int64_t truncated = scaler.divide_by_scale_factor(u);
        const int64_t remainder = scaler.modulo_by_scale_factor(u);
        return truncated + rounding_.increment(truncated, remainder, scaler.scale_factor());
    }
    if (u == 0) {
        return 0;
    }
    // |u| < 10^19, so the quotient truncates to zero
    TruncatedPart part = TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO;
    if (n == MAX_SCALE + 1) {
        const uint64_t magnitude = detail::unsigned_abs(u);
        const uint64_t half = 5000000000000000000ULL;
        if (magnitude == half) {
            part = TruncatedPart::EQUAL_TO_HALF;
        } else if (magnitude > half) {
            part = TruncatedPart::GREATER_THAN_HALF;
        }
    }
    return rounding_.increment(u < 0 ? -1 : 1, 0, part);
}

// ============================================================================
// Unary operations
// ============================================================================

int64_t DecimalEngine::average(int64_t a, int64_t b) const {
    const int64_t x = a ^ b;
    // floor((a + b) / 2) without overflow
    const int64_t floor = (a & b) + (x >> 1);
    if ((x & 1) == 0) {
        return floor;
    }
    // Exactly half an ulp was dropped
    const int sign = floor >= 0 ? 1 : -1;
    const int64_t truncated = floor >= 0 ? floor : floor + 1;
    return truncated + rounding_.increment(sign, truncated, TruncatedPart::EQUAL_TO_HALF);
}

int64_t DecimalEngine::absolute(int64_t u) const {
    return u < 0 ? overflow_.negate(u) : u;
}

int64_t DecimalEngine::negate(int64_t u) const {
    return overflow_.negate(u);
}

int64_t DecimalEngine::invert(int64_t u) const {
    return divide(one(), u);
}

// Bitwise integer square root of u * 10^scale, then one rounding step
// from the remainder N - root^2.
int64_t DecimalEngine::square_root(int64_t u) const {
    if (u < 0) {
        throw InvalidArgumentError("Square root of negative value: " + to_string(u) + " [" +
                                   describe() + "]");
    }
    if (u == 0) {
        return 0;
    }

    Int128 rest = detail::multiply_64x64_to_128(u, one());
    Int128 root;
    Int128 bit = HIGHEST_SQRT_BIT;
    while (detail::compare_128(bit, rest) > 0) {
        bit = detail::shift_right_128(bit, 2);
    }
    while (detail::signum(bit) != 0) {
        const Int128 candidate = detail::add_128(root, bit);
        if (detail::compare_128(rest, candidate) >= 0) {
            rest = detail::subtract_128(rest, candidate);
            root = detail::add_128(detail::shift_right_128(root, 1), bit);
        } else {
            root = detail::shift_right_128(root, 1);
        }
        bit = detail::shift_right_128(bit, 2);
    }

    // root < 2^63 and rest <= 2 * root
    const int64_t truncated = detail::low_int64(root);
    TruncatedPart part = TruncatedPart::ZERO;
    if (detail::signum(rest) != 0) {
        // sqrt(r^2 + rest) >= r + 1/2 iff rest > r
        part = detail::compare_128(rest, root) <= 0 ? TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO
                                                    : TruncatedPart::GREATER_THAN_HALF;
    }
    return truncated + rounding_.increment(1, truncated, part);
}

int64_t DecimalEngine::power(int64_t u, int exponent) const {
    if (exponent == 0) {
        return one();
    }
    uint64_t remaining = detail::unsigned_abs(exponent);
    int64_t result = one();
    int64_t base = u;
    while (true) {
        if ((remaining & 1) != 0) {
            result = multiply(result, base);
        }
        remaining >>= 1;
        if (remaining == 0) {
            break;
        }
        base = square(base);
    }
    return exponent < 0 ? invert(result) : result;
}

// ============================================================================
// Shifts
// ============================================================================

int64_t DecimalEngine::shift_left(int64_t u, int n) const {
    return n >= 0 ? shift_left_by(u, n) : shift_right_by(u, -static_cast<int64_t>(n));
}

int64_t DecimalEngine::shift_right(int64_t u, int n) const {
    return n >= 0 ? shift_right_by(u, n) : shift_left_by(u, -static_cast<int64_t>(n));
}

int64_t DecimalEngine::shift_left_by(int64_t u, int64_t n) const {
    if (u == 0 || n == 0) {
        return u;
    }
    if (n >= 64) {
        if (overflow_.checked()) {
            overflow_.fail(std::to_string(u) + " << " + std::to_string(n));
        }
        return 0;
    }
    const int64_t result = static_cast<int64_t>(static_cast<uint64_t>(u) << n);
    if (overflow_.checked() && (result >> n) != u) {
        overflow_.fail(std::to_string(u) + " << " + std::to_string(n));
    }
    return result;
}

int64_t DecimalEngine::shift_right_by(int64_t u, int64_t n) const {
    if (u == 0 || n == 0) {
        return u;
    }
    const int sign = u < 0 ? -1 : 1;
    const uint64_t magnitude = detail::unsigned_abs(u);
    if (n >= 64) {
        const bool half = n == 64 && magnitude == (static_cast<uint64_t>(1) << 63);
        const TruncatedPart part =
            half ? TruncatedPart::EQUAL_TO_HALF : TruncatedPart::LESS_THAN_HALF_BUT_NOT_ZERO;
        return rounding_.increment(sign, 0, part);
    }
    const uint64_t divisor = static_cast<uint64_t>(1) << n;
    const uint64_t quotient = magnitude >> n;
    const TruncatedPart part = truncated_part_of(magnitude & (divisor - 1), divisor);
    const int64_t truncated =
        sign < 0 ? -static_cast<int64_t>(quotient) : static_cast<int64_t>(quotient);
    return truncated + rounding_.increment(sign, truncated, part);
}

// ============================================================================
// Rounding to a precision
// ============================================================================

int64_t DecimalEngine::round(int64_t u, int precision) const {
    if (precision >= scale()) {
        return u;
    }
    const int64_t digits = static_cast<int64_t>(scale()) - precision;
    if (digits > MAX_SCALE) {
        throw InvalidArgumentError("Cannot round to precision " + std::to_string(precision) +
                                   " [" + describe() + "]");
    }
    const ScaleMetrics& scaler = ScaleMetrics::for_scale(static_cast<int>(digits));
    const int64_t truncated = scaler.divide_by_scale_factor(u);
    const int64_t remainder = scaler.modulo_by_scale_factor(u);
    const int64_t rounded =
        truncated + rounding_.increment(truncated, remainder, scaler.scale_factor());
    if (overflow_.checked() && !scaler.is_valid_integer_value(rounded)) {
        overflow_.fail("round(" + std::to_string(u) + ", " + std::to_string(precision) + ")");
    }
    return scaler.multiply_by_scale_factor(rounded);
}

} // namespace fixdec
