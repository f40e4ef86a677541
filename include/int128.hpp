#pragma once

#include <cstdint>
#include <string>

namespace fixdec {

// ============================================================================
// 128-bit intermediate arithmetic
// ============================================================================
//
// Exact intermediates for products and scaled dividends that do not fit in
// 64 bits. Values of this type never leave the engine: every public
// operation narrows back to int64_t (checked or wrapping) before returning.

namespace detail {

/// Represents a 128-bit signed integer (simulated with high/low parts)
struct Int128 {
    int64_t high; // Upper 64 bits (signed)
    uint64_t low; // Lower 64 bits (unsigned)

    constexpr Int128() : high(0), low(0) {}
    constexpr Int128(int64_t h, uint64_t l) : high(h), low(l) {}

    constexpr bool operator==(const Int128& other) const {
        return high == other.high && low == other.low;
    }
    constexpr bool operator!=(const Int128& other) const {
        return !(*this == other);
    }
};

/// Magnitude of a signed value; well defined for INT64_MIN (2^63)
constexpr uint64_t unsigned_abs(int64_t value) {
    return value < 0 ? 0 - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);
}

/// Sign-extend a 64-bit value
Int128 from_int64(int64_t value);

/// Exact sum of two int64_t values
Int128 add_64x64_to_128(int64_t a, int64_t b);

/// Exact product of two int64_t values, including INT64_MIN operands
Int128 multiply_64x64_to_128(int64_t a, int64_t b);

/// Two's complement sum and difference (wrap at 128 bits)
Int128 add_128(const Int128& a, const Int128& b);
Int128 subtract_128(const Int128& a, const Int128& b);

/// Two's complement negation
Int128 negate_128(const Int128& value);

/// Divide a 128-bit value by a 64-bit divisor using binary long division.
///
/// The quotient is truncated toward zero and returned as a full 128-bit
/// value. If @p remainder is not null it receives the remainder, which has
/// the sign of the dividend and is smaller in magnitude than the divisor.
///
/// @throws DivisionByZeroError if divisor is zero
Int128 divide_128_by_64(const Int128& dividend, int64_t divisor,
                        int64_t* remainder = nullptr);

/// Arithmetic shift right (0 <= n < 128)
/// @throws std::invalid_argument for other shift distances
Int128 shift_right_128(const Int128& value, int n);

/// Shift left (0 <= n < 128), bits shifted out of the top are lost
/// @throws std::invalid_argument for other shift distances
Int128 shift_left_128(const Int128& value, int n);

/// Returns -1, 0 or 1 as a is less than, equal to or greater than b
int compare_128(const Int128& a, const Int128& b);

bool is_negative(const Int128& value);

int signum(const Int128& value);

/// True when narrowing to int64_t loses no bits
bool fits_in_int64(const Int128& value);

/// Convert 128-bit to int64_t
/// @throws OverflowError if the value does not fit
int64_t to_int64(const Int128& value);

/// Low 64 bits reinterpreted as int64_t (silent truncation)
int64_t low_int64(const Int128& value);

/// Decimal rendering, e.g. "-170141183460469231731687303715884105728"
std::string to_string(const Int128& value);

} // namespace detail

} // namespace fixdec
