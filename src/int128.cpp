#include "int128.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <vector>

namespace fixdec {
namespace detail {

namespace {

constexpr int64_t TEN_POW_18 = 1000000000000000000LL;

} // namespace

Int128 from_int64(int64_t value) {
    return Int128(value < 0 ? -1 : 0, static_cast<uint64_t>(value));
}

Int128 add_64x64_to_128(int64_t a, int64_t b) {
    // The sum overflowed iff both operands have the same sign and the
    // wrapped result has the other one. In that case the high word is the
    // operands' sign extension, otherwise the result's.
    uint64_t low = static_cast<uint64_t>(a) + static_cast<uint64_t>(b);
    int64_t wrapped = static_cast<int64_t>(low);
    bool overflow = ((a ^ wrapped) & (b ^ wrapped)) < 0;

    Int128 result;
    result.low = low;
    if (overflow) {
        result.high = a < 0 ? -1 : 0;
    } else {
        result.high = wrapped < 0 ? -1 : 0;
    }
    return result;
}

Int128 multiply_64x64_to_128(int64_t a, int64_t b) {
    const bool negative = (a < 0) != (b < 0);
    const uint64_t x = unsigned_abs(a);
    const uint64_t y = unsigned_abs(b);

    // Four 32x32 partial products of the magnitudes
    const uint64_t x_lo = x & 0xFFFFFFFF;
    const uint64_t x_hi = x >> 32;
    const uint64_t y_lo = y & 0xFFFFFFFF;
    const uint64_t y_hi = y >> 32;

    const uint64_t lo_lo = x_lo * y_lo;
    const uint64_t lo_hi = x_lo * y_hi;
    const uint64_t hi_lo = x_hi * y_lo;
    const uint64_t hi_hi = x_hi * y_hi;

    // Bits 32..95; at most (2^32-1)^2 + 2 (2^32-1) < 2^64
    const uint64_t cross = lo_hi + (lo_lo >> 32) + (hi_lo & 0xFFFFFFFF);

    Int128 magnitude;
    magnitude.low = (cross << 32) | (lo_lo & 0xFFFFFFFF);
    magnitude.high = static_cast<int64_t>(hi_hi + (hi_lo >> 32) + (cross >> 32));

    return negative ? negate_128(magnitude) : magnitude;
}

Int128 add_128(const Int128& a, const Int128& b) {
    Int128 result;
    result.low = a.low + b.low;
    uint64_t carry = result.low < a.low ? 1 : 0;
    result.high = static_cast<int64_t>(static_cast<uint64_t>(a.high) +
                                       static_cast<uint64_t>(b.high) + carry);
    return result;
}

Int128 subtract_128(const Int128& a, const Int128& b) {
    Int128 result;
    result.low = a.low - b.low;
    uint64_t borrow = a.low < b.low ? 1 : 0;
    result.high = static_cast<int64_t>(static_cast<uint64_t>(a.high) -
                                       static_cast<uint64_t>(b.high) - borrow);
    return result;
}

Int128 negate_128(const Int128& value) {
    Int128 result;
    result.low = ~value.low + 1;
    uint64_t high = ~static_cast<uint64_t>(value.high);
    if (result.low == 0) {
        high++;
    }
    result.high = static_cast<int64_t>(high);
    return result;
}

Int128 divide_128_by_64(const Int128& dividend, int64_t divisor,
                        int64_t* remainder) {
    if (divisor == 0) {
        throw DivisionByZeroError("Division by zero: " + to_string(dividend) + " / 0");
    }

    // Quotient truncates toward zero; the remainder takes the dividend's sign
    const bool negative_dividend = dividend.high < 0;
    const bool negative = negative_dividend != (divisor < 0);

    // |-2^127| reads back exactly as an unsigned high word
    Int128 abs_dividend = negative_dividend ? negate_128(dividend) : dividend;
    uint64_t hi = static_cast<uint64_t>(abs_dividend.high);
    uint64_t lo = abs_dividend.low;
    uint64_t abs_divisor = unsigned_abs(divisor);
    uint64_t rem = 0;

    if (hi == 0) {
        // Magnitude below 2^64
        rem = lo % abs_divisor;
        lo = lo / abs_divisor;
    } else {
        // Shift-and-subtract long division. The quotient bits are shifted
        // into lo as the dividend bits are shifted out of hi. rem stays
        // below abs_divisor <= 2^63, so doubling it cannot overflow.
        for (int i = 0; i < 128; i++) {
            rem = (rem << 1) | (hi >> 63);
            hi = (hi << 1) | (lo >> 63);
            lo <<= 1;
            if (rem >= abs_divisor) {
                rem -= abs_divisor;
                lo |= 1;
            }
        }
    }

    if (remainder != nullptr) {
        int64_t r = static_cast<int64_t>(rem);
        *remainder = negative_dividend ? -r : r;
    }

    Int128 quotient(static_cast<int64_t>(hi), lo);
    return negative ? negate_128(quotient) : quotient;
}

Int128 shift_right_128(const Int128& value, int n) {
    if (n < 0 || n >= 128) {
        throw std::invalid_argument("Shift amount must be between 0 and 127");
    }
    if (n == 0) {
        return value;
    }

    Int128 result;
    // Arithmetic right shift (preserve sign)
    if (n < 64) {
        result.high = value.high >> n;
        result.low = (static_cast<uint64_t>(value.high) << (64 - n)) |
                     (value.low >> n);
    } else {
        result.high = value.high < 0 ? -1 : 0;
        result.low = static_cast<uint64_t>(value.high >> (n - 64));
    }
    return result;
}

Int128 shift_left_128(const Int128& value, int n) {
    if (n < 0 || n >= 128) {
        throw std::invalid_argument("Shift amount must be between 0 and 127");
    }
    if (n == 0) {
        return value;
    }

    Int128 result;
    if (n < 64) {
        result.high = static_cast<int64_t>(
            (static_cast<uint64_t>(value.high) << n) | (value.low >> (64 - n)));
        result.low = value.low << n;
    } else {
        result.high = static_cast<int64_t>(value.low << (n - 64));
        result.low = 0;
    }
    return result;
}

int compare_128(const Int128& a, const Int128& b) {
    if (a.high != b.high) {
        return a.high < b.high ? -1 : 1;
    }
    if (a.low != b.low) {
        return a.low < b.low ? -1 : 1;
    }
    return 0;
}

bool is_negative(const Int128& value) {
    return value.high < 0;
}

int signum(const Int128& value) {
    if (value.high < 0) {
        return -1;
    }
    return (value.high > 0 || value.low != 0) ? 1 : 0;
}

bool fits_in_int64(const Int128& value) {
    // The high word must be the sign extension of bit 63 of the low word
    if (value.high == 0) {
        return value.low <= static_cast<uint64_t>(INT64_MAX);
    } else if (value.high == -1) {
        return value.low >= static_cast<uint64_t>(INT64_MIN);
    }
    return false;
}

int64_t to_int64(const Int128& value) {
    if (!fits_in_int64(value)) {
        throw OverflowError("128-bit value does not fit in int64_t: " + to_string(value));
    }
    return static_cast<int64_t>(value.low);
}

int64_t low_int64(const Int128& value) {
    return static_cast<int64_t>(value.low);
}

std::string to_string(const Int128& value) {
    if (fits_in_int64(value)) {
        return std::to_string(static_cast<int64_t>(value.low));
    }

    // Peel off 18 decimal digits at a time; division truncates toward zero
    // so the remainders carry the sign of the value
    std::vector<uint64_t> chunks;
    Int128 rest = value;
    while (signum(rest) != 0) {
        int64_t chunk = 0;
        rest = divide_128_by_64(rest, TEN_POW_18, &chunk);
        chunks.push_back(unsigned_abs(chunk));
    }

    std::string text = is_negative(value) ? "-" : "";
    text += std::to_string(chunks.back());
    for (auto it = chunks.rbegin() + 1; it != chunks.rend(); ++it) {
        std::string digits = std::to_string(*it);
        text.append(18 - digits.size(), '0');
        text += digits;
    }
    return text;
}

} // namespace detail
} // namespace fixdec
