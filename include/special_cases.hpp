#pragma once

#include <cstdint>

namespace fixdec {

// ============================================================================
// Special-case dispatch
// ============================================================================
//
// Operand patterns for which multiplication and division have a trivial
// answer. Each case yields exactly the result of the general algorithm; the
// engine checks them before doing any real work.

enum class SpecialMultiplication {
    NONE,
    ZERO,               // either factor is zero
    LEFT_IS_ONE,        // result is the right factor
    RIGHT_IS_ONE,       // result is the left factor
    LEFT_IS_MINUS_ONE,  // result is the negated right factor
    RIGHT_IS_MINUS_ONE, // result is the negated left factor
    EQUAL_OPERANDS      // result is the square of either factor
};

enum class SpecialDivision {
    NONE,
    DIVISOR_IS_ZERO,
    DIVIDEND_IS_ZERO,
    DIVISOR_IS_ONE,                // result is the dividend
    DIVISOR_IS_MINUS_ONE,          // result is the negated dividend
    DIVIDEND_EQUALS_DIVISOR,       // result is one
    DIVIDEND_EQUALS_MINUS_DIVISOR  // result is minus one
};

/// Classify a product of two unscaled values; one is the unscaled value of 1
SpecialMultiplication classify_multiplication(int64_t one, int64_t a, int64_t b);

/// Classify a quotient of two unscaled values; one is the unscaled value of 1
SpecialDivision classify_division(int64_t one, int64_t dividend, int64_t divisor);

} // namespace fixdec
