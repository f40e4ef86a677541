#include "special_cases.hpp"

namespace fixdec {

SpecialMultiplication classify_multiplication(int64_t one, int64_t a, int64_t b) {
    if (a == 0 || b == 0) {
        return SpecialMultiplication::ZERO;
    }
    if (a == one) {
        return SpecialMultiplication::LEFT_IS_ONE;
    }
    if (b == one) {
        return SpecialMultiplication::RIGHT_IS_ONE;
    }
    if (a == -one) {
        return SpecialMultiplication::LEFT_IS_MINUS_ONE;
    }
    if (b == -one) {
        return SpecialMultiplication::RIGHT_IS_MINUS_ONE;
    }
    if (a == b) {
        return SpecialMultiplication::EQUAL_OPERANDS;
    }
    return SpecialMultiplication::NONE;
}

SpecialDivision classify_division(int64_t one, int64_t dividend, int64_t divisor) {
    if (divisor == 0) {
        return SpecialDivision::DIVISOR_IS_ZERO;
    }
    if (dividend == 0) {
        return SpecialDivision::DIVIDEND_IS_ZERO;
    }
    if (divisor == one) {
        return SpecialDivision::DIVISOR_IS_ONE;
    }
    if (divisor == -one) {
        return SpecialDivision::DIVISOR_IS_MINUS_ONE;
    }
    if (dividend == divisor) {
        return SpecialDivision::DIVIDEND_EQUALS_DIVISOR;
    }
    // divisor == INT64_MIN has no negation; dividend == divisor caught it above
    if (divisor != INT64_MIN && dividend == -divisor) {
        return SpecialDivision::DIVIDEND_EQUALS_MINUS_DIVISOR;
    }
    return SpecialDivision::NONE;
}

} // namespace fixdec
