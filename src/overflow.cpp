#include "overflow.hpp"
#include "errors.hpp"

#include <cctype>
#include <utility>

namespace fixdec {

const char* to_string(OverflowMode mode) {
    switch (mode) {
    case OverflowMode::UNCHECKED:
        return "UNCHECKED";
    case OverflowMode::CHECKED:
        return "CHECKED";
    }
    return "UNKNOWN";
}

OverflowMode parse_overflow_mode(const std::string& name) {
    std::string upper;
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (upper == "UNCHECKED") {
        return OverflowMode::UNCHECKED;
    }
    if (upper == "CHECKED") {
        return OverflowMode::CHECKED;
    }
    throw ParseError("Unknown overflow mode: '" + name + "'");
}

OverflowPolicy::OverflowPolicy(OverflowMode mode, std::string context)
    : mode_(mode), context_(std::move(context)) {}

int64_t OverflowPolicy::add(int64_t a, int64_t b) const {
    if (checked()) {
        detail::Int128 sum = detail::add_64x64_to_128(a, b);
        if (!detail::fits_in_int64(sum)) {
            fail(std::to_string(a) + " + " + std::to_string(b));
        }
    }
    return wrapping_add(a, b);
}

int64_t OverflowPolicy::subtract(int64_t a, int64_t b) const {
    int64_t result = wrapping_subtract(a, b);
    // Overflow iff the operands differ in sign and the result's sign
    // differs from the minuend's
    if (checked() && ((a ^ b) & (a ^ result)) < 0) {
        fail(std::to_string(a) + " - " + std::to_string(b));
    }
    return result;
}

int64_t OverflowPolicy::multiply(int64_t a, int64_t b) const {
    if (checked()) {
        detail::Int128 product = detail::multiply_64x64_to_128(a, b);
        if (!detail::fits_in_int64(product)) {
            fail(std::to_string(a) + " * " + std::to_string(b));
        }
    }
    return wrapping_multiply(a, b);
}

int64_t OverflowPolicy::negate(int64_t a) const {
    if (checked() && a == INT64_MIN) {
        fail("-(" + std::to_string(a) + ")");
    }
    return wrapping_negate(a);
}

int64_t OverflowPolicy::narrow(const detail::Int128& value, const char* operation) const {
    if (checked() && !detail::fits_in_int64(value)) {
        fail(std::string(operation) + " = " + detail::to_string(value));
    }
    return detail::low_int64(value);
}

int64_t OverflowPolicy::narrow(const detail::Int128& value, const char* operation,
                               int64_t a, int64_t b) const {
    if (checked() && !detail::fits_in_int64(value)) {
        fail(std::string(operation) + "(" + std::to_string(a) + ", " + std::to_string(b) +
             ") = " + detail::to_string(value));
    }
    return detail::low_int64(value);
}

void OverflowPolicy::fail(const std::string& operation) const {
    std::string message = "Overflow: " + operation;
    if (!context_.empty()) {
        message += " [" + context_ + "]";
    }
    throw OverflowError(message);
}

} // namespace fixdec
