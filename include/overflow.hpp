#pragma once

#include "int128.hpp"

#include <cstdint>
#include <string>

namespace fixdec {

enum class OverflowMode {
    UNCHECKED, // silent two's complement truncation to 64 bits
    CHECKED    // throw OverflowError when the exact result does not fit
};

/// Upper-case enumerator name, e.g. "CHECKED"
const char* to_string(OverflowMode mode);

/// Case-insensitive inverse of to_string()
/// @throws ParseError for unknown names
OverflowMode parse_overflow_mode(const std::string& name);

// ============================================================================
// Two's complement wrapping helpers (no undefined behaviour on overflow)
// ============================================================================

inline int64_t wrapping_add(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

inline int64_t wrapping_subtract(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

inline int64_t wrapping_multiply(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

inline int64_t wrapping_negate(int64_t a) {
    return static_cast<int64_t>(0 - static_cast<uint64_t>(a));
}

/// Applies an overflow mode to 64-bit results.
///
/// Every operation computes the exact result's low 64 bits; in CHECKED mode
/// it additionally verifies that the exact result fits and throws
/// OverflowError otherwise. The context string (usually the engine
/// description) is appended to error messages.
class OverflowPolicy {
public:
    explicit OverflowPolicy(OverflowMode mode, std::string context = std::string());

    OverflowMode mode() const { return mode_; }
    bool checked() const { return mode_ == OverflowMode::CHECKED; }

    int64_t add(int64_t a, int64_t b) const;
    int64_t subtract(int64_t a, int64_t b) const;
    int64_t multiply(int64_t a, int64_t b) const;
    int64_t negate(int64_t a) const;

    /// Narrow an exact 128-bit result of the named operation
    int64_t narrow(const detail::Int128& value, const char* operation) const;

    /// Narrow an exact 128-bit result of operation(a, b)
    int64_t narrow(const detail::Int128& value, const char* operation, int64_t a,
                   int64_t b) const;

    /// Report an overflow of the named operation (CHECKED mode only)
    void fail(const std::string& operation) const;

private:
    OverflowMode mode_;
    std::string context_;
};

} // namespace fixdec
