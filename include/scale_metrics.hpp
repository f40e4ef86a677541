#pragma once

#include <cstdint>

namespace fixdec {

/// Largest supported scale; 10^18 is the largest power of ten below 2^63
constexpr int MAX_SCALE = 18;

/// Constants and fast scale-factor operations for one scale f, i.e. for
/// unscaled values representing value * 10^f.
///
/// One shared immutable instance exists per scale 0..18, obtained through
/// for_scale(). Instances hold no mutable state and may be used from any
/// thread.
class ScaleMetrics {
public:
    explicit ScaleMetrics(int scale);

    /// Shared instance for the given scale
    /// @throws InvalidArgumentError if scale is not in [0, 18]
    static const ScaleMetrics& for_scale(int scale);

    /// Instance whose scale factor equals factor, or nullptr if factor is
    /// not a power of ten in [10^0, 10^18]
    static const ScaleMetrics* find_by_scale_factor(uint64_t factor);

    int scale() const { return scale_; }

    /// 10^scale
    int64_t scale_factor() const { return scale_factor_; }

    /// x * 10^scale, silently wrapping on overflow
    int64_t multiply_by_scale_factor(int64_t x) const;

    /// x / 10^scale truncated toward zero
    int64_t divide_by_scale_factor(int64_t x) const;

    /// x % 10^scale, the remainder of divide_by_scale_factor (sign of x)
    int64_t modulo_by_scale_factor(int64_t x) const;

    /// Largest x such that x * 10^scale fits in int64_t
    int64_t max_integer_value() const { return max_integer_value_; }

    /// Smallest x such that x * 10^scale fits in int64_t
    int64_t min_integer_value() const { return min_integer_value_; }

    /// True if multiply_by_scale_factor(x) does not overflow
    bool is_valid_integer_value(int64_t x) const {
        return x >= min_integer_value_ && x <= max_integer_value_;
    }

private:
    int scale_;
    int64_t scale_factor_;
    int64_t max_integer_value_;
    int64_t min_integer_value_;
};

} // namespace fixdec
