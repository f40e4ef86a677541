#include "scale_metrics.hpp"
#include "errors.hpp"

#include <array>
#include <limits>
#include <string>

namespace fixdec {

namespace {

constexpr std::array<int64_t, MAX_SCALE + 1> POWERS_OF_TEN = {
    1LL,
    10LL,
    100LL,
    1000LL,
    10000LL,
    100000LL,
    1000000LL,
    10000000LL,
    100000000LL,
    1000000000LL,
    10000000000LL,
    100000000000LL,
    1000000000000LL,
    10000000000000LL,
    100000000000000LL,
    1000000000000000LL,
    10000000000000000LL,
    100000000000000000LL,
    1000000000000000000LL,
};

int64_t checked_power_of_ten(int scale) {
    if (scale < 0 || scale > MAX_SCALE) {
        throw InvalidArgumentError("Scale must be between 0 and " +
                                   std::to_string(MAX_SCALE) + " but was " +
                                   std::to_string(scale));
    }
    return POWERS_OF_TEN[scale];
}

} // namespace

ScaleMetrics::ScaleMetrics(int scale)
    : scale_(scale), scale_factor_(checked_power_of_ten(scale)),
      max_integer_value_(std::numeric_limits<int64_t>::max() / scale_factor_),
      min_integer_value_(std::numeric_limits<int64_t>::min() / scale_factor_) {}

const ScaleMetrics& ScaleMetrics::for_scale(int scale) {
    static const std::array<ScaleMetrics, MAX_SCALE + 1> metrics = {
        ScaleMetrics(0),  ScaleMetrics(1),  ScaleMetrics(2),  ScaleMetrics(3),
        ScaleMetrics(4),  ScaleMetrics(5),  ScaleMetrics(6),  ScaleMetrics(7),
        ScaleMetrics(8),  ScaleMetrics(9),  ScaleMetrics(10), ScaleMetrics(11),
        ScaleMetrics(12), ScaleMetrics(13), ScaleMetrics(14), ScaleMetrics(15),
        ScaleMetrics(16), ScaleMetrics(17), ScaleMetrics(18),
    };
    checked_power_of_ten(scale);
    return metrics[scale];
}

const ScaleMetrics* ScaleMetrics::find_by_scale_factor(uint64_t factor) {
    for (int scale = 0; scale <= MAX_SCALE; ++scale) {
        if (static_cast<uint64_t>(POWERS_OF_TEN[scale]) == factor) {
            return &for_scale(scale);
        }
    }
    return nullptr;
}

int64_t ScaleMetrics::multiply_by_scale_factor(int64_t x) const {
    if (scale_ == 0) {
        return x;
    }
    return static_cast<int64_t>(static_cast<uint64_t>(x) *
                                static_cast<uint64_t>(scale_factor_));
}

int64_t ScaleMetrics::divide_by_scale_factor(int64_t x) const {
    if (scale_ == 0) {
        return x;
    }
    return x / scale_factor_;
}

int64_t ScaleMetrics::modulo_by_scale_factor(int64_t x) const {
    if (scale_ == 0) {
        return 0;
    }
    return x % scale_factor_;
}

} // namespace fixdec
