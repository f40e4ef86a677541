#include <gtest/gtest.h>
#include "decimal_engine.hpp"
#include "errors.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

using namespace fixdec;
using boost::multiprecision::cpp_int;

// Every operation is compared against exact arbitrary precision arithmetic:
// the exact result rounded once with the engine mode, then either the low
// 64 bits (UNCHECKED) or an OverflowError when it does not fit (CHECKED).

namespace {

constexpr int PAIRS_PER_ENGINE = 300;

const RoundingMode ALL_ROUNDING_MODES[] = {
    RoundingMode::UP,        RoundingMode::DOWN,      RoundingMode::CEILING,
    RoundingMode::FLOOR,     RoundingMode::HALF_UP,   RoundingMode::HALF_DOWN,
    RoundingMode::HALF_EVEN, RoundingMode::UNNECESSARY,
};

struct Expected {
    cpp_int value;
    bool inexact{false};
};

// ============================================================================
// Oracle
// ============================================================================

Expected exact(const cpp_int& value) {
    Expected expected;
    expected.value = value;
    return expected;
}

// numerator / denominator rounded with mode; UNNECESSARY marks inexact results
Expected round_quotient(const cpp_int& numerator, const cpp_int& denominator,
                        RoundingMode mode) {
    Expected expected;
    expected.value = numerator / denominator;
    const cpp_int remainder = numerator % denominator;
    if (remainder == 0) {
        return expected;
    }
    expected.inexact = true;

    const bool negative = (numerator < 0) != (denominator < 0);
    const cpp_int twice = 2 * abs(remainder);
    const cpp_int divisor = abs(denominator);
    const bool odd = abs(expected.value) % 2 == 1;
    bool away = false;
    switch (mode) {
    case RoundingMode::UP:
        away = true;
        break;
    case RoundingMode::DOWN:
    case RoundingMode::UNNECESSARY:
        away = false;
        break;
    case RoundingMode::CEILING:
        away = !negative;
        break;
    case RoundingMode::FLOOR:
        away = negative;
        break;
    case RoundingMode::HALF_UP:
        away = twice >= divisor;
        break;
    case RoundingMode::HALF_DOWN:
        away = twice > divisor;
        break;
    case RoundingMode::HALF_EVEN:
        away = twice > divisor || (twice == divisor && odd);
        break;
    }
    if (away) {
        expected.value += negative ? -1 : 1;
    }
    return expected;
}

// sqrt(n) rounded with mode; the exact root is never a tie
Expected round_sqrt(const cpp_int& n, RoundingMode mode) {
    cpp_int rest;
    Expected expected;
    expected.value = boost::multiprecision::sqrt(n, rest);
    if (rest == 0) {
        return expected;
    }
    expected.inexact = true;
    // sqrt(n) > root + 1/2 iff 4n > (2 root + 1)^2
    const cpp_int doubled = 2 * expected.value + 1;
    const bool above_half = 4 * n > doubled * doubled;
    bool up = false;
    switch (mode) {
    case RoundingMode::UP:
    case RoundingMode::CEILING:
        up = true;
        break;
    case RoundingMode::DOWN:
    case RoundingMode::FLOOR:
    case RoundingMode::UNNECESSARY:
        up = false;
        break;
    case RoundingMode::HALF_UP:
    case RoundingMode::HALF_DOWN:
    case RoundingMode::HALF_EVEN:
        up = above_half;
        break;
    }
    if (up) {
        expected.value += 1;
    }
    return expected;
}

int64_t low_bits(const cpp_int& value) {
    const cpp_int modulus = cpp_int(1) << 64;
    cpp_int low = value % modulus;
    if (low < 0) {
        low += modulus;
    }
    return static_cast<int64_t>(low.convert_to<uint64_t>());
}

bool fits(const cpp_int& value) {
    return value >= INT64_MIN && value <= INT64_MAX;
}

// ============================================================================
// Operands
// ============================================================================

int64_t random_unscaled(std::mt19937_64& rng, int64_t one) {
    switch (rng() % 5) {
    case 0:
        return static_cast<int64_t>(rng() % 2001) - 1000;
    case 1:
        return (static_cast<int64_t>(rng() % 19) - 9) * one + static_cast<int64_t>(rng() % 3) - 1;
    case 2:
        return static_cast<int64_t>(rng());
    case 3: {
        const int64_t magnitude = static_cast<int64_t>(rng() >> (1 + rng() % 63));
        return (rng() & 1) != 0 ? -magnitude : magnitude;
    }
    default: {
        const int64_t extremes[] = {INT64_MAX, INT64_MIN, INT64_MAX - 1, INT64_MIN + 1,
                                    one,       -one,      0,             one / 2 + 1};
        return extremes[rng() % 8];
    }
    }
}

class ReferenceChecker {
public:
    explicit ReferenceChecker(const DecimalEngine& engine) : engine_(engine) {}

    void check(const std::string& operation, const Expected& expected,
               const std::function<int64_t()>& call) {
        ++checked_;
        const std::string where = operation + " [" + engine_.describe() + "]";
        if (expected.inexact && engine_.rounding_mode() == RoundingMode::UNNECESSARY) {
            EXPECT_THROW(call(), RoundingRequiredError) << where;
            return;
        }
        if (!fits(expected.value) && engine_.overflow_mode() == OverflowMode::CHECKED) {
            EXPECT_THROW(call(), OverflowError) << where << " = " << expected.value;
            return;
        }
        EXPECT_EQ(call(), low_bits(expected.value)) << where << " = " << expected.value;
    }

    int count() const { return checked_; }

private:
    const DecimalEngine& engine_;
    int checked_{0};
};

std::string call_text(const char* name, int64_t a, int64_t b) {
    return std::string(name) + "(" + std::to_string(a) + ", " + std::to_string(b) + ")";
}

} // namespace

// ============================================================================
// Randomized comparison
// ============================================================================

TEST(ReferenceTest, AllScalesModesAndOverflowPolicies) {
    std::mt19937_64 rng(0x5eed5eedULL);
    int total = 0;

    for (int scale = 0; scale <= MAX_SCALE; ++scale) {
        for (RoundingMode rounding : ALL_ROUNDING_MODES) {
            for (OverflowMode overflow : {OverflowMode::UNCHECKED, OverflowMode::CHECKED}) {
                const DecimalEngine e(scale, rounding, overflow);
                const cpp_int one = e.one();
                ReferenceChecker checker(e);

                for (int i = 0; i < PAIRS_PER_ENGINE; ++i) {
                    const int64_t a = random_unscaled(rng, e.one());
                    const int64_t b = random_unscaled(rng, e.one());
                    const cpp_int x = a;
                    const cpp_int y = b;

                    checker.check(call_text("add", a, b), exact(x + y),
                                  [&] { return e.add(a, b); });
                    checker.check(call_text("subtract", a, b), exact(x - y),
                                  [&] { return e.subtract(a, b); });
                    checker.check(call_text("multiply", a, b),
                                  round_quotient(x * y, one, rounding),
                                  [&] { return e.multiply(a, b); });
                    checker.check(call_text("square", a, a),
                                  round_quotient(x * x, one, rounding),
                                  [&] { return e.square(a); });
                    checker.check(call_text("average", a, b),
                                  round_quotient(x + y, 2, rounding),
                                  [&] { return e.average(a, b); });
                    if (b != 0) {
                        checker.check(call_text("divide", a, b),
                                      round_quotient(x * one, y, rounding),
                                      [&] { return e.divide(a, b); });
                        checker.check(call_text("divide_by_long", a, b),
                                      round_quotient(x, y, rounding),
                                      [&] { return e.divide_by_long(a, b); });
                    }
                    if (a >= 0) {
                        checker.check(call_text("square_root", a, 0),
                                      round_sqrt(x * one, rounding),
                                      [&] { return e.square_root(a); });
                    }
                }
                total += checker.count();
            }
        }
    }
    EXPECT_GT(total, 100000);
}

TEST(ReferenceTest, DivisionByPowersOfTen) {
    std::mt19937_64 rng(42);
    for (int scale = 0; scale <= MAX_SCALE; ++scale) {
        for (RoundingMode rounding : ALL_ROUNDING_MODES) {
            const DecimalEngine e(scale, rounding, OverflowMode::CHECKED);
            ReferenceChecker checker(e);
            for (int n = 0; n <= MAX_SCALE; ++n) {
                const int64_t divisor = ScaleMetrics::for_scale(n).scale_factor();
                for (int i = 0; i < 20; ++i) {
                    const int64_t a = random_unscaled(rng, e.one());
                    for (int64_t d : {divisor, -divisor}) {
                        checker.check(call_text("divide", a, d),
                                      round_quotient(cpp_int(a) * e.one(), d, rounding),
                                      [&] { return e.divide(a, d); });
                    }
                }
            }
        }
    }
}

TEST(ReferenceTest, MultiplyThenDivideRestores) {
    std::mt19937_64 rng(0xd1ce);
    int checked = 0;

    for (int scale = 0; scale <= MAX_SCALE; ++scale) {
        for (RoundingMode rounding : ALL_ROUNDING_MODES) {
            for (OverflowMode overflow : {OverflowMode::UNCHECKED, OverflowMode::CHECKED}) {
                const DecimalEngine e(scale, rounding, overflow);
                for (int i = 0; i < 100; ++i) {
                    // b = k * 10^j and a = m * 10^(scale - j) make a * b exactly m * k
                    const int j = static_cast<int>(rng() % (scale + 1));
                    const int64_t k = static_cast<int64_t>(rng() % 9 + 1) * ((rng() & 1) != 0 ? -1 : 1);
                    const int64_t b = k * ScaleMetrics::for_scale(j).scale_factor();
                    const int64_t step = ScaleMetrics::for_scale(scale - j).scale_factor();
                    const int64_t m = random_unscaled(rng, e.one()) / step;
                    const int64_t a = m * step;
                    if (!fits(cpp_int(m) * k)) {
                        continue;
                    }

                    const std::string where = call_text("multiply", a, b) + " [" + e.describe() + "]";
                    const int64_t product = e.multiply(a, b);
                    EXPECT_EQ(product, m * k) << where;
                    EXPECT_EQ(e.divide(product, b), a) << where;
                    ++checked;
                }
            }
        }
    }
    EXPECT_GT(checked, 20000);
}

TEST(ReferenceTest, ParseMatchesBigDecimal) {
    std::mt19937_64 rng(7);
    for (int scale = 0; scale <= MAX_SCALE; ++scale) {
        for (RoundingMode rounding : ALL_ROUNDING_MODES) {
            for (OverflowMode overflow : {OverflowMode::UNCHECKED, OverflowMode::CHECKED}) {
                const DecimalEngine e(scale, rounding, overflow);
                const RoundingStrategy strategy(rounding);
                ReferenceChecker checker(e);
                for (int i = 0; i < 40; ++i) {
                    // At most 18 integer digits keeps the integer part in range
                    std::string text = (rng() & 1) != 0 ? "-" : "";
                    const int integer_digits = static_cast<int>(rng() % 19);
                    const int fraction_digits = static_cast<int>(rng() % 25);
                    for (int d = 0; d < integer_digits; ++d) {
                        text += static_cast<char>('0' + rng() % 10);
                    }
                    text += '.';
                    for (int d = 0; d < fraction_digits; ++d) {
                        text += static_cast<char>('0' + rng() % 10);
                    }
                    if (integer_digits == 0 && fraction_digits == 0) {
                        text += '0';
                    }

                    const BigDecimal value(text);
                    Expected expected;
                    expected.inexact = value.scale() > scale &&
                                       value.unscaled_value() %
                                               boost::multiprecision::pow(
                                                   cpp_int(10),
                                                   static_cast<unsigned>(value.scale() - scale)) !=
                                           0;
                    if (!expected.inexact || rounding != RoundingMode::UNNECESSARY) {
                        expected.value = value.with_scale(scale, strategy).unscaled_value();
                    }
                    checker.check("parse(\"" + text + "\")", expected,
                                  [&] { return e.parse(text); });
                }
            }
        }
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
