#include <gtest/gtest.h>
#include "calculator.hpp"
#include "errors.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace fixdec;

namespace {

DecimalEngine engine(int scale = 4, OverflowMode overflow = OverflowMode::UNCHECKED) {
    return DecimalEngine(scale, RoundingMode::HALF_UP, overflow);
}

std::string eval(const std::string& line) {
    return evaluate(engine(), split_fields(line));
}

} // namespace

// ============================================================================
// Line splitting
// ============================================================================

TEST(DecimalCalcTest, SplitFields) {
    EXPECT_EQ(split_fields("add,1,2"), (std::vector<std::string>{"add", "1", "2"}));
    EXPECT_EQ(split_fields("abs,-1"), (std::vector<std::string>{"abs", "-1"}));
    EXPECT_EQ(split_fields("add,,2"), (std::vector<std::string>{"add", "", "2"}));
    EXPECT_EQ(split_fields("add,1,"), (std::vector<std::string>{"add", "1"}));
    EXPECT_TRUE(split_fields("").empty());
}

TEST(DecimalCalcTest, ParseIntOperand) {
    EXPECT_EQ(parse_int_operand("3"), 3);
    EXPECT_EQ(parse_int_operand("-12"), -12);
    EXPECT_THROW(parse_int_operand("1.5"), ParseError);
    EXPECT_THROW(parse_int_operand("x"), ParseError);
    EXPECT_THROW(parse_int_operand(""), ParseError);
    EXPECT_THROW(parse_int_operand("99999999999999999999"), ParseError);
}

// ============================================================================
// Ops
// ============================================================================

TEST(DecimalCalcTest, UnaryOps) {
    EXPECT_EQ(eval("abs,-2"), "2.0000");
    EXPECT_EQ(eval("neg,1.5"), "-1.5000");
    EXPECT_EQ(eval("inv,4"), "0.2500");
    EXPECT_EQ(eval("sqr,1.5"), "2.2500");
    EXPECT_EQ(eval("sqrt,2"), "1.4142");
    EXPECT_EQ(eval("tolong,2.5"), "3");
    EXPECT_EQ(eval("todouble,0.25"), "0.25");
}

TEST(DecimalCalcTest, BinaryOps) {
    EXPECT_EQ(eval("add,12.345,1"), "13.3450");
    EXPECT_EQ(eval("sub,1,2.5"), "-1.5000");
    EXPECT_EQ(eval("mul,1.5,2"), "3.0000");
    EXPECT_EQ(eval("div,1,3"), "0.3333");
    EXPECT_EQ(eval("avg,1,2"), "1.5000");
    EXPECT_EQ(eval("min,1,-2"), "-2.0000");
    EXPECT_EQ(eval("max,1,-2"), "1.0000");
}

TEST(DecimalCalcTest, IntegerOperandOps) {
    EXPECT_EQ(eval("pow,1.5,2"), "2.2500");
    EXPECT_EQ(eval("pow,2,-1"), "0.5000");
    EXPECT_EQ(eval("shl,1.5,2"), "6.0000");
    EXPECT_EQ(eval("shr,1,1"), "0.5000");
    EXPECT_EQ(eval("round,1.2345,2"), "1.2300");

    EXPECT_THROW(eval("pow,2,1.5"), ParseError);
    EXPECT_THROW(eval("shl,2,x"), ParseError);
    EXPECT_THROW(eval("shr,2,"), InvalidArgumentError);
    EXPECT_THROW(eval("round,2,3a"), ParseError);
}

TEST(DecimalCalcTest, RejectsUnknownOpsAndBadOperands) {
    EXPECT_THROW(eval("mod,5,2"), InvalidArgumentError);
    EXPECT_THROW(eval("log,5"), InvalidArgumentError);
    EXPECT_THROW(eval("add"), InvalidArgumentError);
    EXPECT_THROW(eval("add,1,2,3"), InvalidArgumentError);
    EXPECT_THROW(eval("add,one,2"), ParseError);
    EXPECT_THROW(eval("div,1,0"), DivisionByZeroError);
    EXPECT_THROW(evaluate(engine(4, OverflowMode::CHECKED),
                          split_fields("mul,900000000000000,10")),
                 OverflowError);
}

// ============================================================================
// Scripts
// ============================================================================

TEST(DecimalCalcTest, RunCalculatorSkipsCommentsAndBlankLines) {
    std::istringstream input("# header\n"
                             "\n"
                             "add,1,2\n"
                             "# note\n"
                             "sqrt,4\n");
    std::ostringstream out;
    std::ostringstream err;

    const CalculatorSummary summary = run_calculator(engine(), input, out, err);

    EXPECT_EQ(summary.evaluated, 2u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(out.str(), "add(1, 2) = 3.0000\nsqrt(4) = 2.0000\n");
    EXPECT_TRUE(err.str().empty());
}

TEST(DecimalCalcTest, RunCalculatorCountsFailures) {
    std::istringstream input("add,1,2\n"
                             "garbage\n"
                             "add,1,2,3\n"
                             "div,1,0\n"
                             "frob,1,2\n");
    std::ostringstream out;
    std::ostringstream err;

    const CalculatorSummary summary = run_calculator(engine(), input, out, err);

    EXPECT_EQ(summary.evaluated, 1u);
    EXPECT_EQ(summary.failed, 4u);
    EXPECT_EQ(out.str(), "add(1, 2) = 3.0000\n");
    EXPECT_NE(err.str().find("expected op,a[,b] in line: garbage"), std::string::npos);
    EXPECT_NE(err.str().find("expected op,a[,b] in line: add,1,2,3"), std::string::npos);
    EXPECT_NE(err.str().find("failed to evaluate line: div,1,0"), std::string::npos);
    EXPECT_NE(err.str().find("unknown binary op: frob"), std::string::npos);
}

TEST(DecimalCalcTest, RunCalculatorOnlyComments) {
    std::istringstream input("# nothing to do\n\n");
    std::ostringstream out;
    std::ostringstream err;

    const CalculatorSummary summary = run_calculator(engine(), input, out, err);

    EXPECT_EQ(summary.evaluated, 0u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_TRUE(out.str().empty());
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
