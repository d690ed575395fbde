#include <gtest/gtest.h>
#include <evalforge/evaluation/formula_evaluator.h>

using namespace evalforge;
using namespace evalforge::evaluation;
using json = nlohmann::json;

namespace {

double eval(const std::string& formula, const json& sample = json::object()) {
    auto r = FormulaEvaluator::evaluate(formula, sample);
    EXPECT_TRUE(r) << formula << ": " << (r ? "" : r.error().message);
    return r ? r.value() : -1.0;
}

} // namespace

TEST(FormulaEvaluatorTest, Precedence) {
    EXPECT_DOUBLE_EQ(eval("1 + 2 * 3"), 7.0);
    EXPECT_DOUBLE_EQ(eval("(1 + 2) * 3"), 9.0);
    EXPECT_DOUBLE_EQ(eval("10 - 4 - 3"), 3.0);
    EXPECT_DOUBLE_EQ(eval("8 / 4 / 2"), 1.0);
    EXPECT_DOUBLE_EQ(eval("-2 * -3"), 6.0);
    EXPECT_DOUBLE_EQ(eval("0.5 + .25"), 0.75);
}

TEST(FormulaEvaluatorTest, FieldsResolveAgainstSample) {
    json sample{{"correct", 8}, {"total", 10}, {"stats", {{"latency_ms", 250}}}, {"ok", true}};
    EXPECT_DOUBLE_EQ(eval("correct / total", sample), 0.8);
    EXPECT_DOUBLE_EQ(eval("stats.latency_ms / 1000", sample), 0.25);
    EXPECT_DOUBLE_EQ(eval("ok * 2", sample), 2.0);
}

TEST(FormulaEvaluatorTest, MissingAndNonNumericFieldsReadAsZero) {
    json sample{{"name", "x"}};
    EXPECT_DOUBLE_EQ(eval("missing + 1", sample), 1.0);
    EXPECT_DOUBLE_EQ(eval("name + 1", sample), 1.0);
    EXPECT_DOUBLE_EQ(eval("name.deeper + 2", sample), 2.0);
}

TEST(FormulaEvaluatorTest, DivisionByZeroYieldsZero) {
    EXPECT_DOUBLE_EQ(eval("5 / 0"), 0.0);
    EXPECT_DOUBLE_EQ(eval("hits / total", json{{"hits", 3}, {"total", 0}}), 0.0);
}

TEST(FormulaEvaluatorTest, SyntaxErrorsAreInvalidArgument) {
    for (const char* bad : {"", "   ", "1 +", "(1 + 2", "1 2", "3 $ 4", "1.2.3"}) {
        auto r = FormulaEvaluator::evaluate(bad, json::object());
        ASSERT_FALSE(r) << "'" << bad << "' should not parse";
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
}

TEST(FormulaEvaluatorTest, DeepNestingIsRejected) {
    const std::string parens = std::string(200000, '(') + "1" + std::string(200000, ')');
    auto r = FormulaEvaluator::evaluate(parens, json::object());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(r.error().message.find("nested too deeply"), std::string::npos);

    auto negations = FormulaEvaluator::evaluate(std::string(200000, '-') + "1", json::object());
    ASSERT_FALSE(negations);
    EXPECT_EQ(negations.error().code, ErrorCode::InvalidArgument);

    EXPECT_DOUBLE_EQ(eval(std::string(100, '(') + "2" + std::string(100, ')')), 2.0);
    EXPECT_DOUBLE_EQ(eval("--3"), 3.0);
}
