#include <gtest/gtest.h>
#include <evalforge/evaluation/metrics_calculator.h>

using namespace evalforge;
using namespace evalforge::evaluation;
using json = nlohmann::json;

class MetricsCalculatorTest : public ::testing::Test {
protected:
    static TestCase makeCase(TestCaseStatus status, double score,
                             TestCaseCategory category = TestCaseCategory::Normal) {
        TestCase tc;
        tc.status = status;
        tc.score = score;
        tc.category = category;
        return tc;
    }

    static TestCase classificationCase(const std::string& expected, const std::string& actual) {
        TestCase tc;
        tc.expectedOutput = json{{"class", expected}};
        tc.actualOutput = json{{"class", actual}};
        tc.status = expected == actual ? TestCaseStatus::Passed : TestCaseStatus::Failed;
        tc.score = expected == actual ? 1.0 : 0.0;
        return tc;
    }

    MetricsCalculator calculator_;
};

TEST_F(MetricsCalculatorTest, EmptyBatchIsRejected) {
    auto r = calculator_.calculateMetrics({}, TaskType::Generation);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MetricsCalculatorTest, PassRateAndOverallScore) {
    std::vector<TestCase> cases;
    for (int i = 0; i < 80; ++i)
        cases.push_back(makeCase(TestCaseStatus::Passed, 1.0));
    for (int i = 0; i < 20; ++i)
        cases.push_back(makeCase(TestCaseStatus::Failed, 0.0));

    auto r = calculator_.calculateMetrics(cases, TaskType::Extraction);
    ASSERT_TRUE(r) << r.error().message;
    const auto& m = r.value();
    EXPECT_EQ(m.totalCount, 100);
    EXPECT_EQ(m.passedCount, 80);
    EXPECT_DOUBLE_EQ(m.passRate, 0.8);
    EXPECT_DOUBLE_EQ(m.overallScore, 0.8);
    EXPECT_DOUBLE_EQ(m.customMetrics.at("error_rate"), 0.2);
    EXPECT_FALSE(m.simulated);
}

TEST_F(MetricsCalculatorTest, OverallScoreIsWeighted) {
    auto heavy = makeCase(TestCaseStatus::Passed, 1.0);
    heavy.weight = 3.0;
    auto light = makeCase(TestCaseStatus::Failed, 0.0);
    auto r = calculator_.calculateMetrics({heavy, light}, TaskType::Extraction);
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r.value().overallScore, 0.75);
    EXPECT_DOUBLE_EQ(r.value().customMetrics.at("weighted_score"), 0.75);
}

TEST_F(MetricsCalculatorTest, ConfusionMatrixInvariants) {
    std::vector<std::string> truth{"pos", "pos", "neg", "neg", "neu", "pos"};
    std::vector<std::string> pred{"pos", "neg", "neg", "neg", "pos", "pos"};

    auto r = calculator_.calculateClassificationMetrics(pred, truth);
    ASSERT_TRUE(r);
    const auto& m = r.value();

    int cells = 0;
    int diagonal = 0;
    for (const auto& [t, row] : m.confusionMatrix) {
        int rowSum = 0;
        for (const auto& [p, count] : row) {
            cells += count;
            rowSum += count;
            if (t == p)
                diagonal += count;
        }
        EXPECT_EQ(rowSum, m.support.at(t));
    }
    EXPECT_EQ(cells, 6);
    EXPECT_DOUBLE_EQ(m.accuracy, static_cast<double>(diagonal) / 6.0);
    EXPECT_DOUBLE_EQ(m.accuracy, 4.0 / 6.0);

    EXPECT_DOUBLE_EQ(m.precision.at("pos"), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.recall.at("pos"), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.precision.at("neg"), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.recall.at("neg"), 1.0);
    EXPECT_DOUBLE_EQ(m.f1Score.at("neu"), 0.0);

    double f1Neg = 2.0 * (2.0 / 3.0) * 1.0 / (2.0 / 3.0 + 1.0);
    double f1Pos = 2.0 / 3.0;
    EXPECT_NEAR(m.macroF1, (f1Neg + f1Pos + 0.0) / 3.0, 1e-12);
    EXPECT_NEAR(m.weightedF1, (f1Pos * 3 + f1Neg * 2 + 0.0 * 1) / 6.0, 1e-12);
}

TEST_F(MetricsCalculatorTest, InferredClassesAreSorted) {
    auto r = calculator_.calculateClassificationMetrics({"b", "a"}, {"c", "a"});
    ASSERT_TRUE(r);
    std::vector<std::string> keys;
    for (const auto& [k, _] : r.value().confusionMatrix)
        keys.push_back(k);
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(MetricsCalculatorTest, UnknownLabelsJoinSuppliedClasses) {
    auto r = calculator_.calculateClassificationMetrics({"spam", "other"}, {"spam", "ham"},
                                                        {"spam", "ham"});
    ASSERT_TRUE(r);
    const auto& m = r.value();
    EXPECT_EQ(m.confusionMatrix.size(), 3u);
    EXPECT_EQ(m.confusionMatrix.at("ham").at("other"), 1);
    EXPECT_DOUBLE_EQ(m.accuracy, 0.5);
}

TEST_F(MetricsCalculatorTest, ClassificationLengthMismatch) {
    auto r = calculator_.calculateClassificationMetrics({"a"}, {"a", "b"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MetricsCalculatorTest, ClassificationFromTestCases) {
    PromptAnalysis analysis;
    analysis.taskType = TaskType::Classification;
    analysis.outputSchema.classes = {"positive", "negative"};

    std::vector<TestCase> cases{classificationCase("positive", "positive"),
                                classificationCase("negative", "positive"),
                                classificationCase("negative", "negative")};
    auto r = calculator_.calculateMetrics(cases, analysis);
    ASSERT_TRUE(r);
    ASSERT_TRUE(r.value().classification.has_value());
    EXPECT_NEAR(r.value().classification->accuracy, 2.0 / 3.0, 1e-12);
    EXPECT_FALSE(r.value().generation.has_value());
}

TEST_F(MetricsCalculatorTest, ClassificationWithoutOutputsOmitsSubMetrics) {
    PromptAnalysis analysis;
    analysis.taskType = TaskType::Classification;
    auto r = calculator_.calculateMetrics({makeCase(TestCaseStatus::Failed, 0.0)}, analysis);
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value().classification.has_value());
    EXPECT_DOUBLE_EQ(r.value().passRate, 0.0);
}

TEST_F(MetricsCalculatorTest, GenerationMetricsFromTestCases) {
    TestCase tc;
    tc.expectedOutput = json{{"text", "the cat sat on the mat"}};
    tc.actualOutput = json{{"text", "the cat sat on the mat"}};
    tc.status = TestCaseStatus::Passed;
    tc.score = 1.0;

    auto r = calculator_.calculateMetrics({tc}, TaskType::Summarization);
    ASSERT_TRUE(r);
    ASSERT_TRUE(r.value().generation.has_value());
    const auto& g = *r.value().generation;
    EXPECT_DOUBLE_EQ(g.bleu, 1.0);
    EXPECT_DOUBLE_EQ(g.rougeL, 1.0);
    EXPECT_DOUBLE_EQ(g.bertScore, g.rouge1);
    EXPECT_DOUBLE_EQ(g.perplexity, 1.0);
}

TEST_F(MetricsCalculatorTest, CategoryPerformance) {
    std::vector<TestCase> cases{
        makeCase(TestCaseStatus::Passed, 1.0, TestCaseCategory::Normal),
        makeCase(TestCaseStatus::Passed, 1.0, TestCaseCategory::EdgeCase),
        makeCase(TestCaseStatus::Failed, 0.0, TestCaseCategory::EdgeCase),
        makeCase(TestCaseStatus::Error, 0.0, TestCaseCategory::Adversarial),
    };
    auto custom = calculator_.calculateCustomMetrics(cases);
    EXPECT_DOUBLE_EQ(custom.at("edge_case_performance"), 0.5);
    EXPECT_DOUBLE_EQ(custom.at("adversarial_performance"), 0.0);
    EXPECT_DOUBLE_EQ(custom.at("error_rate"), 0.5);
    EXPECT_DOUBLE_EQ(categoryPassRate(cases, TestCaseCategory::Normal), 1.0);
    EXPECT_DOUBLE_EQ(categoryPassRate({}, TestCaseCategory::Normal), 0.0);
}

TEST_F(MetricsCalculatorTest, TransformationCompliance) {
    std::vector<TestCase> cases{makeCase(TestCaseStatus::Passed, 1.0),
                                makeCase(TestCaseStatus::Failed, 0.2),
                                makeCase(TestCaseStatus::Error, 0.0),
                                makeCase(TestCaseStatus::Passed, 0.9)};
    auto m = calculator_.calculateTaskSpecificMetrics(cases, TaskType::Transformation);
    EXPECT_DOUBLE_EQ(m.at("format_compliance"), 0.75);
    EXPECT_DOUBLE_EQ(m.at("content_preservation"), 0.5);
}

TEST_F(MetricsCalculatorTest, ExtractLabelAndText) {
    EXPECT_EQ(MetricsCalculator::extractClassLabel(json{{"label", "spam"}}), "spam");
    EXPECT_EQ(MetricsCalculator::extractClassLabel(json{{"result", 3}}), "3");
    EXPECT_EQ(MetricsCalculator::extractClassLabel(json::array()), "");
    EXPECT_EQ(MetricsCalculator::extractText(json{{"answer", "42"}}), "42");
}

TEST_F(MetricsCalculatorTest, SimulatedFlagPropagates) {
    auto tc = makeCase(TestCaseStatus::Passed, 1.0);
    tc.simulated = true;
    auto r = calculator_.calculateMetrics({tc, makeCase(TestCaseStatus::Passed, 1.0)},
                                          TaskType::QuestionAnswering);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().simulated);
    EXPECT_DOUBLE_EQ(r.value().customMetrics.at("simulated_fraction"), 0.5);
    EXPECT_DOUBLE_EQ(r.value().customMetrics.at("answer_accuracy"), 1.0);
}
