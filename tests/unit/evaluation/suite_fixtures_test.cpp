#include <gtest/gtest.h>

#include <evalforge/evaluation/memory_repository.h>
#include <evalforge/evaluation/suite_fixtures.h>

#include "../../common/test_helpers.h"

using namespace evalforge;
using namespace evalforge::evaluation;
using json = nlohmann::json;

namespace {

json sentimentSuite() {
    return json{
        {"name", "sentiment"},
        {"prompt", "Classify the sentiment of the review as positive or negative."},
        {"analysis",
         {{"task_type", "classification"},
          {"output_schema", {{"type", "classification"}, {"classes", {"negative", "positive"}}}}}},
        {"test_cases",
         json::array({{{"name", "happy"},
                       {"input", {{"text", "Loved it"}}},
                       {"expected_output", {{"label", "positive"}}},
                       {"actual_output", {{"label", "Positive"}}}},
                      {{"name", "angry"},
                       {"input", {{"text", "Broke on day one"}}},
                       {"expected_output", {{"label", "negative"}}},
                       {"actual_output", {{"label", "positive"}}}}})},
        {"suggestions", json::array({{{"title", "Add a neutral class"}, {"type", "examples"}}})},
        {"options", {{"seed", 9}}}};
}

} // namespace

TEST(SuiteFixturesTest, ParsesSuite) {
    auto suite = EvaluationSuite::fromJson(sentimentSuite());
    ASSERT_TRUE(suite) << suite.error().message;
    EXPECT_EQ(suite.value().name, "sentiment");
    EXPECT_EQ(suite.value().analysis.taskType, TaskType::Classification);
    EXPECT_EQ(suite.value().analysis.promptText, suite.value().prompt);
    EXPECT_EQ(suite.value().testCases.size(), 2u);
    EXPECT_EQ(suite.value().suggestions.size(), 1u);
    ASSERT_TRUE(suite.value().generator.has_value());
    EXPECT_EQ(suite.value().generator->seed, 9u);
}

TEST(SuiteFixturesTest, RejectsIncompleteSuites) {
    auto noPrompt = sentimentSuite();
    noPrompt.erase("prompt");
    EXPECT_EQ(EvaluationSuite::fromJson(noPrompt).error().code, ErrorCode::InvalidArgument);

    auto noCases = sentimentSuite();
    noCases["test_cases"] = json::array();
    EXPECT_EQ(EvaluationSuite::fromJson(noCases).error().code, ErrorCode::InvalidArgument);

    auto noAnalysis = sentimentSuite();
    noAnalysis.erase("analysis");
    EXPECT_FALSE(EvaluationSuite::fromJson(noAnalysis));
}

TEST(SuiteFixturesTest, LoadSuiteReportsFileErrors) {
    evalforge::tests::TempDirScope dir;
    EXPECT_EQ(loadSuite(dir.path() / "missing.json").error().code, ErrorCode::NotFound);

    auto bad = evalforge::tests::write_file(dir.path() / "bad.json", "{ not json");
    EXPECT_EQ(loadSuite(bad).error().code, ErrorCode::InvalidData);

    auto good = evalforge::tests::write_file(dir.path() / "good.json", sentimentSuite().dump());
    EXPECT_TRUE(loadSuite(good));
}

TEST(SuiteFixturesTest, ScoreOutputByTaskType) {
    EXPECT_DOUBLE_EQ(RecordedOutputExecutor::scoreOutput(
                         TaskType::Classification, {{"label", "Yes"}}, {{"label", "yes"}}),
                     1.0);
    EXPECT_DOUBLE_EQ(RecordedOutputExecutor::scoreOutput(TaskType::Classification,
                                                         {{"label", "yes"}}, {{"label", "no"}}),
                     0.0);
    EXPECT_DOUBLE_EQ(RecordedOutputExecutor::scoreOutput(TaskType::Summarization,
                                                         {{"text", "the cat sat"}},
                                                         {{"text", "the cat sat"}}),
                     1.0);
    EXPECT_DOUBLE_EQ(RecordedOutputExecutor::scoreOutput(TaskType::Extraction,
                                                         {{"name", "Ann"}, {"age", 30}},
                                                         {{"name", "Ann"}, {"age", 31}}),
                     0.5);
    EXPECT_DOUBLE_EQ(RecordedOutputExecutor::passThreshold(TaskType::Classification), 1.0);
    EXPECT_DOUBLE_EQ(RecordedOutputExecutor::passThreshold(TaskType::Generation), 0.5);
    EXPECT_DOUBLE_EQ(RecordedOutputExecutor::passThreshold(TaskType::Extraction), 0.8);
}

TEST(SuiteFixturesTest, RecordedOutputsDriveThePipeline) {
    auto suite = EvaluationSuite::fromJson(sentimentSuite()).value();
    auto repo = std::make_shared<InMemoryEvaluationRepository>();
    EvaluationOrchestrator orch(makeSuiteCollaborators(suite, repo), {});

    auto created = orch.createEvaluation(suite.projectId, suite.prompt, orch.defaultOptions());
    ASSERT_TRUE(created);
    auto run = orch.runEvaluation(created.value().id);
    ASSERT_TRUE(run) << run.error().message;

    const auto& e = run.value();
    ASSERT_TRUE(e.metrics.has_value());
    EXPECT_FALSE(e.metrics->simulated);
    EXPECT_DOUBLE_EQ(e.metrics->passRate, 0.5);
    ASSERT_TRUE(e.metrics->classification.has_value());
    ASSERT_EQ(e.suggestions.size(), 1u);
    EXPECT_EQ(e.suggestions[0].oldPrompt, suite.prompt);
}

TEST(SuiteFixturesTest, MissingRecordedOutputFallsBackToSimulation) {
    auto doc = sentimentSuite();
    doc["test_cases"][1].erase("actual_output");
    auto suite = EvaluationSuite::fromJson(doc).value();
    auto repo = std::make_shared<InMemoryEvaluationRepository>();
    EvaluationOrchestrator orch(makeSuiteCollaborators(suite, repo), {});

    auto created = orch.createEvaluation(suite.projectId, suite.prompt, orch.defaultOptions());
    ASSERT_TRUE(created);
    auto run = orch.runEvaluation(created.value().id);
    ASSERT_TRUE(run);
    EXPECT_TRUE(run.value().metrics->simulated);
}
