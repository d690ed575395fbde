#include <gtest/gtest.h>
#include <evalforge/evaluation/evaluation_fsm.h>

#include <vector>

using namespace evalforge::evaluation;

TEST(EvaluationFsmTest, HappyPathReportsEveryStage) {
    EvaluationFsm fsm;
    std::vector<double> seen;
    fsm.set_on_state_change([&](EvaluationStatus, double p) { seen.push_back(p); });

    ASSERT_TRUE(fsm.start());
    for (auto stage : {PipelineStage::Analyze, PipelineStage::Generate, PipelineStage::Execute,
                       PipelineStage::Metrics, PipelineStage::ErrorAnalysis,
                       PipelineStage::Optimize})
        ASSERT_TRUE(fsm.advance(stage));
    ASSERT_TRUE(fsm.complete());

    EXPECT_EQ(fsm.state(), EvaluationStatus::Completed);
    EXPECT_DOUBLE_EQ(fsm.progress(), 100.0);
    EXPECT_EQ(seen, (std::vector<double>{0, 20, 40, 60, 80, 90, 100, 100}));
}

TEST(EvaluationFsmTest, StartOnlyFromPending) {
    EvaluationFsm running(EvaluationStatus::Running);
    EXPECT_FALSE(running.start());
    EvaluationFsm failed(EvaluationStatus::Failed);
    EXPECT_FALSE(failed.start());
    EvaluationFsm done(EvaluationStatus::Completed);
    EXPECT_FALSE(done.start());
}

TEST(EvaluationFsmTest, ProgressIsMonotonic) {
    EvaluationFsm fsm;
    ASSERT_TRUE(fsm.start());
    ASSERT_TRUE(fsm.advance(PipelineStage::Execute));
    EXPECT_FALSE(fsm.advance(PipelineStage::Analyze));
    EXPECT_DOUBLE_EQ(fsm.progress(), 60.0);
}

TEST(EvaluationFsmTest, TerminalStatesAreFinal) {
    EvaluationFsm fsm;
    EXPECT_FALSE(fsm.advance(PipelineStage::Analyze));
    EXPECT_FALSE(fsm.complete());

    ASSERT_TRUE(fsm.start());
    ASSERT_TRUE(fsm.advance(PipelineStage::Generate));
    ASSERT_TRUE(fsm.fail());
    EXPECT_EQ(fsm.state(), EvaluationStatus::Failed);
    EXPECT_DOUBLE_EQ(fsm.progress(), 40.0);

    EXPECT_FALSE(fsm.fail());
    EXPECT_FALSE(fsm.complete());
    EXPECT_FALSE(fsm.advance(PipelineStage::Optimize));
}

TEST(EvaluationFsmTest, StageTables) {
    EXPECT_STREQ(pipelineStageToString(PipelineStage::ErrorAnalysis), "error_analysis");
    EXPECT_TRUE(isDegradable(PipelineStage::Execute));
    EXPECT_TRUE(isDegradable(PipelineStage::Optimize));
    EXPECT_FALSE(isDegradable(PipelineStage::Generate));
    EXPECT_FALSE(isDegradable(PipelineStage::Metrics));
}
