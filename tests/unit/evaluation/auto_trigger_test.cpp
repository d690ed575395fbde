#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <evalforge/evaluation/auto_trigger.h>
#include <evalforge/evaluation/memory_repository.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace evalforge;
using namespace evalforge::evaluation;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

class StubAnalyzer : public IPromptAnalyzer {
public:
    Result<PromptAnalysis> analyzePrompt(const RunContext&, const std::string& promptText,
                                         const std::vector<Example>&) override {
        ++calls;
        if (fail.load())
            return Error{ErrorCode::InternalError, "analysis backend down"};
        PromptAnalysis a;
        a.promptText = promptText;
        a.taskType = taskType.load();
        a.confidence = 0.8;
        return a;
    }

    std::atomic<TaskType> taskType{TaskType::Generation};
    std::atomic<bool> fail{false};
    std::atomic<int> calls{0};
};

class StubGenerator : public ITestGenerator {
public:
    Result<std::vector<TestCase>> generateTestCases(const RunContext&, const PromptAnalysis&,
                                                    const TestGeneratorOptions&) override {
        TestCase tc;
        tc.name = "summary";
        tc.input = {{"text", "a long article"}};
        tc.expectedOutput = {{"text", "short summary"}};
        return std::vector<TestCase>{tc};
    }
};

// Widens the window between the dedup lookup and evaluation creation.
class SlowListRepository : public InMemoryEvaluationRepository {
public:
    Result<std::vector<Evaluation>> listEvaluations(ProjectId projectId,
                                                    const ListOptions& options) override {
        std::this_thread::sleep_for(100ms);
        return InMemoryEvaluationRepository::listEvaluations(projectId, options);
    }
};

TrackingEvent eventFor(const std::string& prompt, ProjectId project = 1) {
    TrackingEvent ev;
    ev.id = "evt";
    ev.projectId = project;
    ev.input = {{"prompt", prompt}};
    ev.output = {{"text", "ok"}};
    return ev;
}

const std::string kPrompt = "Summarize the customer ticket in two sentences";

} // namespace

class AutoTriggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        analyzer_ = std::make_shared<StubAnalyzer>();
        repo_ = std::make_shared<InMemoryEvaluationRepository>();
        PipelineCollaborators c;
        c.analyzer = analyzer_;
        c.generator = std::make_shared<StubGenerator>();
        c.repository = repo_;
        orchestrator_ = std::make_shared<EvaluationOrchestrator>(c, EvaluationOrchestrator::Config{});
        now_ = std::chrono::system_clock::now();
    }

    std::unique_ptr<AutoEvaluationTrigger> makeTrigger(TriggerConfig cfg) {
        return std::make_unique<AutoEvaluationTrigger>(analyzer_, orchestrator_, std::move(cfg),
                                                       [this] { return now_; });
    }

    static TriggerConfig quickConfig() {
        TriggerConfig cfg;
        cfg.triggerThreshold = 3;
        cfg.delayBetweenRuns = std::chrono::hours(1);
        return cfg;
    }

    std::shared_ptr<StubAnalyzer> analyzer_;
    std::shared_ptr<InMemoryEvaluationRepository> repo_;
    std::shared_ptr<EvaluationOrchestrator> orchestrator_;
    TimePoint now_{};
};

TEST(AutoTriggerStaticTest, ExtractPromptPrefersInputFields) {
    TrackingEvent ev;
    ev.input = {{"query", "from query"}, {"prompt", "from prompt"}};
    ev.metadata = {{"prompt", "from metadata"}};
    EXPECT_EQ(AutoEvaluationTrigger::extractPrompt(ev), "from prompt");

    ev.input = {{"unrelated", 1}};
    EXPECT_EQ(AutoEvaluationTrigger::extractPrompt(ev), "from metadata");

    ev.metadata = json::object();
    EXPECT_TRUE(AutoEvaluationTrigger::extractPrompt(ev).empty());
}

TEST(AutoTriggerStaticTest, ExtractPromptJoinsMessages) {
    TrackingEvent ev;
    ev.input = {{"messages", json::array({{{"role", "system"}, {"content", "You are terse."}},
                                          {{"role", "user"}, {"content", "Summarize this."}}})}};
    EXPECT_EQ(AutoEvaluationTrigger::extractPrompt(ev), "You are terse.\nSummarize this.");

    ev.input = {{"instruction", {{"step", 1}}}};
    EXPECT_EQ(AutoEvaluationTrigger::extractPrompt(ev), R"({"step":1})");
}

TEST(AutoTriggerStaticTest, SimilarityIsPositional) {
    EXPECT_DOUBLE_EQ(AutoEvaluationTrigger::similarity("  Hello ", "hello"), 1.0);
    EXPECT_DOUBLE_EQ(AutoEvaluationTrigger::similarity("", ""), 1.0);
    EXPECT_DOUBLE_EQ(AutoEvaluationTrigger::similarity("abcd", "abxy"), 0.5);
    EXPECT_DOUBLE_EQ(AutoEvaluationTrigger::similarity("ab", "abcd"), 0.5);
    EXPECT_DOUBLE_EQ(AutoEvaluationTrigger::similarity("abc", ""), 0.0);
}

TEST(AutoTriggerStaticTest, TrackingEventFromJson) {
    json j = {{"id", "e1"},
              {"project_id", 7},
              {"trace_id", "t"},
              {"operation_type", "llm_call"},
              {"start_time", "2024-03-01T10:00:00Z"},
              {"input", {{"prompt", "Classify"}}},
              {"metadata", nullptr},
              {"model", "m"}};
    auto ev = TrackingEvent::fromJson(j);
    ASSERT_TRUE(ev);
    EXPECT_EQ(ev.value().projectId, 7);
    EXPECT_EQ(ev.value().operationType, "llm_call");
    EXPECT_EQ(ev.value().input["prompt"], "Classify");
    EXPECT_TRUE(ev.value().metadata.is_object());
    EXPECT_NE(ev.value().startTime, TimePoint{});

    EXPECT_EQ(TrackingEvent::fromJson(json::array()).error().code, ErrorCode::InvalidArgument);
    j["start_time"] = "yesterday";
    EXPECT_FALSE(TrackingEvent::fromJson(j));
}

TEST_F(AutoTriggerTest, FiltersRejectEarly) {
    TriggerConfig cfg = quickConfig();
    cfg.excludePatterns = {"PASSWORD"};
    auto trigger = makeTrigger(cfg);
    auto ctx = RunContext::background();

    TrackingEvent empty;
    EXPECT_EQ(trigger->processEvent(ctx, empty).value().outcome, TriggerOutcome::NoPrompt);
    EXPECT_EQ(trigger->processEvent(ctx, eventFor("short")).value().outcome,
              TriggerOutcome::InvalidLength);
    EXPECT_EQ(trigger->processEvent(ctx, eventFor("Reset the user password for me")).value().outcome,
              TriggerOutcome::Excluded);
    EXPECT_EQ(analyzer_->calls.load(), 0);

    cfg.enabled = false;
    trigger->updateConfig(cfg);
    EXPECT_EQ(trigger->processEvent(ctx, eventFor(kPrompt)).value().outcome,
              TriggerOutcome::Disabled);
}

TEST_F(AutoTriggerTest, AnalysisFailureAndExcludedTaskTypesAreNotTracked) {
    auto trigger = makeTrigger(quickConfig());
    auto ctx = RunContext::background();

    analyzer_->fail = true;
    EXPECT_EQ(trigger->processEvent(ctx, eventFor(kPrompt)).value().outcome,
              TriggerOutcome::AnalysisFailed);

    analyzer_->fail = false;
    analyzer_->taskType = TaskType::Completion;
    EXPECT_EQ(trigger->processEvent(ctx, eventFor(kPrompt)).value().outcome,
              TriggerOutcome::TaskTypeExcluded);
    EXPECT_FALSE(trigger->candidate(1, kPrompt).has_value());
}

TEST_F(AutoTriggerTest, CancelledContextStopsProcessing) {
    auto trigger = makeTrigger(quickConfig());
    std::stop_source source;
    source.request_stop();
    auto r = trigger->processEvent(RunContext{source.get_token()}, eventFor(kPrompt));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST_F(AutoTriggerTest, TriggersAfterThresholdAndDelay) {
    auto trigger = makeTrigger(quickConfig());
    auto ctx = RunContext::background();

    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(trigger->processEvent(ctx, eventFor(kPrompt)).value().outcome,
                  TriggerOutcome::Tracked);
    auto cand = trigger->candidate(1, kPrompt);
    ASSERT_TRUE(cand.has_value());
    EXPECT_EQ(cand->executionCount, 3);
    EXPECT_EQ(cand->sampleInputs.size(), 3u);
    EXPECT_EQ(trigger->stats()["tracked_candidates"], 1);

    now_ += 2h;
    auto decision = trigger->processEvent(ctx, eventFor(kPrompt));
    ASSERT_TRUE(decision);
    EXPECT_EQ(decision.value().outcome, TriggerOutcome::Triggered);
    ASSERT_TRUE(decision.value().evaluationId.has_value());
    EXPECT_FALSE(trigger->candidate(1, kPrompt).has_value());
    EXPECT_EQ(trigger->stats()["triggered_evaluations"], 1);

    ASSERT_TRUE(orchestrator_->waitForIdle(10s));
    auto e = orchestrator_->getEvaluation(*decision.value().evaluationId);
    ASSERT_TRUE(e);
    EXPECT_EQ(e.value().status, EvaluationStatus::Completed);
    EXPECT_EQ(e.value().name.rfind("Auto-evaluation ", 0), 0u);
    EXPECT_NE(e.value().description.find("after 4 executions"), std::string::npos);
    EXPECT_EQ(e.value().generatorOptions.normalCases, 15);
    EXPECT_EQ(e.value().generatorOptions.edgeCases, 8);
    EXPECT_EQ(e.value().generatorOptions.adversarialCases, 5);
}

TEST_F(AutoTriggerTest, CandidatesAreScopedByProject) {
    TriggerConfig cfg = quickConfig();
    cfg.delayBetweenRuns = 0s;
    cfg.triggerThreshold = 2;
    auto trigger = makeTrigger(cfg);
    auto ctx = RunContext::background();

    EXPECT_EQ(trigger->processEvent(ctx, eventFor(kPrompt, 1)).value().outcome,
              TriggerOutcome::Tracked);
    EXPECT_EQ(trigger->processEvent(ctx, eventFor(kPrompt, 2)).value().outcome,
              TriggerOutcome::Tracked);
    EXPECT_EQ(trigger->processEvent(ctx, eventFor(kPrompt, 1)).value().outcome,
              TriggerOutcome::Triggered);
    EXPECT_TRUE(trigger->candidate(2, kPrompt).has_value());
    ASSERT_TRUE(orchestrator_->waitForIdle(10s));
}

TEST_F(AutoTriggerTest, SimilarRecentEvaluationSuppressesTrigger) {
    TriggerConfig cfg = quickConfig();
    cfg.delayBetweenRuns = 0s;
    cfg.triggerThreshold = 1;
    auto trigger = makeTrigger(cfg);
    auto ctx = RunContext::background();

    ASSERT_EQ(trigger->processEvent(ctx, eventFor(kPrompt)).value().outcome,
              TriggerOutcome::Triggered);
    ASSERT_TRUE(orchestrator_->waitForIdle(10s));

    // One trailing character differs; still above the similarity threshold.
    auto near = kPrompt + ".";
    EXPECT_EQ(trigger->processEvent(ctx, eventFor(near)).value().outcome,
              TriggerOutcome::Duplicate);
    EXPECT_FALSE(trigger->candidate(1, near).has_value());

    now_ += 25h;
    EXPECT_EQ(trigger->processEvent(ctx, eventFor(near)).value().outcome,
              TriggerOutcome::Triggered);
    ASSERT_TRUE(orchestrator_->waitForIdle(10s));
    EXPECT_EQ(repo_->size(), 2u);
}

TEST_F(AutoTriggerTest, ConcurrentEventsForOnePromptTriggerOnce) {
    auto slowRepo = std::make_shared<SlowListRepository>();
    PipelineCollaborators c;
    c.analyzer = analyzer_;
    c.generator = std::make_shared<StubGenerator>();
    c.repository = slowRepo;
    auto orchestrator =
        std::make_shared<EvaluationOrchestrator>(c, EvaluationOrchestrator::Config{});

    TriggerConfig cfg = quickConfig();
    cfg.triggerThreshold = 1;
    cfg.delayBetweenRuns = 0s;
    AutoEvaluationTrigger trigger(analyzer_, orchestrator, cfg, [this] { return now_; });

    std::atomic<int> triggered{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&] {
            auto decision = trigger.processEvent(RunContext::background(), eventFor(kPrompt));
            if (!decision)
                ++failures;
            else if (decision.value().outcome == TriggerOutcome::Triggered)
                ++triggered;
        });
    }
    for (auto& w : workers)
        w.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(triggered.load(), 1);
    ASSERT_TRUE(orchestrator->waitForIdle(10s));
    EXPECT_EQ(slowRepo->size(), 1u);
    EXPECT_EQ(trigger.stats()["triggered_evaluations"], 1);
}

TEST_F(AutoTriggerTest, StatsReflectConfiguration) {
    TriggerConfig cfg = quickConfig();
    cfg.excludePatterns = {"secret"};
    cfg.includeTaskTypes = {TaskType::Classification};
    auto trigger = makeTrigger(cfg);
    auto s = trigger->stats();
    EXPECT_EQ(s["enabled"], true);
    EXPECT_EQ(s["trigger_threshold"], 3);
    EXPECT_EQ(s["delay_between_runs_seconds"], 3600);
    EXPECT_EQ(s["included_task_types"], json::array({"classification"}));
    EXPECT_EQ(s["exclude_patterns"], json::array({"secret"}));
    EXPECT_EQ(s["triggered_evaluations"], 0);
}
