#pragma once

#include <evalforge/core/run_context.h>
#include <evalforge/evaluation/interfaces.h>
#include <evalforge/evaluation/orchestrator.h>

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evalforge::evaluation {

// One observed model call, as reported by an agent tracing integration.
struct TrackingEvent {
    std::string id;
    ProjectId projectId{0};
    std::string traceId;
    std::string spanId;
    std::string operationType;
    TimePoint startTime{};
    TimePoint endTime{};
    nlohmann::json input = nlohmann::json::object();
    nlohmann::json output = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
    std::string provider;
    std::string model;

    static Result<TrackingEvent> fromJson(const nlohmann::json& j);
};

struct TriggerConfig {
    bool enabled{true};
    std::size_t minPromptLength{10};
    std::size_t maxPromptLength{10000};
    int triggerThreshold{10}; // executions observed before an evaluation is created
    std::vector<std::string> excludePatterns;
    std::vector<TaskType> includeTaskTypes{TaskType::Classification, TaskType::Generation,
                                           TaskType::Extraction, TaskType::Summarization,
                                           TaskType::QuestionAnswering};
    std::chrono::seconds delayBetweenRuns{std::chrono::hours(1)};
    std::chrono::seconds dedupWindow{std::chrono::hours(24)};
    int dedupLookback{50};
    double similarityThreshold{0.8};
    std::size_t maxSamples{20};
};

struct PromptCandidate {
    ProjectId projectId{0};
    std::string prompt;
    TaskType taskType{TaskType::Generation};
    TimePoint firstSeen{};
    TimePoint lastSeen{};
    int executionCount{0};
    std::vector<nlohmann::json> sampleInputs;
    std::vector<nlohmann::json> sampleOutputs;
};

enum class TriggerOutcome {
    Disabled,
    NoPrompt,
    InvalidLength,
    Excluded,
    AnalysisFailed,
    TaskTypeExcluded,
    Tracked,
    Duplicate,
    Triggered
};

[[nodiscard]] constexpr const char* triggerOutcomeToString(TriggerOutcome o) noexcept {
    switch (o) {
        case TriggerOutcome::Disabled:
            return "disabled";
        case TriggerOutcome::NoPrompt:
            return "no_prompt";
        case TriggerOutcome::InvalidLength:
            return "invalid_length";
        case TriggerOutcome::Excluded:
            return "excluded";
        case TriggerOutcome::AnalysisFailed:
            return "analysis_failed";
        case TriggerOutcome::TaskTypeExcluded:
            return "task_type_excluded";
        case TriggerOutcome::Tracked:
            return "tracked";
        case TriggerOutcome::Duplicate:
            return "duplicate";
        case TriggerOutcome::Triggered:
            return "triggered";
    }
    return "unknown";
}

struct TriggerDecision {
    TriggerOutcome outcome{TriggerOutcome::Tracked};
    std::optional<EvaluationId> evaluationId;
};

/**
 * @brief Creates evaluations for prompts that recur in production traffic.
 *
 * A prompt becomes a candidate once it passes length, exclusion and task-type filters.
 * When its execution count reaches the threshold and it was first seen at least
 * delayBetweenRuns ago, an evaluation is created and run asynchronously unless a
 * similar prompt was evaluated within dedupWindow.
 */
class AutoEvaluationTrigger {
public:
    using Clock = std::function<TimePoint()>;

    AutoEvaluationTrigger(std::shared_ptr<IPromptAnalyzer> analyzer,
                          std::shared_ptr<EvaluationOrchestrator> orchestrator, TriggerConfig cfg,
                          Clock clock = {});

    Result<TriggerDecision> processEvent(const RunContext& ctx, const TrackingEvent& event);

    nlohmann::json stats() const;
    void updateConfig(TriggerConfig cfg);
    TriggerConfig config() const;

    std::optional<PromptCandidate> candidate(ProjectId projectId, const std::string& prompt) const;

    // Prompt text from input, then metadata; chat messages are joined by newline.
    static std::string extractPrompt(const TrackingEvent& event);

    // Position-wise character match ratio of the lowercased, trimmed strings.
    static double similarity(std::string_view a, std::string_view b);

private:
    using CandidateKey = std::pair<ProjectId, std::string>;

    Result<bool> recentlyEvaluated(ProjectId projectId, const std::string& prompt,
                                   const TriggerConfig& cfg) const;
    Result<EvaluationId> trigger(const PromptCandidate& candidate);
    void release(const CandidateKey& key, std::optional<PromptCandidate> restore,
                 const TriggerConfig& cfg);

    std::shared_ptr<IPromptAnalyzer> analyzer_;
    std::shared_ptr<EvaluationOrchestrator> orchestrator_;
    Clock clock_;

    mutable std::mutex mutex_;
    TriggerConfig cfg_;
    std::map<CandidateKey, PromptCandidate> candidates_;
    // Keys whose dedup check or creation is under way; further events only accumulate.
    std::set<CandidateKey> inFlight_;
    std::size_t triggeredCount_{0};
};

} // namespace evalforge::evaluation
