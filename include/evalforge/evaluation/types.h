#pragma once

#include <evalforge/core/types.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evalforge::evaluation {

enum class TaskType {
    Classification,
    Generation,
    Extraction,
    Summarization,
    QuestionAnswering,
    Transformation,
    Completion
};

[[nodiscard]] constexpr const char* taskTypeToString(TaskType t) noexcept {
    switch (t) {
        case TaskType::Classification:
            return "classification";
        case TaskType::Generation:
            return "generation";
        case TaskType::Extraction:
            return "extraction";
        case TaskType::Summarization:
            return "summarization";
        case TaskType::QuestionAnswering:
            return "question_answering";
        case TaskType::Transformation:
            return "transformation";
        case TaskType::Completion:
            return "completion";
    }
    return "unknown";
}

enum class EvaluationStatus { Pending, Running, Completed, Failed };

[[nodiscard]] constexpr const char* evaluationStatusToString(EvaluationStatus s) noexcept {
    switch (s) {
        case EvaluationStatus::Pending:
            return "pending";
        case EvaluationStatus::Running:
            return "running";
        case EvaluationStatus::Completed:
            return "completed";
        case EvaluationStatus::Failed:
            return "failed";
    }
    return "unknown";
}

enum class TestCaseCategory { Normal, EdgeCase, Adversarial };

[[nodiscard]] constexpr const char* testCaseCategoryToString(TestCaseCategory c) noexcept {
    switch (c) {
        case TestCaseCategory::Normal:
            return "normal";
        case TestCaseCategory::EdgeCase:
            return "edge_case";
        case TestCaseCategory::Adversarial:
            return "adversarial";
    }
    return "unknown";
}

enum class TestCaseStatus { Pending, Passed, Failed, Error };

[[nodiscard]] constexpr const char* testCaseStatusToString(TestCaseStatus s) noexcept {
    switch (s) {
        case TestCaseStatus::Pending:
            return "pending";
        case TestCaseStatus::Passed:
            return "passed";
        case TestCaseStatus::Failed:
            return "failed";
        case TestCaseStatus::Error:
            return "error";
    }
    return "unknown";
}

enum class SuggestionType { Clarity, Specificity, Examples, Format, Constraints };

[[nodiscard]] constexpr const char* suggestionTypeToString(SuggestionType t) noexcept {
    switch (t) {
        case SuggestionType::Clarity:
            return "clarity";
        case SuggestionType::Specificity:
            return "specificity";
        case SuggestionType::Examples:
            return "examples";
        case SuggestionType::Format:
            return "format";
        case SuggestionType::Constraints:
            return "constraints";
    }
    return "unknown";
}

enum class SuggestionPriority { Low, Medium, High };

[[nodiscard]] constexpr const char* suggestionPriorityToString(SuggestionPriority p) noexcept {
    switch (p) {
        case SuggestionPriority::Low:
            return "low";
        case SuggestionPriority::Medium:
            return "medium";
        case SuggestionPriority::High:
            return "high";
    }
    return "unknown";
}

enum class SuggestionStatus { Pending, Accepted, Rejected, Applied };

[[nodiscard]] constexpr const char* suggestionStatusToString(SuggestionStatus s) noexcept {
    switch (s) {
        case SuggestionStatus::Pending:
            return "pending";
        case SuggestionStatus::Accepted:
            return "accepted";
        case SuggestionStatus::Rejected:
            return "rejected";
        case SuggestionStatus::Applied:
            return "applied";
    }
    return "unknown";
}

namespace detail {

template <typename E, std::size_t N>
Result<E> parseEnum(std::string_view s, const std::array<E, N>& values,
                    const char* (*toStr)(E) noexcept, const char* what) {
    for (E v : values) {
        if (s == toStr(v))
            return v;
    }
    return Error{ErrorCode::InvalidArgument, fmt::format("unknown {} '{}'", what, s)};
}

} // namespace detail

// Boundary parsers; unknown strings are rejected with InvalidArgument.
Result<TaskType> parseTaskType(std::string_view s);
Result<EvaluationStatus> parseEvaluationStatus(std::string_view s);
Result<TestCaseCategory> parseTestCaseCategory(std::string_view s);
Result<TestCaseStatus> parseTestCaseStatus(std::string_view s);
Result<SuggestionType> parseSuggestionType(std::string_view s);
Result<SuggestionPriority> parseSuggestionPriority(std::string_view s);
Result<SuggestionStatus> parseSuggestionStatus(std::string_view s);

// ISO-8601 UTC, second resolution
std::string formatTimestamp(TimePoint tp);
Result<TimePoint> parseTimestamp(std::string_view s);

struct InputSchema {
    std::string type{"text"}; // text, json, structured
    nlohmann::json fields = nlohmann::json::object();
    std::vector<std::string> required;
    nlohmann::json constraints = nlohmann::json::object();
};

struct OutputSchema {
    std::string type{"text"}; // text, json, classification, structured
    std::string format;
    std::vector<std::string> classes;
    nlohmann::json fields = nlohmann::json::object();
    nlohmann::json constraints = nlohmann::json::object();
};

struct Constraint {
    std::string type; // format, length, value, pattern
    std::string description;
    nlohmann::json rule;
    std::string severity{"error"};
};

struct Example {
    nlohmann::json input = nlohmann::json::object();
    nlohmann::json output = nlohmann::json::object();
    std::string explanation;
};

struct PromptAnalysis {
    int64_t id{0};
    EvaluationId evaluationId{0};
    std::string promptText;
    TaskType taskType{TaskType::Generation};
    InputSchema inputSchema;
    OutputSchema outputSchema;
    std::vector<Constraint> constraints;
    std::vector<Example> examples;
    double confidence{0.0};

    [[nodiscard]] nlohmann::json toJson() const;
    static Result<PromptAnalysis> fromJson(const nlohmann::json& j);
};

struct TestCase {
    int64_t id{0};
    EvaluationId evaluationId{0};
    std::string name;
    std::string description;
    nlohmann::json input = nlohmann::json::object();
    nlohmann::json expectedOutput = nlohmann::json::object();
    std::optional<nlohmann::json> actualOutput;
    TestCaseCategory category{TestCaseCategory::Normal};
    double weight{1.0};
    TestCaseStatus status{TestCaseStatus::Pending};
    double score{0.0};
    std::optional<TimePoint> executedAt;
    TimePoint createdAt{};
    // Result produced by the offline simulation policy, not by a model.
    bool simulated{false};

    [[nodiscard]] nlohmann::json toJson() const;
    static Result<TestCase> fromJson(const nlohmann::json& j);
};

struct ClassificationMetrics {
    double accuracy{0.0};
    std::map<std::string, double> precision;
    std::map<std::string, double> recall;
    std::map<std::string, double> f1Score;
    double macroF1{0.0};
    double weightedF1{0.0};
    // true class -> predicted class -> count
    std::map<std::string, std::map<std::string, int>> confusionMatrix;
    std::map<std::string, int> support;

    [[nodiscard]] nlohmann::json toJson() const;
};

struct GenerationMetrics {
    double bleu{0.0};
    double rouge1{0.0};
    double rouge2{0.0};
    double rougeL{0.0};
    double bertScore{0.0};  // approximated as rouge1
    double perplexity{0.0}; // approximated as max(1, 100 - 100 * rouge1)
    double diversity{0.0};
    double coherence{0.0};
    double relevance{0.0};

    [[nodiscard]] nlohmann::json toJson() const;
};

struct EvaluationMetrics {
    int64_t id{0};
    EvaluationId evaluationId{0};
    double overallScore{0.0};
    double passRate{0.0};
    int passedCount{0};
    int totalCount{0};
    std::optional<ClassificationMetrics> classification;
    std::optional<GenerationMetrics> generation;
    std::map<std::string, double> customMetrics;
    TimePoint calculatedAt{};
    bool simulated{false};

    [[nodiscard]] nlohmann::json toJson() const;
};

struct ErrorAnalysis {
    int64_t id{0};
    EvaluationId evaluationId{0};
    std::vector<std::string> commonErrors;
    std::map<std::string, int> errorPatterns;
    double ambiguousCases{0.0};
    double formatErrors{0.0};
    double logicErrors{0.0};
    double inconsistentCases{0.0};
    std::map<std::string, double> errorCategories;
    TimePoint createdAt{};

    [[nodiscard]] nlohmann::json toJson() const;
};

struct OptimizationSuggestion {
    int64_t id{0};
    EvaluationId evaluationId{0};
    SuggestionType type{SuggestionType::Clarity};
    std::string title;
    std::string description;
    std::string oldPrompt;
    std::string newPrompt;
    double expectedImpact{0.0};
    double confidence{0.0};
    SuggestionPriority priority{SuggestionPriority::Medium};
    SuggestionStatus status{SuggestionStatus::Pending};
    std::string reasoning;
    TimePoint createdAt{};

    [[nodiscard]] nlohmann::json toJson() const;
    static Result<OptimizationSuggestion> fromJson(const nlohmann::json& j);
};

/**
 * @brief Test case counts requested from the generator.
 */
struct TestGeneratorOptions {
    int normalCases{15};
    int edgeCases{8};
    int adversarialCases{5};
    std::optional<uint64_t> seed;
};

/**
 * @brief Execution bounds handed to the executor.
 *
 * timeoutSeconds bounds one test case; the orchestrator bounds the whole stage.
 */
struct ExecutorOptions {
    int maxConcurrency{3};
    int timeoutSeconds{30};
    int retryCount{1};
};

struct EvaluationOptions {
    std::string name;
    std::string description;
    TestGeneratorOptions generator;
    ExecutorOptions executor;
    bool autoSuggest{true};
};

struct Evaluation {
    EvaluationId id{0};
    ProjectId projectId{0};
    std::string name;
    std::string description;
    EvaluationStatus status{EvaluationStatus::Pending};
    double progress{0.0};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    TimePoint createdAt{};
    TimePoint updatedAt{};
    // Reason for the failed status, empty otherwise.
    std::string errorMessage;

    // Fixed at creation, applied when the pipeline runs.
    TestGeneratorOptions generatorOptions;
    ExecutorOptions executorOptions;
    bool autoSuggest{true};

    std::optional<PromptAnalysis> analysis;
    std::vector<TestCase> testCases;
    std::optional<EvaluationMetrics> metrics;
    std::optional<ErrorAnalysis> errorAnalysis;
    std::vector<OptimizationSuggestion> suggestions;

    [[nodiscard]] nlohmann::json toJson() const;
};

struct ListOptions {
    int limit{50};
    int offset{0};
    std::optional<EvaluationStatus> status;
    std::string orderBy{"created_at"}; // created_at, updated_at, id
    bool sortDesc{true};
};

} // namespace evalforge::evaluation
