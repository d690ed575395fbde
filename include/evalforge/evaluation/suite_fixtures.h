#pragma once

#include <evalforge/evaluation/interfaces.h>
#include <evalforge/evaluation/orchestrator.h>
#include <evalforge/evaluation/types.h>

#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace evalforge::evaluation {

/**
 * @brief A recorded evaluation input loaded from JSON.
 *
 * Holds the prompt, its analysis, the test cases and optionally the outputs the model
 * produced for them ("actual_output"), plus suggestions to replay through the optimizer.
 */
struct EvaluationSuite {
    std::string name;
    std::string description;
    ProjectId projectId{1};
    std::string prompt;
    PromptAnalysis analysis;
    std::vector<TestCase> testCases;
    std::vector<OptimizationSuggestion> suggestions;
    std::optional<TestGeneratorOptions> generator;

    static Result<EvaluationSuite> fromJson(const nlohmann::json& j);
};

// NotFound when the file is missing; InvalidData when it does not parse.
Result<nlohmann::json> readJsonFile(const std::filesystem::path& path);

Result<EvaluationSuite> loadSuite(const std::filesystem::path& path);

class FixtureAnalyzer : public IPromptAnalyzer {
public:
    explicit FixtureAnalyzer(PromptAnalysis analysis) : analysis_(std::move(analysis)) {}

    Result<PromptAnalysis> analyzePrompt(const RunContext& ctx, const std::string& promptText,
                                         const std::vector<Example>& examples) override;

private:
    PromptAnalysis analysis_;
};

class FixtureGenerator : public ITestGenerator {
public:
    explicit FixtureGenerator(std::vector<TestCase> testCases) : testCases_(std::move(testCases)) {}

    Result<std::vector<TestCase>> generateTestCases(const RunContext& ctx,
                                                    const PromptAnalysis& analysis,
                                                    const TestGeneratorOptions& options) override;

private:
    std::vector<TestCase> testCases_;
};

/**
 * @brief Scores recorded outputs instead of calling a model.
 *
 * Fails with NotFound when any case lacks an actual_output, which makes the orchestrator
 * fall back to simulated execution.
 */
class RecordedOutputExecutor : public ITestExecutor {
public:
    explicit RecordedOutputExecutor(TaskType taskType) : taskType_(taskType) {}

    Result<std::vector<TestCase>> executeTestCases(const RunContext& ctx,
                                                   const std::vector<TestCase>& testCases,
                                                   const std::string& promptText,
                                                   const ExecutorOptions& options) override;

    // Similarity of actual to expected in [0, 1] for the given task type.
    static double scoreOutput(TaskType taskType, const nlohmann::json& expected,
                              const nlohmann::json& actual);
    static double passThreshold(TaskType taskType) noexcept;

private:
    TaskType taskType_;
};

class FixtureOptimizer : public IPromptOptimizer {
public:
    explicit FixtureOptimizer(std::vector<OptimizationSuggestion> suggestions)
        : suggestions_(std::move(suggestions)) {}

    Result<std::vector<OptimizationSuggestion>>
    suggestImprovements(const RunContext& ctx, const std::string& promptText,
                        const EvaluationMetrics& metrics,
                        const ErrorAnalysis& errorAnalysis) override;

private:
    std::vector<OptimizationSuggestion> suggestions_;
};

// Analyzer, generator, recorded executor and (when the suite has suggestions) optimizer.
PipelineCollaborators makeSuiteCollaborators(const EvaluationSuite& suite,
                                             std::shared_ptr<IEvaluationRepository> repository);

} // namespace evalforge::evaluation
