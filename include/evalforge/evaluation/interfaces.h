#pragma once

#include <evalforge/core/run_context.h>
#include <evalforge/core/types.h>
#include <evalforge/evaluation/types.h>

#include <string>
#include <vector>

namespace evalforge::evaluation {

// -----------------------------------------------------------------------------
// Pipeline collaborators
// -----------------------------------------------------------------------------

/**
 * @brief Classifies a prompt's task type and schema.
 *
 * Implementations must return a task type and, for classification prompts, a non-empty
 * output class list.
 */
class IPromptAnalyzer {
public:
    virtual ~IPromptAnalyzer() = default;
    virtual Result<PromptAnalysis> analyzePrompt(const RunContext& ctx,
                                                 const std::string& promptText,
                                                 const std::vector<Example>& examples) = 0;
};

class ITestGenerator {
public:
    virtual ~ITestGenerator() = default;
    virtual Result<std::vector<TestCase>> generateTestCases(const RunContext& ctx,
                                                            const PromptAnalysis& analysis,
                                                            const TestGeneratorOptions& options) = 0;
};

/**
 * @brief Runs test cases against a prompt.
 *
 * Returned cases carry actualOutput, status, score and executedAt.
 */
class ITestExecutor {
public:
    virtual ~ITestExecutor() = default;
    virtual Result<std::vector<TestCase>> executeTestCases(const RunContext& ctx,
                                                           const std::vector<TestCase>& testCases,
                                                           const std::string& promptText,
                                                           const ExecutorOptions& options) = 0;
};

/**
 * @brief Scores a batch of completed test cases.
 *
 * Must fail with InvalidArgument on an empty batch.
 */
class IMetricsCalculator {
public:
    virtual ~IMetricsCalculator() = default;
    virtual Result<EvaluationMetrics> calculateMetrics(const std::vector<TestCase>& testCases,
                                                       const PromptAnalysis& analysis) = 0;
};

class IErrorAnalyzer {
public:
    virtual ~IErrorAnalyzer() = default;
    virtual Result<ErrorAnalysis> analyzeErrors(const RunContext& ctx,
                                                const std::vector<TestCase>& testCases,
                                                const PromptAnalysis& analysis) = 0;
};

class IPromptOptimizer {
public:
    virtual ~IPromptOptimizer() = default;
    virtual Result<std::vector<OptimizationSuggestion>>
    suggestImprovements(const RunContext& ctx, const std::string& promptText,
                        const EvaluationMetrics& metrics, const ErrorAnalysis& errorAnalysis) = 0;
};

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------

/**
 * @brief Evaluation storage scoped by evaluation id.
 *
 * getEvaluation returns the record with its analysis, test cases, metrics and
 * suggestions attached. Implementations serialize concurrent writers.
 */
class IEvaluationRepository {
public:
    virtual ~IEvaluationRepository() = default;

    // Assigns id and timestamps; returns the stored record.
    virtual Result<Evaluation> createEvaluation(const Evaluation& evaluation) = 0;
    virtual Result<Evaluation> getEvaluation(EvaluationId id) = 0;
    virtual Result<void> updateEvaluation(const Evaluation& evaluation) = 0;
    virtual Result<void> deleteEvaluation(EvaluationId id) = 0;
    virtual Result<std::vector<Evaluation>> listEvaluations(ProjectId projectId,
                                                            const ListOptions& options) = 0;

    // Replaces the evaluation's test cases; ids are assigned to new cases.
    virtual Result<std::vector<TestCase>> saveTestCases(EvaluationId id,
                                                        const std::vector<TestCase>& testCases) = 0;
    virtual Result<std::vector<TestCase>> getTestCases(EvaluationId id) = 0;
    virtual Result<void> updateTestCase(const TestCase& testCase) = 0;

    // Upsert by evaluation id.
    virtual Result<void> saveMetrics(EvaluationId id, const EvaluationMetrics& metrics) = 0;
    virtual Result<EvaluationMetrics> getMetrics(EvaluationId id) = 0;

    virtual Result<void> saveSuggestions(EvaluationId id,
                                         const std::vector<OptimizationSuggestion>& suggestions) = 0;
    virtual Result<std::vector<OptimizationSuggestion>> getSuggestions(EvaluationId id) = 0;
    virtual Result<void> updateSuggestion(const OptimizationSuggestion& suggestion) = 0;
};

} // namespace evalforge::evaluation
