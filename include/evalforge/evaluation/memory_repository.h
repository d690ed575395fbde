#pragma once

#include <evalforge/evaluation/custom_metrics.h>
#include <evalforge/evaluation/interfaces.h>

#include <map>
#include <mutex>

namespace evalforge::evaluation {

/**
 * @brief Process-local evaluation store.
 *
 * Test cases, metrics and suggestions are written through their dedicated calls;
 * updateEvaluation leaves them untouched. All operations take one mutex.
 */
class InMemoryEvaluationRepository : public IEvaluationRepository {
public:
    Result<Evaluation> createEvaluation(const Evaluation& evaluation) override;
    Result<Evaluation> getEvaluation(EvaluationId id) override;
    Result<void> updateEvaluation(const Evaluation& evaluation) override;
    Result<void> deleteEvaluation(EvaluationId id) override;
    Result<std::vector<Evaluation>> listEvaluations(ProjectId projectId,
                                                    const ListOptions& options) override;

    Result<std::vector<TestCase>> saveTestCases(EvaluationId id,
                                                const std::vector<TestCase>& testCases) override;
    Result<std::vector<TestCase>> getTestCases(EvaluationId id) override;
    Result<void> updateTestCase(const TestCase& testCase) override;

    Result<void> saveMetrics(EvaluationId id, const EvaluationMetrics& metrics) override;
    Result<EvaluationMetrics> getMetrics(EvaluationId id) override;

    Result<void> saveSuggestions(EvaluationId id,
                                 const std::vector<OptimizationSuggestion>& suggestions) override;
    Result<std::vector<OptimizationSuggestion>> getSuggestions(EvaluationId id) override;
    Result<void> updateSuggestion(const OptimizationSuggestion& suggestion) override;

    std::size_t size() const;

private:
    Evaluation* find(EvaluationId id);

    mutable std::mutex mutex_;
    std::map<EvaluationId, Evaluation> evaluations_;
    EvaluationId nextEvaluationId_{0};
    int64_t nextTestCaseId_{0};
    int64_t nextMetricsId_{0};
    int64_t nextSuggestionId_{0};
};

class InMemoryCustomMetricStore : public ICustomMetricStore {
public:
    Result<std::vector<CustomMetric>> listMetrics(ProjectId projectId, bool enabledOnly) override;
    Result<CustomMetric> saveMetric(const CustomMetric& metric) override;
    Result<void> deleteMetric(ProjectId projectId, MetricId metricId) override;

private:
    std::mutex mutex_;
    std::map<MetricId, CustomMetric> metrics_;
    MetricId nextId_{0};
};

} // namespace evalforge::evaluation
