#pragma once

#include <evalforge/evaluation/interfaces.h>
#include <evalforge/evaluation/types.h>

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace evalforge::evaluation {

/**
 * @brief Pure metric computation over completed test cases.
 *
 * Holds no state, so one instance can serve concurrent evaluations.
 *
 * Extraction, question answering and transformation tasks have no ground-truth
 * entity or answer matching; their metrics are category pass-rate proxies.
 */
class MetricsCalculator : public IMetricsCalculator {
public:
    Result<EvaluationMetrics> calculateMetrics(const std::vector<TestCase>& testCases,
                                               const PromptAnalysis& analysis) override;

    Result<EvaluationMetrics> calculateMetrics(const std::vector<TestCase>& testCases,
                                               TaskType taskType);

    /**
     * @brief Confusion matrix and per-class precision, recall and F1.
     *
     * When @p classes is empty the class set is inferred from the labels and sorted.
     * Labels outside a supplied list are appended to the class set.
     */
    Result<ClassificationMetrics>
    calculateClassificationMetrics(const std::vector<std::string>& predictions,
                                   const std::vector<std::string>& groundTruth,
                                   std::vector<std::string> classes = {}) const;

    // Per-pair BLEU/ROUGE/diversity/coherence/relevance averaged over all pairs.
    Result<GenerationMetrics> calculateGenerationMetrics(const std::vector<std::string>& predictions,
                                                         const std::vector<std::string>& references) const;

    // error_rate, edge_case_performance, adversarial_performance, weighted_score,
    // simulated_fraction
    std::map<std::string, double> calculateCustomMetrics(const std::vector<TestCase>& testCases) const;

    std::map<std::string, double> calculateTaskSpecificMetrics(const std::vector<TestCase>& testCases,
                                                               TaskType taskType) const;

    // First present field among class, label, sentiment, category, prediction, result.
    static std::string extractClassLabel(const nlohmann::json& output);
    // First present field among text, result, output, response, summary, answer, generated.
    static std::string extractText(const nlohmann::json& output);
};

// Pass rate of the cases in @p category; 0 when the category is absent.
double categoryPassRate(const std::vector<TestCase>& testCases, TestCaseCategory category);

} // namespace evalforge::evaluation
