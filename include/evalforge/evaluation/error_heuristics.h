#pragma once

#include <evalforge/evaluation/interfaces.h>

#include <vector>

namespace evalforge::evaluation {

/**
 * @brief Error analysis derived only from test-case statuses and categories.
 *
 * Fallback for the error-analysis stage. Failed adversarial cases count as logic errors,
 * failed edge cases as edge-case failures and error-status cases as format errors.
 * Ratios are over all cases and are 0 for an empty batch.
 */
ErrorAnalysis basicErrorAnalysis(const std::vector<TestCase>& testCases);

class HeuristicErrorAnalyzer : public IErrorAnalyzer {
public:
    Result<ErrorAnalysis> analyzeErrors(const RunContext& ctx, const std::vector<TestCase>& testCases,
                                        const PromptAnalysis& analysis) override;
};

} // namespace evalforge::evaluation
