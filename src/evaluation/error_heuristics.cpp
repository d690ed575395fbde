#include <evalforge/evaluation/error_heuristics.h>

#include <algorithm>
#include <chrono>
#include <string>

namespace evalforge::evaluation {

namespace {

void addUnique(std::vector<std::string>& list, const char* message) {
    if (std::find(list.begin(), list.end(), message) == list.end())
        list.emplace_back(message);
}

} // namespace

ErrorAnalysis basicErrorAnalysis(const std::vector<TestCase>& testCases) {
    ErrorAnalysis ea;
    ea.evaluationId = testCases.empty() ? 0 : testCases.front().evaluationId;
    ea.createdAt = std::chrono::system_clock::now();

    int failed = 0;
    int formatErrors = 0;
    int logicErrors = 0;
    for (const auto& tc : testCases) {
        if (tc.status == TestCaseStatus::Failed) {
            ++failed;
            if (tc.category == TestCaseCategory::Adversarial) {
                ++logicErrors;
                ++ea.errorPatterns["adversarial_failure"];
                addUnique(ea.commonErrors, "Failed on adversarial input");
            } else if (tc.category == TestCaseCategory::EdgeCase) {
                ++ea.errorPatterns["edge_case_failure"];
                addUnique(ea.commonErrors, "Failed on edge case");
            }
        } else if (tc.status == TestCaseStatus::Error) {
            ++formatErrors;
            ++ea.errorPatterns["format_error"];
            addUnique(ea.commonErrors, "Format or execution error");
        }
    }

    const double total = static_cast<double>(testCases.size());
    auto ratio = [total](int n) { return total > 0.0 ? n / total : 0.0; };

    ea.ambiguousCases = ratio(failed);
    ea.formatErrors = ratio(formatErrors);
    ea.logicErrors = ratio(logicErrors);
    // Needs repeated runs of the same case to measure.
    ea.inconsistentCases = 0.0;
    ea.errorCategories["classification_errors"] = ratio(logicErrors);
    ea.errorCategories["format_errors"] = ratio(formatErrors);
    ea.errorCategories["edge_case_errors"] = ratio(failed);
    return ea;
}

Result<ErrorAnalysis> HeuristicErrorAnalyzer::analyzeErrors(const RunContext& ctx,
                                                            const std::vector<TestCase>& testCases,
                                                            const PromptAnalysis&) {
    if (auto r = ctx.checkpoint("error analysis"); !r)
        return r.error();
    return basicErrorAnalysis(testCases);
}

} // namespace evalforge::evaluation
