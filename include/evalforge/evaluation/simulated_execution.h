#pragma once

#include <evalforge/evaluation/types.h>

#include <cstdint>
#include <random>
#include <vector>

namespace evalforge::evaluation {

/**
 * @brief Offline stand-in for test execution.
 *
 * Used only when no executor is wired or the executor fails. Classification cases copy
 * the expected class with probability 0.8, 0.6 or 0.4 for normal, edge and adversarial
 * cases; other task types receive a perturbed copy of the expected output and a bounded
 * pseudo-random score. Every returned case has simulated set. The same seed and input
 * always produce the same results.
 */
class SimulatedExecutionPolicy {
public:
    explicit SimulatedExecutionPolicy(uint64_t seed) : rng_(seed) {}

    std::vector<TestCase> simulate(const std::vector<TestCase>& testCases,
                                   const PromptAnalysis& analysis);

    static double correctProbability(TestCaseCategory category) noexcept;
    static double difficultyMultiplier(TestCaseCategory category) noexcept;

private:
    double next();
    nlohmann::json simulateOutput(const TestCase& tc, const PromptAnalysis& analysis);
    void score(TestCase& tc, const PromptAnalysis& analysis);

    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace evalforge::evaluation
