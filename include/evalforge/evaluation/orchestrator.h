#pragma once

#include <evalforge/core/run_context.h>
#include <evalforge/evaluation/evaluation_fsm.h>
#include <evalforge/evaluation/interfaces.h>
#include <evalforge/evaluation/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio/thread_pool.hpp>

namespace evalforge::evaluation {

struct EvaluationProgress {
    EvaluationStatus status{EvaluationStatus::Pending};
    double progress{0.0};
};

/**
 * @brief Collaborators wired into the pipeline.
 *
 * analyzer, generator and repository are required. A missing executor selects
 * simulated execution, a missing error analyzer selects the heuristic analysis and a
 * missing optimizer yields no suggestions. calculator defaults to MetricsCalculator.
 */
struct PipelineCollaborators {
    std::shared_ptr<IPromptAnalyzer> analyzer;
    std::shared_ptr<ITestGenerator> generator;
    std::shared_ptr<ITestExecutor> executor;
    std::shared_ptr<IMetricsCalculator> calculator;
    std::shared_ptr<IErrorAnalyzer> errorAnalyzer;
    std::shared_ptr<IPromptOptimizer> optimizer;
    std::shared_ptr<IEvaluationRepository> repository;
};

class EvaluationOrchestrator {
public:
    struct Config {
        TestGeneratorOptions generator{};
        ExecutorOptions executor{};
        bool autoSuggest{true};
        std::chrono::milliseconds runTimeout{0};          // whole pipeline; 0 = unbounded
        std::chrono::milliseconds executeStageTimeout{0}; // execute stage; 0 = unbounded
        std::size_t workerThreads{2};
        uint64_t simulationSeed{42};
    };

    EvaluationOrchestrator(PipelineCollaborators collaborators, Config cfg);
    ~EvaluationOrchestrator();

    EvaluationOrchestrator(const EvaluationOrchestrator&) = delete;
    EvaluationOrchestrator& operator=(const EvaluationOrchestrator&) = delete;

    // Options populated from Config.
    EvaluationOptions defaultOptions() const;

    Result<Evaluation> createEvaluation(ProjectId projectId, const std::string& promptText,
                                        const EvaluationOptions& options);

    /**
     * @brief Runs the six pipeline stages for a pending evaluation.
     *
     * Returns the completed evaluation, or the error of the stage that failed it.
     * OperationInProgress when the same id is already running; InvalidState when the
     * evaluation is not pending.
     */
    Result<Evaluation> runEvaluation(EvaluationId id);

    // Schedules runEvaluation on the worker pool. Poll getEvaluationStatus for the outcome.
    void runEvaluationAsync(EvaluationId id);

    Result<EvaluationProgress> getEvaluationStatus(EvaluationId id) const;
    Result<Evaluation> getEvaluation(EvaluationId id) const;
    Result<std::vector<Evaluation>> listEvaluations(ProjectId projectId,
                                                    const ListOptions& options) const;

    // InvalidState while the evaluation is running.
    Result<void> deleteEvaluation(EvaluationId id);

    // Requests cancellation of an in-flight run; the run ends as failed.
    Result<void> cancelEvaluation(EvaluationId id);

    bool isRunning(EvaluationId id) const;

    // Blocks until no async runs are queued or executing, or the timeout elapses.
    bool waitForIdle(std::chrono::milliseconds timeout);

    const Config& config() const noexcept { return cfg_; }

private:
    class RunGuard;

    Result<Evaluation> executePipeline(Evaluation evaluation, const RunContext& ctx);
    Result<void> persist(const Evaluation& evaluation);
    Error failRun(Evaluation& evaluation, EvaluationFsm& fsm, PipelineStage stage, Error error);

    PipelineCollaborators c_;
    Config cfg_;

    mutable std::mutex inflightMutex_;
    std::unordered_map<EvaluationId, std::stop_source> inflight_;

    std::mutex idleMutex_;
    std::condition_variable idleCv_;
    std::size_t queued_{0};

    std::atomic<bool> shuttingDown_{false};
    boost::asio::thread_pool pool_;
};

} // namespace evalforge::evaluation
