#include <evalforge/evaluation/error_heuristics.h>
#include <evalforge/evaluation/metrics_calculator.h>
#include <evalforge/evaluation/orchestrator.h>
#include <evalforge/evaluation/simulated_execution.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <boost/asio/post.hpp>

namespace evalforge::evaluation {

namespace {

// Converts collaborator exceptions into errors so a throwing plugin cannot escape the pipeline.
template <typename Fn>
auto invokeGuarded(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, fmt::format("{} threw: {}", what, e.what())};
    }
}

uint64_t mixSeed(uint64_t seed, EvaluationId id) {
    return seed ^ (static_cast<uint64_t>(id) * 0x9E3779B97F4A7C15ULL);
}

std::string describe(const Error& e) {
    return e.message.empty() ? std::string(errorToString(e.code)) : e.message;
}

} // namespace

// Holds the id-scoped run slot for the lifetime of one runEvaluation call.
class EvaluationOrchestrator::RunGuard {
public:
    RunGuard(EvaluationOrchestrator& owner, EvaluationId id) : owner_(owner), id_(id) {
        std::lock_guard lock(owner_.inflightMutex_);
        auto [it, inserted] = owner_.inflight_.try_emplace(id_);
        acquired_ = inserted;
        if (acquired_)
            token_ = it->second.get_token();
    }

    ~RunGuard() {
        if (!acquired_)
            return;
        std::lock_guard lock(owner_.inflightMutex_);
        owner_.inflight_.erase(id_);
    }

    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

    bool acquired() const noexcept { return acquired_; }
    std::stop_token token() const { return token_; }

private:
    EvaluationOrchestrator& owner_;
    EvaluationId id_;
    bool acquired_{false};
    std::stop_token token_;
};

EvaluationOrchestrator::EvaluationOrchestrator(PipelineCollaborators collaborators, Config cfg)
    : c_(std::move(collaborators)), cfg_(cfg), pool_(std::max<std::size_t>(1, cfg.workerThreads)) {
    if (!c_.calculator)
        c_.calculator = std::make_shared<MetricsCalculator>();
}

EvaluationOrchestrator::~EvaluationOrchestrator() {
    shuttingDown_.store(true);
    {
        std::lock_guard lock(inflightMutex_);
        for (auto& [id, source] : inflight_)
            source.request_stop();
    }
    pool_.join();
}

EvaluationOptions EvaluationOrchestrator::defaultOptions() const {
    EvaluationOptions opts;
    opts.generator = cfg_.generator;
    opts.executor = cfg_.executor;
    opts.autoSuggest = cfg_.autoSuggest;
    return opts;
}

Result<Evaluation> EvaluationOrchestrator::createEvaluation(ProjectId projectId,
                                                            const std::string& promptText,
                                                            const EvaluationOptions& options) {
    if (!c_.repository)
        return Error{ErrorCode::NotInitialized, "evaluation repository not configured"};
    if (options.generator.normalCases < 0 || options.generator.edgeCases < 0 ||
        options.generator.adversarialCases < 0)
        return Error{ErrorCode::InvalidArgument, "test case counts must be non-negative"};

    Evaluation evaluation;
    evaluation.projectId = projectId;
    evaluation.name = options.name;
    evaluation.description = options.description;
    evaluation.status = EvaluationStatus::Pending;
    evaluation.progress = 0.0;
    evaluation.generatorOptions = options.generator;
    evaluation.executorOptions = options.executor;
    evaluation.autoSuggest = options.autoSuggest;

    PromptAnalysis analysis;
    analysis.promptText = promptText;
    evaluation.analysis = std::move(analysis);

    auto created = c_.repository->createEvaluation(evaluation);
    if (!created)
        return created.error();
    spdlog::info("evaluation {} created for project {}", created.value().id, projectId);
    return created;
}

void EvaluationOrchestrator::runEvaluationAsync(EvaluationId id) {
    if (shuttingDown_.load()) {
        spdlog::warn("evaluation {}: orchestrator shutting down, async run not scheduled", id);
        return;
    }
    {
        std::lock_guard lock(idleMutex_);
        ++queued_;
    }
    boost::asio::post(pool_, [this, id]() {
        auto result = runEvaluation(id);
        if (!result)
            spdlog::warn("async evaluation {} ended with error: {}", id, result.error().message);
        std::lock_guard lock(idleMutex_);
        --queued_;
        idleCv_.notify_all();
    });
}

bool EvaluationOrchestrator::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(idleMutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return queued_ == 0; });
}

Result<Evaluation> EvaluationOrchestrator::runEvaluation(EvaluationId id) {
    if (!c_.repository || !c_.analyzer || !c_.generator)
        return Error{ErrorCode::NotInitialized,
                     "orchestrator requires an analyzer, a generator and a repository"};

    RunGuard guard(*this, id);
    if (!guard.acquired())
        return Error{ErrorCode::OperationInProgress,
                     fmt::format("evaluation {} is already running", id)};

    auto loaded = c_.repository->getEvaluation(id);
    if (!loaded)
        return loaded.error();

    std::optional<RunContext::Clock::time_point> deadline;
    if (cfg_.runTimeout.count() > 0)
        deadline = RunContext::Clock::now() + cfg_.runTimeout;
    RunContext ctx{guard.token(), deadline};

    return executePipeline(std::move(loaded).value(), ctx);
}

Result<Evaluation> EvaluationOrchestrator::executePipeline(Evaluation evaluation,
                                                           const RunContext& ctx) {
    const auto id = evaluation.id;
    EvaluationFsm fsm(evaluation.status);
    fsm.set_on_state_change([id](EvaluationStatus s, double progress) {
        spdlog::debug("evaluation {}: {} ({}%)", id, evaluationStatusToString(s), progress);
    });

    if (!fsm.start())
        return Error{ErrorCode::InvalidState,
                     fmt::format("evaluation {} is {}; only pending evaluations can run", id,
                                 evaluationStatusToString(evaluation.status))};

    evaluation.status = fsm.state();
    evaluation.progress = fsm.progress();
    evaluation.startedAt = std::chrono::system_clock::now();
    evaluation.completedAt.reset();
    evaluation.errorMessage.clear();
    if (auto r = persist(evaluation); !r)
        return failRun(evaluation, fsm, PipelineStage::Analyze, r.error());
    spdlog::info("evaluation {}: pipeline started", id);

    auto advance = [&](PipelineStage stage) -> Result<void> {
        fsm.advance(stage);
        evaluation.progress = fsm.progress();
        return persist(evaluation);
    };

    // 1. Analyze prompt
    if (auto r = ctx.checkpoint("analyze"); !r)
        return failRun(evaluation, fsm, PipelineStage::Analyze, r.error());

    const std::string promptText = evaluation.analysis ? evaluation.analysis->promptText : "";
    if (promptText.find_first_not_of(" \t\r\n") == std::string::npos)
        return failRun(evaluation, fsm, PipelineStage::Analyze,
                       Error{ErrorCode::InvalidArgument, "prompt text is empty"});

    std::vector<Example> examples;
    if (evaluation.analysis)
        examples = evaluation.analysis->examples;

    auto analyzed = invokeGuarded("prompt analyzer", [&] {
        return c_.analyzer->analyzePrompt(ctx, promptText, examples);
    });
    if (!analyzed)
        return failRun(evaluation, fsm, PipelineStage::Analyze, analyzed.error());

    PromptAnalysis analysis = std::move(analyzed).value();
    if (analysis.taskType == TaskType::Classification && analysis.outputSchema.classes.empty())
        return failRun(evaluation, fsm, PipelineStage::Analyze,
                       Error{ErrorCode::ValidationError,
                             "analyzer returned a classification task without output classes"});
    analysis.evaluationId = id;
    analysis.promptText = promptText;
    evaluation.analysis = analysis;
    spdlog::debug("evaluation {}: task type {}", id, taskTypeToString(analysis.taskType));
    if (auto r = advance(PipelineStage::Analyze); !r)
        return failRun(evaluation, fsm, PipelineStage::Analyze, r.error());

    // 2. Generate test cases
    if (auto r = ctx.checkpoint("generate"); !r)
        return failRun(evaluation, fsm, PipelineStage::Generate, r.error());

    TestGeneratorOptions genOptions = evaluation.generatorOptions;
    if (!genOptions.seed)
        genOptions.seed = mixSeed(cfg_.simulationSeed, id);
    auto generated = invokeGuarded("test generator", [&] {
        return c_.generator->generateTestCases(ctx, analysis, genOptions);
    });
    if (!generated)
        return failRun(evaluation, fsm, PipelineStage::Generate, generated.error());

    auto savedCases = c_.repository->saveTestCases(id, generated.value());
    if (!savedCases)
        return failRun(evaluation, fsm, PipelineStage::Generate, savedCases.error());
    evaluation.testCases = std::move(savedCases).value();
    spdlog::debug("evaluation {}: {} test cases generated", id, evaluation.testCases.size());
    if (auto r = advance(PipelineStage::Generate); !r)
        return failRun(evaluation, fsm, PipelineStage::Generate, r.error());

    // 3. Execute (degradable)
    if (auto r = ctx.checkpoint("execute"); !r)
        return failRun(evaluation, fsm, PipelineStage::Execute, r.error());

    std::vector<TestCase> executed;
    bool haveResults = false;
    if (c_.executor) {
        const RunContext stageCtx =
            cfg_.executeStageTimeout.count() > 0 ? ctx.withTimeout(cfg_.executeStageTimeout) : ctx;
        auto result = invokeGuarded("test executor", [&] {
            return c_.executor->executeTestCases(stageCtx, evaluation.testCases, promptText,
                                                 evaluation.executorOptions);
        });
        if (ctx.cancelled())
            return failRun(evaluation, fsm, PipelineStage::Execute,
                           Error{ErrorCode::OperationCancelled, "execute: cancelled"});
        if (!result) {
            spdlog::warn("evaluation {}: executor failed ({}), using simulated execution", id,
                         describe(result.error()));
        } else if (stageCtx.expired()) {
            spdlog::warn("evaluation {}: execute stage exceeded its deadline, using simulated "
                         "execution",
                         id);
        } else {
            executed = std::move(result).value();
            haveResults = true;
        }
    } else {
        spdlog::info("evaluation {}: no executor configured, using simulated execution", id);
    }

    if (!haveResults) {
        SimulatedExecutionPolicy policy(mixSeed(cfg_.simulationSeed, id));
        executed = policy.simulate(evaluation.testCases, analysis);
    }
    for (auto& tc : executed) {
        tc.evaluationId = id;
        tc.score = std::clamp(tc.score, 0.0, 1.0);
    }

    auto savedExecuted = c_.repository->saveTestCases(id, executed);
    if (!savedExecuted)
        return failRun(evaluation, fsm, PipelineStage::Execute, savedExecuted.error());
    evaluation.testCases = std::move(savedExecuted).value();
    if (auto r = advance(PipelineStage::Execute); !r)
        return failRun(evaluation, fsm, PipelineStage::Execute, r.error());

    // 4. Metrics
    if (auto r = ctx.checkpoint("metrics"); !r)
        return failRun(evaluation, fsm, PipelineStage::Metrics, r.error());

    auto metrics = invokeGuarded("metrics calculator", [&] {
        return c_.calculator->calculateMetrics(evaluation.testCases, analysis);
    });
    if (!metrics)
        return failRun(evaluation, fsm, PipelineStage::Metrics, metrics.error());
    metrics.value().evaluationId = id;
    if (auto r = c_.repository->saveMetrics(id, metrics.value()); !r)
        return failRun(evaluation, fsm, PipelineStage::Metrics, r.error());
    evaluation.metrics = std::move(metrics).value();
    spdlog::debug("evaluation {}: pass rate {:.3f}, overall score {:.3f}{}", id,
                  evaluation.metrics->passRate, evaluation.metrics->overallScore,
                  evaluation.metrics->simulated ? " (simulated)" : "");
    if (auto r = advance(PipelineStage::Metrics); !r)
        return failRun(evaluation, fsm, PipelineStage::Metrics, r.error());

    // 5. Error analysis (degradable)
    if (auto r = ctx.checkpoint("error analysis"); !r)
        return failRun(evaluation, fsm, PipelineStage::ErrorAnalysis, r.error());

    std::optional<ErrorAnalysis> errorAnalysis;
    if (c_.errorAnalyzer) {
        auto result = invokeGuarded("error analyzer", [&] {
            return c_.errorAnalyzer->analyzeErrors(ctx, evaluation.testCases, analysis);
        });
        if (ctx.cancelled())
            return failRun(evaluation, fsm, PipelineStage::ErrorAnalysis,
                           Error{ErrorCode::OperationCancelled, "error analysis: cancelled"});
        if (result)
            errorAnalysis = std::move(result).value();
        else
            spdlog::warn("evaluation {}: error analyzer failed ({}), using heuristic analysis",
                         id, describe(result.error()));
    }
    if (!errorAnalysis)
        errorAnalysis = basicErrorAnalysis(evaluation.testCases);
    errorAnalysis->evaluationId = id;
    evaluation.errorAnalysis = std::move(errorAnalysis);
    if (auto r = advance(PipelineStage::ErrorAnalysis); !r)
        return failRun(evaluation, fsm, PipelineStage::ErrorAnalysis, r.error());

    // 6. Optimization suggestions (degradable)
    if (auto r = ctx.checkpoint("optimize"); !r)
        return failRun(evaluation, fsm, PipelineStage::Optimize, r.error());

    std::vector<OptimizationSuggestion> suggestions;
    if (evaluation.autoSuggest && c_.optimizer) {
        auto result = invokeGuarded("prompt optimizer", [&] {
            return c_.optimizer->suggestImprovements(ctx, promptText, *evaluation.metrics,
                                                     *evaluation.errorAnalysis);
        });
        if (ctx.cancelled())
            return failRun(evaluation, fsm, PipelineStage::Optimize,
                           Error{ErrorCode::OperationCancelled, "optimize: cancelled"});
        if (result)
            suggestions = std::move(result).value();
        else
            spdlog::warn("evaluation {}: optimizer failed ({}), no suggestions", id,
                         describe(result.error()));
    }
    if (!suggestions.empty()) {
        if (auto r = c_.repository->saveSuggestions(id, suggestions); !r) {
            spdlog::warn("evaluation {}: failed to save suggestions: {}", id, r.error().message);
            suggestions.clear();
        } else if (auto stored = c_.repository->getSuggestions(id); stored) {
            suggestions = std::move(stored).value();
        }
    }
    evaluation.suggestions = std::move(suggestions);

    fsm.advance(PipelineStage::Optimize);
    fsm.complete();
    evaluation.progress = fsm.progress();
    evaluation.status = fsm.state();
    evaluation.completedAt = std::chrono::system_clock::now();
    if (auto r = persist(evaluation); !r)
        return failRun(evaluation, fsm, PipelineStage::Optimize, r.error());

    spdlog::info("evaluation {}: completed ({} test cases, pass rate {:.3f}, {} suggestion(s))",
                 id, evaluation.testCases.size(), evaluation.metrics->passRate,
                 evaluation.suggestions.size());
    return evaluation;
}

Result<void> EvaluationOrchestrator::persist(const Evaluation& evaluation) {
    return c_.repository->updateEvaluation(evaluation);
}

Error EvaluationOrchestrator::failRun(Evaluation& evaluation, EvaluationFsm& fsm,
                                      PipelineStage stage, Error error) {
    fsm.fail();
    evaluation.status = EvaluationStatus::Failed;
    evaluation.errorMessage = fmt::format("{} stage: {}", pipelineStageToString(stage), describe(error));
    spdlog::error("evaluation {} failed: {}", evaluation.id, evaluation.errorMessage);
    if (auto r = persist(evaluation); !r)
        spdlog::error("evaluation {}: could not persist failed status: {}", evaluation.id,
                      r.error().message);
    return error;
}

Result<EvaluationProgress> EvaluationOrchestrator::getEvaluationStatus(EvaluationId id) const {
    if (!c_.repository)
        return Error{ErrorCode::NotInitialized, "evaluation repository not configured"};
    auto e = c_.repository->getEvaluation(id);
    if (!e)
        return e.error();
    return EvaluationProgress{e.value().status, e.value().progress};
}

Result<Evaluation> EvaluationOrchestrator::getEvaluation(EvaluationId id) const {
    if (!c_.repository)
        return Error{ErrorCode::NotInitialized, "evaluation repository not configured"};
    return c_.repository->getEvaluation(id);
}

Result<std::vector<Evaluation>>
EvaluationOrchestrator::listEvaluations(ProjectId projectId, const ListOptions& options) const {
    if (!c_.repository)
        return Error{ErrorCode::NotInitialized, "evaluation repository not configured"};
    return c_.repository->listEvaluations(projectId, options);
}

Result<void> EvaluationOrchestrator::deleteEvaluation(EvaluationId id) {
    if (!c_.repository)
        return Error{ErrorCode::NotInitialized, "evaluation repository not configured"};
    if (isRunning(id))
        return Error{ErrorCode::InvalidState,
                     fmt::format("evaluation {} is running; cancel it first", id)};
    return c_.repository->deleteEvaluation(id);
}

Result<void> EvaluationOrchestrator::cancelEvaluation(EvaluationId id) {
    std::lock_guard lock(inflightMutex_);
    auto it = inflight_.find(id);
    if (it == inflight_.end())
        return Error{ErrorCode::NotFound, fmt::format("evaluation {} is not running", id)};
    it->second.request_stop();
    spdlog::info("evaluation {}: cancellation requested", id);
    return {};
}

bool EvaluationOrchestrator::isRunning(EvaluationId id) const {
    std::lock_guard lock(inflightMutex_);
    return inflight_.count(id) > 0;
}

} // namespace evalforge::evaluation
