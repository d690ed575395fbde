#pragma once

#include <evalforge/evaluation/types.h>

#include <algorithm>
#include <functional>
#include <utility>

namespace evalforge::evaluation {

enum class PipelineStage { Analyze, Generate, Execute, Metrics, ErrorAnalysis, Optimize };

[[nodiscard]] constexpr const char* pipelineStageToString(PipelineStage s) noexcept {
    switch (s) {
        case PipelineStage::Analyze:
            return "analyze";
        case PipelineStage::Generate:
            return "generate";
        case PipelineStage::Execute:
            return "execute";
        case PipelineStage::Metrics:
            return "metrics";
        case PipelineStage::ErrorAnalysis:
            return "error_analysis";
        case PipelineStage::Optimize:
            return "optimize";
    }
    return "unknown";
}

// Progress reported once the stage's output is persisted.
[[nodiscard]] constexpr double stageProgress(PipelineStage s) noexcept {
    switch (s) {
        case PipelineStage::Analyze:
            return 20.0;
        case PipelineStage::Generate:
            return 40.0;
        case PipelineStage::Execute:
            return 60.0;
        case PipelineStage::Metrics:
            return 80.0;
        case PipelineStage::ErrorAnalysis:
            return 90.0;
        case PipelineStage::Optimize:
            return 100.0;
    }
    return 0.0;
}

// Degradable stages fall back instead of failing the run.
[[nodiscard]] constexpr bool isDegradable(PipelineStage s) noexcept {
    return s == PipelineStage::Execute || s == PipelineStage::ErrorAnalysis ||
           s == PipelineStage::Optimize;
}

/**
 * @brief Lifecycle of one evaluation run.
 *
 * pending -> running -> {completed, failed}. Running is entered once; terminal states
 * never change. Progress only moves forward while running.
 */
class EvaluationFsm {
public:
    using Callback = std::function<void(EvaluationStatus, double)>;

    explicit EvaluationFsm(EvaluationStatus initial = EvaluationStatus::Pending)
        : state_(initial) {}

    EvaluationStatus state() const noexcept { return state_; }
    double progress() const noexcept { return progress_; }

    bool start() noexcept {
        if (!transition(EvaluationStatus::Pending, EvaluationStatus::Running))
            return false;
        progress_ = 0.0;
        notify();
        return true;
    }

    bool advance(PipelineStage stage) noexcept {
        const double next = stageProgress(stage);
        if (state_ != EvaluationStatus::Running || next < progress_)
            return false;
        progress_ = std::min(next, 100.0);
        notify();
        return true;
    }

    bool complete() noexcept {
        if (!transition(EvaluationStatus::Running, EvaluationStatus::Completed))
            return false;
        notify();
        return true;
    }

    bool fail() noexcept {
        if (isTerminal(state_))
            return false;
        state_ = EvaluationStatus::Failed;
        notify();
        return true;
    }

    void set_on_state_change(Callback cb) { on_state_change_ = std::move(cb); }

    static bool isTerminal(EvaluationStatus s) noexcept {
        return s == EvaluationStatus::Completed || s == EvaluationStatus::Failed;
    }

private:
    bool transition(EvaluationStatus expect, EvaluationStatus next) noexcept {
        if (state_ != expect)
            return false;
        state_ = next;
        return true;
    }

    void notify() {
        if (on_state_change_)
            on_state_change_(state_, progress_);
    }

    EvaluationStatus state_;
    double progress_{0.0};
    Callback on_state_change_{};
};

} // namespace evalforge::evaluation
