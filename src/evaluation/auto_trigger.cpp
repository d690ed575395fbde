#include <evalforge/evaluation/auto_trigger.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace evalforge::evaluation {

namespace {

using json = nlohmann::json;

// Checked in order, first in input then in metadata.
constexpr const char* kPromptFields[] = {"prompt",      "system_prompt", "user_prompt",
                                         "instruction", "query",         "messages"};

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

std::string joinMessages(const json& messages) {
    std::string out;
    for (const auto& msg : messages) {
        if (!msg.is_object())
            continue;
        auto it = msg.find("content");
        if (it == msg.end() || !it->is_string())
            continue;
        if (!out.empty())
            out += '\n';
        out += it->get<std::string>();
    }
    return out;
}

std::string promptFrom(const json& source) {
    if (!source.is_object())
        return {};
    for (const char* field : kPromptFields) {
        auto it = source.find(field);
        if (it == source.end() || it->is_null())
            continue;
        std::string text;
        if (it->is_string())
            text = it->get<std::string>();
        else if (std::string_view(field) == "messages" && it->is_array())
            text = joinMessages(*it);
        else
            text = it->dump();
        if (!text.empty())
            return text;
    }
    return {};
}

Result<TimePoint> optionalTimestamp(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return TimePoint{};
    return parseTimestamp(it->get<std::string>());
}

} // namespace

Result<TrackingEvent> TrackingEvent::fromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "tracking event must be an object"};
    try {
        TrackingEvent ev;
        ev.id = j.value("id", std::string{});
        ev.projectId = j.value("project_id", int64_t{0});
        ev.traceId = j.value("trace_id", std::string{});
        ev.spanId = j.value("span_id", std::string{});
        ev.operationType = j.value("operation_type", std::string{});
        ev.provider = j.value("provider", std::string{});
        ev.model = j.value("model", std::string{});
        for (auto [key, field] : {std::pair{"input", &ev.input}, std::pair{"output", &ev.output},
                                  std::pair{"metadata", &ev.metadata}}) {
            if (auto it = j.find(key); it != j.end() && !it->is_null())
                *field = *it;
        }
        auto start = optionalTimestamp(j, "start_time");
        if (!start)
            return start.error();
        ev.startTime = start.value();
        auto end = optionalTimestamp(j, "end_time");
        if (!end)
            return end.error();
        ev.endTime = end.value();
        return ev;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, fmt::format("tracking event: {}", e.what())};
    }
}

AutoEvaluationTrigger::AutoEvaluationTrigger(std::shared_ptr<IPromptAnalyzer> analyzer,
                                             std::shared_ptr<EvaluationOrchestrator> orchestrator,
                                             TriggerConfig cfg, Clock clock)
    : analyzer_(std::move(analyzer)),
      orchestrator_(std::move(orchestrator)),
      clock_(clock ? std::move(clock) : Clock{[] { return std::chrono::system_clock::now(); }}),
      cfg_(std::move(cfg)) {}

std::string AutoEvaluationTrigger::extractPrompt(const TrackingEvent& event) {
    if (auto text = promptFrom(event.input); !text.empty())
        return text;
    return promptFrom(event.metadata);
}

double AutoEvaluationTrigger::similarity(std::string_view a, std::string_view b) {
    auto left = toLower(trimView(a));
    auto right = toLower(trimView(b));
    if (left == right)
        return 1.0;
    auto longest = std::max(left.size(), right.size());
    if (longest == 0)
        return 1.0;
    auto shortest = std::min(left.size(), right.size());
    std::size_t matches = 0;
    for (std::size_t i = 0; i < shortest; ++i) {
        if (left[i] == right[i])
            ++matches;
    }
    return static_cast<double>(matches) / static_cast<double>(longest);
}

Result<TriggerDecision> AutoEvaluationTrigger::processEvent(const RunContext& ctx,
                                                            const TrackingEvent& event) {
    auto cfg = config();
    if (!cfg.enabled)
        return TriggerDecision{TriggerOutcome::Disabled, std::nullopt};

    auto prompt = extractPrompt(event);
    if (prompt.empty()) {
        spdlog::debug("trigger: no prompt in event {}", event.id);
        return TriggerDecision{TriggerOutcome::NoPrompt, std::nullopt};
    }
    if (prompt.size() < cfg.minPromptLength || prompt.size() > cfg.maxPromptLength) {
        spdlog::debug("trigger: prompt length {} outside [{}, {}]", prompt.size(),
                      cfg.minPromptLength, cfg.maxPromptLength);
        return TriggerDecision{TriggerOutcome::InvalidLength, std::nullopt};
    }

    auto lowered = toLower(prompt);
    for (const auto& pattern : cfg.excludePatterns) {
        if (!pattern.empty() && lowered.find(toLower(pattern)) != std::string::npos) {
            spdlog::debug("trigger: prompt excluded by pattern '{}'", pattern);
            return TriggerDecision{TriggerOutcome::Excluded, std::nullopt};
        }
    }

    if (auto check = ctx.checkpoint("trigger"); !check)
        return check.error();

    auto analysis = analyzer_->analyzePrompt(ctx, prompt, {});
    if (!analysis) {
        spdlog::warn("trigger: prompt analysis failed for event {}: {}", event.id,
                     analysis.error().message);
        return TriggerDecision{TriggerOutcome::AnalysisFailed, std::nullopt};
    }
    auto taskType = analysis.value().taskType;
    if (std::find(cfg.includeTaskTypes.begin(), cfg.includeTaskTypes.end(), taskType) ==
        cfg.includeTaskTypes.end()) {
        spdlog::debug("trigger: task type {} not included", taskTypeToString(taskType));
        return TriggerDecision{TriggerOutcome::TaskTypeExcluded, std::nullopt};
    }

    auto now = clock_();
    auto key = std::make_pair(event.projectId, prompt);
    PromptCandidate ready;
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = candidates_.try_emplace(key);
        auto& cand = it->second;
        if (inserted) {
            cand.projectId = event.projectId;
            cand.prompt = prompt;
            cand.firstSeen = now;
        }
        cand.taskType = taskType;
        cand.lastSeen = now;
        ++cand.executionCount;
        if (cand.sampleInputs.size() < cfg.maxSamples) {
            cand.sampleInputs.push_back(event.input);
            cand.sampleOutputs.push_back(event.output);
        }

        if (inFlight_.count(key))
            return TriggerDecision{TriggerOutcome::Tracked, std::nullopt};
        if (cand.executionCount < cfg.triggerThreshold)
            return TriggerDecision{TriggerOutcome::Tracked, std::nullopt};
        if (now - cand.firstSeen < cfg.delayBetweenRuns)
            return TriggerDecision{TriggerOutcome::Tracked, std::nullopt};
        ready = std::move(cand);
        candidates_.erase(it);
        inFlight_.insert(key);
    }

    auto recent = recentlyEvaluated(event.projectId, prompt, cfg);
    if (!recent) {
        release(key, std::move(ready), cfg);
        return recent.error();
    }
    if (recent.value()) {
        spdlog::info("trigger: similar prompt evaluated recently in project {}, skipping",
                     event.projectId);
        release(key, std::nullopt, cfg);
        return TriggerDecision{TriggerOutcome::Duplicate, std::nullopt};
    }

    auto id = trigger(ready);
    if (!id) {
        release(key, std::move(ready), cfg);
        return id.error();
    }

    release(key, std::nullopt, cfg);
    std::lock_guard lock(mutex_);
    ++triggeredCount_;
    return TriggerDecision{TriggerOutcome::Triggered, id.value()};
}

void AutoEvaluationTrigger::release(const CandidateKey& key,
                                    std::optional<PromptCandidate> restore,
                                    const TriggerConfig& cfg) {
    std::lock_guard lock(mutex_);
    inFlight_.erase(key);
    if (!restore)
        return;

    // Events seen while the check was in flight are folded back into the restored candidate.
    auto [it, inserted] = candidates_.try_emplace(key, std::move(*restore));
    if (inserted)
        return;
    auto& later = it->second;
    auto& earlier = *restore;
    later.executionCount += earlier.executionCount;
    later.firstSeen = std::min(later.firstSeen, earlier.firstSeen);
    for (std::size_t i = 0;
         i < earlier.sampleInputs.size() && later.sampleInputs.size() < cfg.maxSamples; ++i) {
        later.sampleInputs.push_back(std::move(earlier.sampleInputs[i]));
        later.sampleOutputs.push_back(std::move(earlier.sampleOutputs[i]));
    }
}

Result<bool> AutoEvaluationTrigger::recentlyEvaluated(ProjectId projectId,
                                                      const std::string& prompt,
                                                      const TriggerConfig& cfg) const {
    ListOptions opts;
    opts.limit = cfg.dedupLookback;
    opts.orderBy = "created_at";
    opts.sortDesc = true;
    auto evaluations = orchestrator_->listEvaluations(projectId, opts);
    if (!evaluations)
        return evaluations.error();

    auto cutoff = clock_() - cfg.dedupWindow;
    for (const auto& e : evaluations.value()) {
        if (e.createdAt < cutoff || !e.analysis)
            continue;
        if (similarity(e.analysis->promptText, prompt) > cfg.similarityThreshold)
            return true;
    }
    return false;
}

Result<EvaluationId> AutoEvaluationTrigger::trigger(const PromptCandidate& candidate) {
    auto options = orchestrator_->defaultOptions();
    options.name = fmt::format("Auto-evaluation {}", formatTimestamp(clock_()));
    options.description =
        fmt::format("Automatically generated evaluation for {} prompt (triggered after {} "
                    "executions)",
                    taskTypeToString(candidate.taskType), candidate.executionCount);
    options.generator.normalCases = 15;
    options.generator.edgeCases = 8;
    options.generator.adversarialCases = 5;
    options.autoSuggest = true;

    auto created = orchestrator_->createEvaluation(candidate.projectId, candidate.prompt, options);
    if (!created) {
        spdlog::error("trigger: failed to create evaluation for project {}: {}",
                      candidate.projectId, created.error().message);
        return created.error();
    }
    auto id = created.value().id;
    orchestrator_->runEvaluationAsync(id);
    spdlog::info("trigger: evaluation {} scheduled for project {} after {} executions", id,
                 candidate.projectId, candidate.executionCount);
    return id;
}

json AutoEvaluationTrigger::stats() const {
    std::lock_guard lock(mutex_);
    json types = json::array();
    for (auto t : cfg_.includeTaskTypes)
        types.push_back(taskTypeToString(t));
    return json{{"enabled", cfg_.enabled},
                {"trigger_threshold", cfg_.triggerThreshold},
                {"min_prompt_length", cfg_.minPromptLength},
                {"max_prompt_length", cfg_.maxPromptLength},
                {"delay_between_runs_seconds", cfg_.delayBetweenRuns.count()},
                {"included_task_types", types},
                {"exclude_patterns", cfg_.excludePatterns},
                {"tracked_candidates", candidates_.size()},
                {"triggered_evaluations", triggeredCount_}};
}

void AutoEvaluationTrigger::updateConfig(TriggerConfig cfg) {
    std::lock_guard lock(mutex_);
    cfg_ = std::move(cfg);
    spdlog::info("trigger: configuration updated (enabled={}, threshold={})", cfg_.enabled,
                 cfg_.triggerThreshold);
}

TriggerConfig AutoEvaluationTrigger::config() const {
    std::lock_guard lock(mutex_);
    return cfg_;
}

std::optional<PromptCandidate> AutoEvaluationTrigger::candidate(ProjectId projectId,
                                                                const std::string& prompt) const {
    std::lock_guard lock(mutex_);
    if (auto it = candidates_.find({projectId, prompt}); it != candidates_.end())
        return it->second;
    return std::nullopt;
}

} // namespace evalforge::evaluation
