#include <evalforge/evaluation/memory_repository.h>

#include <fmt/format.h>
#include <algorithm>
#include <chrono>

namespace evalforge::evaluation {

namespace {

Error missingEvaluation(EvaluationId id) {
    return Error{ErrorCode::NotFound, fmt::format("evaluation {} not found", id)};
}

TimePoint now() {
    return std::chrono::system_clock::now();
}

} // namespace

Evaluation* InMemoryEvaluationRepository::find(EvaluationId id) {
    auto it = evaluations_.find(id);
    return it == evaluations_.end() ? nullptr : &it->second;
}

Result<Evaluation> InMemoryEvaluationRepository::createEvaluation(const Evaluation& evaluation) {
    std::lock_guard lock(mutex_);
    Evaluation stored = evaluation;
    stored.id = ++nextEvaluationId_;
    stored.createdAt = now();
    stored.updatedAt = stored.createdAt;
    if (stored.analysis)
        stored.analysis->evaluationId = stored.id;
    stored.testCases.clear();
    stored.metrics.reset();
    stored.suggestions.clear();
    evaluations_.emplace(stored.id, stored);
    return stored;
}

Result<Evaluation> InMemoryEvaluationRepository::getEvaluation(EvaluationId id) {
    std::lock_guard lock(mutex_);
    if (auto* e = find(id))
        return *e;
    return missingEvaluation(id);
}

Result<void> InMemoryEvaluationRepository::updateEvaluation(const Evaluation& evaluation) {
    std::lock_guard lock(mutex_);
    auto* e = find(evaluation.id);
    if (!e)
        return missingEvaluation(evaluation.id);

    e->projectId = evaluation.projectId;
    e->name = evaluation.name;
    e->description = evaluation.description;
    e->status = evaluation.status;
    e->progress = evaluation.progress;
    e->startedAt = evaluation.startedAt;
    e->completedAt = evaluation.completedAt;
    e->errorMessage = evaluation.errorMessage;
    e->analysis = evaluation.analysis;
    e->errorAnalysis = evaluation.errorAnalysis;
    if (e->errorAnalysis)
        e->errorAnalysis->evaluationId = e->id;
    e->updatedAt = now();
    return {};
}

Result<void> InMemoryEvaluationRepository::deleteEvaluation(EvaluationId id) {
    std::lock_guard lock(mutex_);
    if (evaluations_.erase(id) == 0)
        return missingEvaluation(id);
    return {};
}

Result<std::vector<Evaluation>>
InMemoryEvaluationRepository::listEvaluations(ProjectId projectId, const ListOptions& options) {
    if (options.offset < 0)
        return Error{ErrorCode::InvalidArgument, "offset must be non-negative"};
    if (options.orderBy != "created_at" && options.orderBy != "updated_at" &&
        options.orderBy != "id")
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("unsupported order_by '{}'", options.orderBy)};

    std::vector<Evaluation> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, e] : evaluations_) {
            if (e.projectId != projectId)
                continue;
            if (options.status && e.status != *options.status)
                continue;
            out.push_back(e);
        }
    }

    auto key = [&](const Evaluation& e) {
        if (options.orderBy == "updated_at")
            return std::make_pair(e.updatedAt, e.id);
        if (options.orderBy == "id")
            return std::make_pair(TimePoint{}, e.id);
        return std::make_pair(e.createdAt, e.id);
    };
    std::sort(out.begin(), out.end(), [&](const Evaluation& a, const Evaluation& b) {
        return options.sortDesc ? key(b) < key(a) : key(a) < key(b);
    });

    const auto offset = static_cast<std::size_t>(options.offset);
    if (offset >= out.size())
        return std::vector<Evaluation>{};
    out.erase(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(offset));
    if (options.limit > 0 && out.size() > static_cast<std::size_t>(options.limit))
        out.resize(static_cast<std::size_t>(options.limit));
    return out;
}

Result<std::vector<TestCase>>
InMemoryEvaluationRepository::saveTestCases(EvaluationId id, const std::vector<TestCase>& testCases) {
    std::lock_guard lock(mutex_);
    auto* e = find(id);
    if (!e)
        return missingEvaluation(id);

    std::vector<TestCase> stored = testCases;
    const auto ts = now();
    for (auto& tc : stored) {
        tc.evaluationId = id;
        if (tc.id == 0) {
            tc.id = ++nextTestCaseId_;
            tc.createdAt = ts;
        }
    }
    e->testCases = stored;
    e->updatedAt = ts;
    return stored;
}

Result<std::vector<TestCase>> InMemoryEvaluationRepository::getTestCases(EvaluationId id) {
    std::lock_guard lock(mutex_);
    if (auto* e = find(id))
        return e->testCases;
    return missingEvaluation(id);
}

Result<void> InMemoryEvaluationRepository::updateTestCase(const TestCase& testCase) {
    std::lock_guard lock(mutex_);
    auto* e = find(testCase.evaluationId);
    if (!e)
        return missingEvaluation(testCase.evaluationId);
    for (auto& tc : e->testCases) {
        if (tc.id == testCase.id) {
            tc = testCase;
            e->updatedAt = now();
            return {};
        }
    }
    return Error{ErrorCode::NotFound, fmt::format("test case {} not found", testCase.id)};
}

Result<void> InMemoryEvaluationRepository::saveMetrics(EvaluationId id,
                                                       const EvaluationMetrics& metrics) {
    std::lock_guard lock(mutex_);
    auto* e = find(id);
    if (!e)
        return missingEvaluation(id);

    EvaluationMetrics stored = metrics;
    stored.evaluationId = id;
    stored.id = e->metrics ? e->metrics->id : ++nextMetricsId_;
    e->metrics = std::move(stored);
    e->updatedAt = now();
    return {};
}

Result<EvaluationMetrics> InMemoryEvaluationRepository::getMetrics(EvaluationId id) {
    std::lock_guard lock(mutex_);
    auto* e = find(id);
    if (!e)
        return missingEvaluation(id);
    if (!e->metrics)
        return Error{ErrorCode::NotFound, fmt::format("no metrics for evaluation {}", id)};
    return *e->metrics;
}

Result<void>
InMemoryEvaluationRepository::saveSuggestions(EvaluationId id,
                                              const std::vector<OptimizationSuggestion>& suggestions) {
    std::lock_guard lock(mutex_);
    auto* e = find(id);
    if (!e)
        return missingEvaluation(id);

    const auto ts = now();
    for (auto s : suggestions) {
        s.evaluationId = id;
        if (s.id == 0)
            s.id = ++nextSuggestionId_;
        if (s.createdAt == TimePoint{})
            s.createdAt = ts;
        e->suggestions.push_back(std::move(s));
    }
    e->updatedAt = ts;
    return {};
}

Result<std::vector<OptimizationSuggestion>>
InMemoryEvaluationRepository::getSuggestions(EvaluationId id) {
    std::lock_guard lock(mutex_);
    if (auto* e = find(id))
        return e->suggestions;
    return missingEvaluation(id);
}

Result<void> InMemoryEvaluationRepository::updateSuggestion(const OptimizationSuggestion& suggestion) {
    std::lock_guard lock(mutex_);
    auto* e = find(suggestion.evaluationId);
    if (!e)
        return missingEvaluation(suggestion.evaluationId);
    for (auto& s : e->suggestions) {
        if (s.id == suggestion.id) {
            s = suggestion;
            return {};
        }
    }
    return Error{ErrorCode::NotFound, fmt::format("suggestion {} not found", suggestion.id)};
}

std::size_t InMemoryEvaluationRepository::size() const {
    std::lock_guard lock(mutex_);
    return evaluations_.size();
}

Result<std::vector<CustomMetric>> InMemoryCustomMetricStore::listMetrics(ProjectId projectId,
                                                                         bool enabledOnly) {
    std::lock_guard lock(mutex_);
    std::vector<CustomMetric> out;
    for (const auto& [id, m] : metrics_) {
        if (m.projectId != projectId)
            continue;
        if (enabledOnly && !m.enabled)
            continue;
        out.push_back(m);
    }
    return out;
}

Result<CustomMetric> InMemoryCustomMetricStore::saveMetric(const CustomMetric& metric) {
    std::lock_guard lock(mutex_);
    for (const auto& [id, m] : metrics_) {
        if (id != metric.id && m.projectId == metric.projectId && m.name == metric.name)
            return Error{ErrorCode::AlreadyExists,
                         fmt::format("metric '{}' already exists in project {}", metric.name,
                                     metric.projectId)};
    }

    CustomMetric stored = metric;
    const auto ts = now();
    if (stored.id == 0) {
        stored.id = ++nextId_;
        stored.createdAt = ts;
    } else {
        auto it = metrics_.find(stored.id);
        if (it == metrics_.end())
            return Error{ErrorCode::NotFound, fmt::format("metric {} not found", stored.id)};
        stored.createdAt = it->second.createdAt;
    }
    stored.updatedAt = ts;
    metrics_[stored.id] = stored;
    return stored;
}

Result<void> InMemoryCustomMetricStore::deleteMetric(ProjectId projectId, MetricId metricId) {
    std::lock_guard lock(mutex_);
    auto it = metrics_.find(metricId);
    if (it == metrics_.end() || it->second.projectId != projectId)
        return Error{ErrorCode::NotFound, fmt::format("metric {} not found", metricId)};
    metrics_.erase(it);
    return {};
}

} // namespace evalforge::evaluation
