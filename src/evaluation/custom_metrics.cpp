#include <evalforge/evaluation/custom_metrics.h>
#include <evalforge/evaluation/formula_evaluator.h>
#include <evalforge/evaluation/types.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <mutex>
#include <numeric>
#include <optional>
#include <regex>

namespace evalforge::evaluation {

namespace {

using json = nlohmann::json;

const json* sampleField(const json& sample, const std::string& name) {
    if (!sample.is_object())
        return nullptr;
    auto it = sample.find(name);
    return it == sample.end() ? nullptr : &*it;
}

std::string sampleId(const json& sample, std::size_t index) {
    if (sample.is_object()) {
        if (auto it = sample.find("id"); it != sample.end()) {
            return it->is_string() ? it->get<std::string>() : it->dump();
        }
    }
    return std::to_string(index);
}

} // namespace

Result<MetricType> parseMetricType(std::string_view s) {
    static constexpr std::array values{MetricType::Numeric, MetricType::Boolean,
                                       MetricType::String,  MetricType::Percentage,
                                       MetricType::Score,   MetricType::Custom};
    return detail::parseEnum(s, values, &metricTypeToString, "metric type");
}

Result<AggregationType> parseAggregationType(std::string_view s) {
    static constexpr std::array values{AggregationType::Average, AggregationType::Sum,
                                       AggregationType::Min,     AggregationType::Max,
                                       AggregationType::Median,  AggregationType::P95,
                                       AggregationType::P99,     AggregationType::Count};
    return detail::parseEnum(s, values, &aggregationTypeToString, "aggregation");
}

Result<ThresholdOperator> parseThresholdOperator(std::string_view s) {
    static constexpr std::array values{ThresholdOperator::Greater,   ThresholdOperator::GreaterEqual,
                                       ThresholdOperator::Less,      ThresholdOperator::LessEqual,
                                       ThresholdOperator::Equal,     ThresholdOperator::NotEqual};
    return detail::parseEnum(s, values, &thresholdOperatorToString, "threshold operator");
}

json CustomMetric::toJson() const {
    json t{{"pass_value", thresholds.passValue},
           {"operator", thresholdOperatorToString(thresholds.op)}};
    if (thresholds.warningValue)
        t["warning_value"] = *thresholds.warningValue;
    if (thresholds.failValue)
        t["fail_value"] = *thresholds.failValue;

    return json{{"id", id},
                {"project_id", projectId},
                {"name", name},
                {"description", description},
                {"type", metricTypeToString(type)},
                {"aggregation", aggregationTypeToString(aggregation)},
                {"formula", formula},
                {"thresholds", t},
                {"weight", weight},
                {"enabled", enabled},
                {"created_at", formatTimestamp(createdAt)},
                {"updated_at", formatTimestamp(updatedAt)}};
}

Result<CustomMetric> CustomMetric::fromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "custom metric must be an object"};

    CustomMetric m;
    m.id = j.value("id", int64_t{0});
    m.projectId = j.value("project_id", int64_t{0});
    m.name = j.value("name", std::string{});
    if (m.name.empty())
        return Error{ErrorCode::InvalidArgument, "custom metric requires a name"};
    m.description = j.value("description", std::string{});

    auto type = parseMetricType(j.value("type", std::string{"numeric"}));
    if (!type)
        return type.error();
    m.type = type.value();

    auto agg = parseAggregationType(j.value("aggregation", std::string{"average"}));
    if (!agg)
        return agg.error();
    m.aggregation = agg.value();

    m.formula = j.value("formula", std::string{});
    if (auto it = j.find("thresholds"); it != j.end() && it->is_object()) {
        try {
            m.thresholds.passValue = it->value("pass_value", 0.0);
            if (it->contains("warning_value"))
                m.thresholds.warningValue = (*it)["warning_value"].get<double>();
            if (it->contains("fail_value"))
                m.thresholds.failValue = (*it)["fail_value"].get<double>();
        } catch (const json::exception& e) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("custom metric '{}' thresholds: {}", m.name, e.what())};
        }
        auto op = parseThresholdOperator(it->value("operator", std::string{">="}));
        if (!op)
            return op.error();
        m.thresholds.op = op.value();
    }
    m.weight = j.value("weight", 1.0);
    if (m.weight < 0.0)
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("custom metric '{}' has negative weight", m.name)};
    m.enabled = j.value("enabled", true);
    return m;
}

json MetricValue::toJson() const {
    json raw = std::visit([](const auto& v) { return json(v); }, value);
    return json{{"metric_id", metricId},
                {"evaluation_id", evaluationId},
                {"sample_id", sampleId},
                {"value", raw},
                {"numeric_value", numericValue},
                {"passed", passed},
                {"timestamp", formatTimestamp(timestamp)},
                {"metadata", metadata}};
}

json MetricResult::toJson() const {
    json j{{"metric_id", metricId},
           {"metric_name", metricName},
           {"value", value},
           {"passed", passed},
           {"pass_rate", passRate},
           {"sample_count", sampleCount}};
    if (!details.empty())
        j["details"] = details;
    return j;
}

bool checkThreshold(double value, const MetricThresholds& thresholds) {
    const double pass = thresholds.passValue;
    switch (thresholds.op) {
        case ThresholdOperator::Greater:
            return value > pass;
        case ThresholdOperator::GreaterEqual:
            return value >= pass;
        case ThresholdOperator::Less:
            return value < pass;
        case ThresholdOperator::LessEqual:
            return value <= pass;
        case ThresholdOperator::Equal:
            return std::abs(value - pass) < kThresholdEpsilon;
        case ThresholdOperator::NotEqual:
            return std::abs(value - pass) >= kThresholdEpsilon;
    }
    return value >= pass;
}

double percentile(std::vector<double> values, double p) {
    if (values.empty())
        return 0.0;
    std::sort(values.begin(), values.end());

    p = std::clamp(p, 0.0, 100.0);
    const double index = p / 100.0 * static_cast<double>(values.size() - 1);
    const auto lower = static_cast<std::size_t>(std::floor(index));
    const auto upper = static_cast<std::size_t>(std::ceil(index));
    if (lower == upper)
        return values[lower];

    const double weight = index - static_cast<double>(lower);
    return values[lower] * (1.0 - weight) + values[upper] * weight;
}

double aggregate(const std::vector<double>& values, AggregationType aggregation) {
    if (values.empty())
        return 0.0;

    switch (aggregation) {
        case AggregationType::Average:
            return std::accumulate(values.begin(), values.end(), 0.0) /
                   static_cast<double>(values.size());
        case AggregationType::Sum:
            return std::accumulate(values.begin(), values.end(), 0.0);
        case AggregationType::Min:
            return *std::min_element(values.begin(), values.end());
        case AggregationType::Max:
            return *std::max_element(values.begin(), values.end());
        case AggregationType::Median:
            return percentile(values, 50.0);
        case AggregationType::P95:
            return percentile(values, 95.0);
        case AggregationType::P99:
            return percentile(values, 99.0);
        case AggregationType::Count:
            return static_cast<double>(values.size());
    }
    return 0.0;
}

namespace {

// Only this prefix of a sample string is matched against a metric pattern.
constexpr std::size_t kMaxPatternInput = 4096;

Result<std::optional<std::regex>> compilePattern(const CustomMetric& metric) {
    if (metric.type != MetricType::String || metric.formula.empty())
        return std::optional<std::regex>{};
    try {
        return std::optional<std::regex>{std::regex(metric.formula)};
    } catch (const std::regex_error& e) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("metric '{}' has invalid pattern '{}': {}", metric.name,
                                 metric.formula, e.what())};
    }
}

Result<MetricValue> scoreSample(const CustomMetric& metric, const json& sample,
                                const std::regex* pattern) {
    MetricValue out;
    out.metricId = metric.id;
    out.timestamp = std::chrono::system_clock::now();

    const json* field = sampleField(sample, metric.name);
    double numeric = 0.0;

    switch (metric.type) {
        case MetricType::Numeric:
        case MetricType::Percentage:
        case MetricType::Score:
            if (field && field->is_number())
                numeric = field->get<double>();
            else if (field && field->is_boolean())
                numeric = field->get<bool>() ? 1.0 : 0.0;
            out.value = numeric;
            break;

        case MetricType::Boolean: {
            bool flag = false;
            if (field && field->is_boolean())
                flag = field->get<bool>();
            else if (field && field->is_number())
                flag = field->get<double>() != 0.0;
            out.value = flag;
            numeric = flag ? 1.0 : 0.0;
            break;
        }

        case MetricType::String: {
            std::string text;
            if (field && field->is_string())
                text = field->get<std::string>();
            bool matched = false;
            if (pattern) {
                auto scanned = std::min(text.size(), kMaxPatternInput);
                matched = std::regex_search(
                    text.begin(), text.begin() + static_cast<std::string::difference_type>(scanned),
                    *pattern);
            }
            if (matched)
                numeric = 1.0;
            else if (metric.name.find("length") != std::string::npos)
                numeric = static_cast<double>(text.size());
            out.value = std::move(text);
            break;
        }

        case MetricType::Custom: {
            auto result = FormulaEvaluator::evaluate(metric.formula, sample);
            if (!result)
                return Error{result.error().code,
                             fmt::format("metric '{}': {}", metric.name, result.error().message)};
            numeric = result.value();
            out.value = numeric;
            break;
        }
    }

    out.numericValue = numeric;
    out.passed = checkThreshold(numeric, metric.thresholds);
    return out;
}

} // namespace

CustomMetricsEvaluator::CustomMetricsEvaluator(std::shared_ptr<ICustomMetricStore> store)
    : store_(std::move(store)) {}

Result<void> CustomMetricsEvaluator::loadMetrics(ProjectId projectId) {
    if (!store_)
        return Error{ErrorCode::NotInitialized, "custom metric store not configured"};

    auto listed = store_->listMetrics(projectId, true);
    if (!listed)
        return listed.error();

    std::unordered_map<MetricId, CustomMetric> fresh;
    for (auto& m : listed.value()) {
        if (!m.enabled)
            continue;
        m.projectId = projectId;
        fresh.emplace(m.id, std::move(m));
    }

    std::unique_lock lock(mutex_);
    spdlog::debug("custom metrics: loaded {} metric(s) for project {}", fresh.size(), projectId);
    cache_[projectId] = std::move(fresh);
    return {};
}

Result<MetricValue> CustomMetricsEvaluator::evaluateMetric(const CustomMetric& metric,
                                                           const json& sample) const {
    auto pattern = compilePattern(metric);
    if (!pattern)
        return pattern.error();
    const auto& compiled = pattern.value();
    return scoreSample(metric, sample, compiled ? &*compiled : nullptr);
}

Result<MetricValue> CustomMetricsEvaluator::evaluateMetric(ProjectId projectId, MetricId metricId,
                                                           const json& sample) const {
    auto metric = findMetric(projectId, metricId);
    if (!metric)
        return Error{ErrorCode::NotFound,
                     fmt::format("metric {} not loaded for project {}", metricId, projectId)};
    return evaluateMetric(*metric, sample);
}

MetricResult CustomMetricsEvaluator::aggregateResults(const CustomMetric& metric,
                                                      const std::vector<MetricValue>& values) {
    MetricResult result;
    result.metricId = metric.id;
    result.metricName = metric.name;
    result.sampleCount = static_cast<int>(values.size());
    if (values.empty())
        return result;

    std::vector<double> numeric;
    numeric.reserve(values.size());
    int passCount = 0;
    for (const auto& v : values) {
        if (v.passed)
            ++passCount;
        numeric.push_back(v.numericValue);
    }

    result.value = aggregate(numeric, metric.aggregation);
    result.passRate = static_cast<double>(passCount) / static_cast<double>(values.size());
    result.passed = checkThreshold(result.value, metric.thresholds);

    if (metric.aggregation == AggregationType::P95 || metric.aggregation == AggregationType::P99) {
        result.details["min"] = aggregate(numeric, AggregationType::Min);
        result.details["max"] = aggregate(numeric, AggregationType::Max);
        result.details["median"] = aggregate(numeric, AggregationType::Median);
        result.details["avg"] = aggregate(numeric, AggregationType::Average);
    }
    return result;
}

Result<MetricResult> CustomMetricsEvaluator::aggregateResults(ProjectId projectId, MetricId metricId,
                                                              const std::vector<MetricValue>& values) const {
    auto metric = findMetric(projectId, metricId);
    if (!metric)
        return Error{ErrorCode::NotFound,
                     fmt::format("metric {} not loaded for project {}", metricId, projectId)};
    return aggregateResults(*metric, values);
}

Result<std::vector<MetricResult>>
CustomMetricsEvaluator::evaluateSamples(ProjectId projectId, const std::vector<json>& samples) const {
    std::vector<MetricResult> results;
    for (const auto& metric : loadedMetrics(projectId)) {
        auto pattern = compilePattern(metric);
        if (!pattern)
            return pattern.error();
        const auto& compiled = pattern.value();
        std::vector<MetricValue> values;
        values.reserve(samples.size());
        for (std::size_t i = 0; i < samples.size(); ++i) {
            auto v = scoreSample(metric, samples[i], compiled ? &*compiled : nullptr);
            if (!v)
                return v.error();
            v.value().sampleId = sampleId(samples[i], i);
            values.push_back(std::move(v).value());
        }
        results.push_back(aggregateResults(metric, values));
    }
    return results;
}

Result<CustomMetric> CustomMetricsEvaluator::saveMetric(const CustomMetric& metric) {
    if (!store_)
        return Error{ErrorCode::NotInitialized, "custom metric store not configured"};
    if (metric.name.empty())
        return Error{ErrorCode::InvalidArgument, "custom metric requires a name"};
    if (metric.weight < 0.0)
        return Error{ErrorCode::InvalidArgument, "custom metric weight must be non-negative"};
    if (metric.type == MetricType::Custom) {
        // Syntax check against an empty sample; field lookups resolve to 0.
        auto probe = FormulaEvaluator::evaluate(metric.formula, json::object());
        if (!probe)
            return probe.error();
    }
    if (auto pattern = compilePattern(metric); !pattern)
        return pattern.error();

    auto stored = store_->saveMetric(metric);
    if (!stored)
        return stored.error();

    const auto& saved = stored.value();
    std::unique_lock lock(mutex_);
    // A metric moved to another project must stop scoring for its previous owner.
    for (auto& [projectId, metrics] : cache_) {
        if (projectId != saved.projectId)
            metrics.erase(saved.id);
    }
    auto& project = cache_[saved.projectId];
    if (saved.enabled)
        project[saved.id] = saved;
    else
        project.erase(saved.id);
    return stored;
}

Result<void> CustomMetricsEvaluator::deleteMetric(ProjectId projectId, MetricId metricId) {
    if (!store_)
        return Error{ErrorCode::NotInitialized, "custom metric store not configured"};

    auto removed = store_->deleteMetric(projectId, metricId);
    if (!removed)
        return removed;

    std::unique_lock lock(mutex_);
    if (auto it = cache_.find(projectId); it != cache_.end())
        it->second.erase(metricId);
    return {};
}

std::vector<CustomMetric> CustomMetricsEvaluator::loadedMetrics(ProjectId projectId) const {
    std::vector<CustomMetric> out;
    {
        std::shared_lock lock(mutex_);
        auto it = cache_.find(projectId);
        if (it == cache_.end())
            return out;
        out.reserve(it->second.size());
        for (const auto& [id, metric] : it->second)
            out.push_back(metric);
    }
    std::sort(out.begin(), out.end(),
              [](const CustomMetric& a, const CustomMetric& b) { return a.id < b.id; });
    return out;
}

std::optional<CustomMetric> CustomMetricsEvaluator::findMetric(ProjectId projectId,
                                                               MetricId metricId) const {
    std::shared_lock lock(mutex_);
    auto project = cache_.find(projectId);
    if (project == cache_.end())
        return std::nullopt;
    auto it = project->second.find(metricId);
    if (it == project->second.end())
        return std::nullopt;
    return it->second;
}

} // namespace evalforge::evaluation
