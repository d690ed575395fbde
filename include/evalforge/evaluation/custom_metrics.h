#pragma once

#include <evalforge/core/types.h>

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace evalforge::evaluation {

enum class MetricType { Numeric, Boolean, String, Percentage, Score, Custom };

[[nodiscard]] constexpr const char* metricTypeToString(MetricType t) noexcept {
    switch (t) {
        case MetricType::Numeric:
            return "numeric";
        case MetricType::Boolean:
            return "boolean";
        case MetricType::String:
            return "string";
        case MetricType::Percentage:
            return "percentage";
        case MetricType::Score:
            return "score";
        case MetricType::Custom:
            return "custom";
    }
    return "unknown";
}

enum class AggregationType { Average, Sum, Min, Max, Median, P95, P99, Count };

[[nodiscard]] constexpr const char* aggregationTypeToString(AggregationType a) noexcept {
    switch (a) {
        case AggregationType::Average:
            return "average";
        case AggregationType::Sum:
            return "sum";
        case AggregationType::Min:
            return "min";
        case AggregationType::Max:
            return "max";
        case AggregationType::Median:
            return "median";
        case AggregationType::P95:
            return "p95";
        case AggregationType::P99:
            return "p99";
        case AggregationType::Count:
            return "count";
    }
    return "unknown";
}

enum class ThresholdOperator { Greater, GreaterEqual, Less, LessEqual, Equal, NotEqual };

[[nodiscard]] constexpr const char* thresholdOperatorToString(ThresholdOperator op) noexcept {
    switch (op) {
        case ThresholdOperator::Greater:
            return ">";
        case ThresholdOperator::GreaterEqual:
            return ">=";
        case ThresholdOperator::Less:
            return "<";
        case ThresholdOperator::LessEqual:
            return "<=";
        case ThresholdOperator::Equal:
            return "==";
        case ThresholdOperator::NotEqual:
            return "!=";
    }
    return "?";
}

Result<MetricType> parseMetricType(std::string_view s);
Result<AggregationType> parseAggregationType(std::string_view s);
Result<ThresholdOperator> parseThresholdOperator(std::string_view s);

// Tolerance for == and != comparisons.
inline constexpr double kThresholdEpsilon = 1e-4;

struct MetricThresholds {
    double passValue{0.0};
    std::optional<double> warningValue;
    std::optional<double> failValue;
    ThresholdOperator op{ThresholdOperator::GreaterEqual};
};

struct CustomMetric {
    MetricId id{0};
    ProjectId projectId{0};
    std::string name;
    std::string description;
    MetricType type{MetricType::Numeric};
    AggregationType aggregation{AggregationType::Average};
    // Regex for string metrics, arithmetic expression for custom metrics.
    std::string formula;
    MetricThresholds thresholds;
    double weight{1.0};
    bool enabled{true};
    TimePoint createdAt{};
    TimePoint updatedAt{};

    [[nodiscard]] nlohmann::json toJson() const;
    static Result<CustomMetric> fromJson(const nlohmann::json& j);
};

using RawMetricValue = std::variant<double, bool, std::string>;

struct MetricValue {
    MetricId metricId{0};
    EvaluationId evaluationId{0};
    std::string sampleId;
    RawMetricValue value{0.0};
    // Representative used for thresholds and aggregation.
    double numericValue{0.0};
    bool passed{false};
    TimePoint timestamp{};
    nlohmann::json metadata = nlohmann::json::object();

    [[nodiscard]] nlohmann::json toJson() const;
};

struct MetricResult {
    MetricId metricId{0};
    std::string metricName;
    double value{0.0};
    bool passed{false};
    double passRate{0.0};
    int sampleCount{0};
    // min/max/median/avg for percentile aggregations
    std::map<std::string, double> details;

    [[nodiscard]] nlohmann::json toJson() const;
};

bool checkThreshold(double value, const MetricThresholds& thresholds);

// Linear interpolation at index p/100 * (n-1) of the sorted values; 0 for empty input.
double percentile(std::vector<double> values, double p);

double aggregate(const std::vector<double>& values, AggregationType aggregation);

/**
 * @brief Storage for custom metric definitions.
 *
 * saveMetric inserts when id is 0 and updates otherwise; it returns the stored record.
 * Names are unique per project.
 */
class ICustomMetricStore {
public:
    virtual ~ICustomMetricStore() = default;
    virtual Result<std::vector<CustomMetric>> listMetrics(ProjectId projectId,
                                                          bool enabledOnly) = 0;
    virtual Result<CustomMetric> saveMetric(const CustomMetric& metric) = 0;
    virtual Result<void> deleteMetric(ProjectId projectId, MetricId metricId) = 0;
};

/**
 * @brief Scores user-defined metrics per sample and aggregates them.
 *
 * Definitions are cached per project. loadMetrics replaces one project's cache
 * wholesale; other projects are untouched. The cache is guarded by a
 * reader/writer lock so one instance may serve concurrent callers.
 */
class CustomMetricsEvaluator {
public:
    explicit CustomMetricsEvaluator(std::shared_ptr<ICustomMetricStore> store);

    Result<void> loadMetrics(ProjectId projectId);

    // Evaluates @p metric against one sample object; never fails for well-formed metrics.
    Result<MetricValue> evaluateMetric(const CustomMetric& metric, const nlohmann::json& sample) const;

    Result<MetricValue> evaluateMetric(ProjectId projectId, MetricId metricId,
                                       const nlohmann::json& sample) const;

    // NotFound when @p metricId is not loaded for @p projectId.
    Result<MetricResult> aggregateResults(ProjectId projectId, MetricId metricId,
                                          const std::vector<MetricValue>& values) const;

    static MetricResult aggregateResults(const CustomMetric& metric,
                                         const std::vector<MetricValue>& values);

    // Every loaded metric of the project over every sample, ordered by metric id.
    Result<std::vector<MetricResult>> evaluateSamples(ProjectId projectId,
                                                      const std::vector<nlohmann::json>& samples) const;

    Result<CustomMetric> saveMetric(const CustomMetric& metric);
    Result<void> deleteMetric(ProjectId projectId, MetricId metricId);

    std::vector<CustomMetric> loadedMetrics(ProjectId projectId) const;

private:
    std::optional<CustomMetric> findMetric(ProjectId projectId, MetricId metricId) const;

    std::shared_ptr<ICustomMetricStore> store_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<ProjectId, std::unordered_map<MetricId, CustomMetric>> cache_;
};

} // namespace evalforge::evaluation
