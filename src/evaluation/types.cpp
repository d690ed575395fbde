#include <evalforge/evaluation/types.h>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace evalforge::evaluation {

namespace {

using json = nlohmann::json;

json optionalTime(const std::optional<TimePoint>& tp) {
    return tp ? json(formatTimestamp(*tp)) : json(nullptr);
}

std::vector<std::string> stringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (auto it = j.find(key); it != j.end() && it->is_array()) {
        for (const auto& v : *it) {
            if (v.is_string())
                out.push_back(v.get<std::string>());
        }
    }
    return out;
}

json objectOr(const json& j, const char* key) {
    if (auto it = j.find(key); it != j.end() && !it->is_null())
        return *it;
    return json::object();
}

json constraintToJson(const Constraint& c) {
    return json{{"type", c.type},
                {"description", c.description},
                {"rule", c.rule},
                {"severity", c.severity}};
}

json exampleToJson(const Example& e) {
    return json{{"input", e.input}, {"output", e.output}, {"explanation", e.explanation}};
}

} // namespace

Result<TaskType> parseTaskType(std::string_view s) {
    static constexpr std::array values{TaskType::Classification, TaskType::Generation,
                                       TaskType::Extraction,     TaskType::Summarization,
                                       TaskType::QuestionAnswering, TaskType::Transformation,
                                       TaskType::Completion};
    return detail::parseEnum(s, values, &taskTypeToString, "task type");
}

Result<EvaluationStatus> parseEvaluationStatus(std::string_view s) {
    static constexpr std::array values{EvaluationStatus::Pending, EvaluationStatus::Running,
                                       EvaluationStatus::Completed, EvaluationStatus::Failed};
    return detail::parseEnum(s, values, &evaluationStatusToString, "evaluation status");
}

Result<TestCaseCategory> parseTestCaseCategory(std::string_view s) {
    static constexpr std::array values{TestCaseCategory::Normal, TestCaseCategory::EdgeCase,
                                       TestCaseCategory::Adversarial};
    return detail::parseEnum(s, values, &testCaseCategoryToString, "test case category");
}

Result<TestCaseStatus> parseTestCaseStatus(std::string_view s) {
    static constexpr std::array values{TestCaseStatus::Pending, TestCaseStatus::Passed,
                                       TestCaseStatus::Failed, TestCaseStatus::Error};
    return detail::parseEnum(s, values, &testCaseStatusToString, "test case status");
}

Result<SuggestionType> parseSuggestionType(std::string_view s) {
    static constexpr std::array values{SuggestionType::Clarity, SuggestionType::Specificity,
                                       SuggestionType::Examples, SuggestionType::Format,
                                       SuggestionType::Constraints};
    return detail::parseEnum(s, values, &suggestionTypeToString, "suggestion type");
}

Result<SuggestionPriority> parseSuggestionPriority(std::string_view s) {
    static constexpr std::array values{SuggestionPriority::Low, SuggestionPriority::Medium,
                                       SuggestionPriority::High};
    return detail::parseEnum(s, values, &suggestionPriorityToString, "suggestion priority");
}

Result<SuggestionStatus> parseSuggestionStatus(std::string_view s) {
    static constexpr std::array values{SuggestionStatus::Pending, SuggestionStatus::Accepted,
                                       SuggestionStatus::Rejected, SuggestionStatus::Applied};
    return detail::parseEnum(s, values, &suggestionStatusToString, "suggestion status");
}

std::string formatTimestamp(TimePoint tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(secs));
}

Result<TimePoint> parseTimestamp(std::string_view s) {
    std::tm tm{};
    std::istringstream in{std::string(s)};
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
        return Error{ErrorCode::InvalidArgument, fmt::format("invalid timestamp '{}'", s)};
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

json PromptAnalysis::toJson() const {
    json j;
    j["id"] = id;
    j["evaluation_id"] = evaluationId;
    j["prompt_text"] = promptText;
    j["task_type"] = taskTypeToString(taskType);
    j["input_schema"] = {{"type", inputSchema.type},
                         {"fields", inputSchema.fields},
                         {"required", inputSchema.required},
                         {"constraints", inputSchema.constraints}};
    j["output_schema"] = {{"type", outputSchema.type},
                          {"format", outputSchema.format},
                          {"classes", outputSchema.classes},
                          {"fields", outputSchema.fields},
                          {"constraints", outputSchema.constraints}};
    j["constraints"] = json::array();
    for (const auto& c : constraints)
        j["constraints"].push_back(constraintToJson(c));
    j["examples"] = json::array();
    for (const auto& e : examples)
        j["examples"].push_back(exampleToJson(e));
    j["confidence"] = confidence;
    return j;
}

Result<PromptAnalysis> PromptAnalysis::fromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "prompt analysis must be an object"};

    try {
        PromptAnalysis a;
        a.id = j.value("id", int64_t{0});
        a.evaluationId = j.value("evaluation_id", int64_t{0});
        a.promptText = j.value("prompt_text", std::string{});
        auto tt = parseTaskType(j.value("task_type", std::string{"generation"}));
        if (!tt)
            return tt.error();
        a.taskType = tt.value();

        if (auto it = j.find("input_schema"); it != j.end() && it->is_object()) {
            a.inputSchema.type = it->value("type", std::string{"text"});
            a.inputSchema.fields = objectOr(*it, "fields");
            a.inputSchema.required = stringList(*it, "required");
            a.inputSchema.constraints = objectOr(*it, "constraints");
        }
        if (auto it = j.find("output_schema"); it != j.end() && it->is_object()) {
            a.outputSchema.type = it->value("type", std::string{"text"});
            a.outputSchema.format = it->value("format", std::string{});
            a.outputSchema.classes = stringList(*it, "classes");
            a.outputSchema.fields = objectOr(*it, "fields");
            a.outputSchema.constraints = objectOr(*it, "constraints");
        }
        if (auto it = j.find("constraints"); it != j.end() && it->is_array()) {
            for (const auto& c : *it) {
                Constraint con;
                con.type = c.value("type", std::string{});
                con.description = c.value("description", std::string{});
                con.rule = c.contains("rule") ? c["rule"] : json();
                con.severity = c.value("severity", std::string{"error"});
                a.constraints.push_back(std::move(con));
            }
        }
        if (auto it = j.find("examples"); it != j.end() && it->is_array()) {
            for (const auto& e : *it) {
                Example ex;
                ex.input = objectOr(e, "input");
                ex.output = objectOr(e, "output");
                ex.explanation = e.value("explanation", std::string{});
                a.examples.push_back(std::move(ex));
            }
        }
        a.confidence = j.value("confidence", 0.0);
        return a;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("malformed prompt analysis: {}", e.what())};
    }
}

json TestCase::toJson() const {
    json j;
    j["id"] = id;
    j["evaluation_id"] = evaluationId;
    j["name"] = name;
    j["description"] = description;
    j["input"] = input;
    j["expected_output"] = expectedOutput;
    j["actual_output"] = actualOutput ? *actualOutput : json(nullptr);
    j["category"] = testCaseCategoryToString(category);
    j["weight"] = weight;
    j["status"] = testCaseStatusToString(status);
    j["score"] = score;
    j["executed_at"] = optionalTime(executedAt);
    j["created_at"] = formatTimestamp(createdAt);
    j["simulated"] = simulated;
    return j;
}

Result<TestCase> TestCase::fromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "test case must be an object"};

    try {
        TestCase tc;
        tc.id = j.value("id", int64_t{0});
        tc.evaluationId = j.value("evaluation_id", int64_t{0});
        tc.name = j.value("name", std::string{});
        tc.description = j.value("description", std::string{});
        tc.input = objectOr(j, "input");
        tc.expectedOutput = objectOr(j, "expected_output");
        if (auto it = j.find("actual_output"); it != j.end() && !it->is_null())
            tc.actualOutput = *it;

        auto category = parseTestCaseCategory(j.value("category", std::string{"normal"}));
        if (!category)
            return category.error();
        tc.category = category.value();

        auto status = parseTestCaseStatus(j.value("status", std::string{"pending"}));
        if (!status)
            return status.error();
        tc.status = status.value();

        tc.weight = j.value("weight", 1.0);
        if (tc.weight < 0.0)
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("test case '{}' has negative weight", tc.name)};
        tc.score = std::clamp(j.value("score", 0.0), 0.0, 1.0);

        if (auto it = j.find("executed_at"); it != j.end() && it->is_string()) {
            auto ts = parseTimestamp(it->get<std::string>());
            if (!ts)
                return ts.error();
            tc.executedAt = ts.value();
        }
        tc.simulated = j.value("simulated", false);
        return tc;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("malformed test case: {}", e.what())};
    }
}

json ClassificationMetrics::toJson() const {
    return json{{"accuracy", accuracy},
                {"precision", precision},
                {"recall", recall},
                {"f1_score", f1Score},
                {"macro_f1", macroF1},
                {"weighted_f1", weightedF1},
                {"confusion_matrix", confusionMatrix},
                {"support", support}};
}

json GenerationMetrics::toJson() const {
    return json{{"bleu", bleu},           {"rouge_1", rouge1},       {"rouge_2", rouge2},
                {"rouge_l", rougeL},      {"bert_score", bertScore}, {"perplexity", perplexity},
                {"diversity", diversity}, {"coherence", coherence},  {"relevance", relevance}};
}

json EvaluationMetrics::toJson() const {
    json j;
    j["id"] = id;
    j["evaluation_id"] = evaluationId;
    j["overall_score"] = overallScore;
    j["pass_rate"] = passRate;
    j["test_cases_passed"] = passedCount;
    j["test_cases_total"] = totalCount;
    if (classification)
        j["classification_metrics"] = classification->toJson();
    if (generation)
        j["generation_metrics"] = generation->toJson();
    j["custom_metrics"] = customMetrics;
    j["calculated_at"] = formatTimestamp(calculatedAt);
    j["simulated"] = simulated;
    return j;
}

json ErrorAnalysis::toJson() const {
    return json{{"id", id},
                {"evaluation_id", evaluationId},
                {"common_errors", commonErrors},
                {"error_patterns", errorPatterns},
                {"ambiguous_cases", ambiguousCases},
                {"format_errors", formatErrors},
                {"logic_errors", logicErrors},
                {"inconsistent_cases", inconsistentCases},
                {"error_categories", errorCategories},
                {"created_at", formatTimestamp(createdAt)}};
}

json OptimizationSuggestion::toJson() const {
    return json{{"id", id},
                {"evaluation_id", evaluationId},
                {"type", suggestionTypeToString(type)},
                {"title", title},
                {"description", description},
                {"old_prompt", oldPrompt},
                {"new_prompt", newPrompt},
                {"expected_impact", expectedImpact},
                {"confidence", confidence},
                {"priority", suggestionPriorityToString(priority)},
                {"status", suggestionStatusToString(status)},
                {"reasoning", reasoning},
                {"created_at", formatTimestamp(createdAt)}};
}

Result<OptimizationSuggestion> OptimizationSuggestion::fromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "suggestion must be an object"};

    try {
        OptimizationSuggestion s;
        s.id = j.value("id", int64_t{0});
        s.evaluationId = j.value("evaluation_id", int64_t{0});
        auto type = parseSuggestionType(j.value("type", std::string{"clarity"}));
        if (!type)
            return type.error();
        s.type = type.value();
        auto priority = parseSuggestionPriority(j.value("priority", std::string{"medium"}));
        if (!priority)
            return priority.error();
        s.priority = priority.value();
        auto status = parseSuggestionStatus(j.value("status", std::string{"pending"}));
        if (!status)
            return status.error();
        s.status = status.value();
        s.title = j.value("title", std::string{});
        s.description = j.value("description", std::string{});
        s.oldPrompt = j.value("old_prompt", std::string{});
        s.newPrompt = j.value("new_prompt", std::string{});
        s.expectedImpact = std::clamp(j.value("expected_impact", 0.0), 0.0, 1.0);
        s.confidence = std::clamp(j.value("confidence", 0.0), 0.0, 1.0);
        s.reasoning = j.value("reasoning", std::string{});
        if (s.title.empty())
            return Error{ErrorCode::InvalidArgument, "suggestion requires a title"};
        return s;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("malformed suggestion: {}", e.what())};
    }
}

json Evaluation::toJson() const {
    json j;
    j["id"] = id;
    j["project_id"] = projectId;
    j["name"] = name;
    j["description"] = description;
    j["status"] = evaluationStatusToString(status);
    j["progress"] = progress;
    j["started_at"] = optionalTime(startedAt);
    j["completed_at"] = optionalTime(completedAt);
    j["created_at"] = formatTimestamp(createdAt);
    j["updated_at"] = formatTimestamp(updatedAt);
    if (!errorMessage.empty())
        j["error"] = errorMessage;
    j["options"] = {{"normal_cases", generatorOptions.normalCases},
                    {"edge_cases", generatorOptions.edgeCases},
                    {"adversarial_cases", generatorOptions.adversarialCases},
                    {"max_concurrency", executorOptions.maxConcurrency},
                    {"timeout_seconds", executorOptions.timeoutSeconds},
                    {"retry_count", executorOptions.retryCount},
                    {"auto_suggest", autoSuggest}};
    if (analysis)
        j["prompt_analysis"] = analysis->toJson();
    j["test_cases"] = json::array();
    for (const auto& tc : testCases)
        j["test_cases"].push_back(tc.toJson());
    if (metrics)
        j["metrics"] = metrics->toJson();
    if (errorAnalysis)
        j["error_analysis"] = errorAnalysis->toJson();
    j["suggestions"] = json::array();
    for (const auto& s : suggestions)
        j["suggestions"].push_back(s.toJson());
    return j;
}

} // namespace evalforge::evaluation
