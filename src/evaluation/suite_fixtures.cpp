#include <evalforge/evaluation/metrics_calculator.h>
#include <evalforge/evaluation/suite_fixtures.h>
#include <evalforge/evaluation/text_similarity.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace evalforge::evaluation {

namespace {

using json = nlohmann::json;

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Share of expected keys whose values match exactly.
double fieldMatchRatio(const json& expected, const json& actual) {
    if (expected.empty())
        return actual.empty() ? 1.0 : 0.0;
    std::size_t matched = 0;
    for (auto it = expected.begin(); it != expected.end(); ++it) {
        auto found = actual.find(it.key());
        if (found != actual.end() && *found == it.value())
            ++matched;
    }
    return static_cast<double>(matched) / static_cast<double>(expected.size());
}

} // namespace

Result<json> readJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in)
        return Error{ErrorCode::NotFound, fmt::format("cannot open {}", path.string())};
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("{} is not valid JSON: {}", path.string(), e.what())};
    }
}

Result<EvaluationSuite> EvaluationSuite::fromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "suite must be a JSON object"};

    try {
        EvaluationSuite suite;
        suite.name = j.value("name", std::string{"suite"});
        suite.description = j.value("description", std::string{});
        suite.projectId = j.value("project_id", int64_t{1});
        suite.prompt = j.value("prompt", std::string{});
        if (suite.prompt.empty())
            return Error{ErrorCode::InvalidArgument, "suite requires a non-empty prompt"};

        auto analysisIt = j.find("analysis");
        if (analysisIt == j.end())
            return Error{ErrorCode::InvalidArgument, "suite requires an analysis object"};
        auto analysis = PromptAnalysis::fromJson(*analysisIt);
        if (!analysis)
            return analysis.error();
        suite.analysis = std::move(analysis).value();
        suite.analysis.promptText = suite.prompt;

        if (auto it = j.find("test_cases"); it != j.end() && it->is_array()) {
            for (const auto& raw : *it) {
                auto tc = TestCase::fromJson(raw);
                if (!tc)
                    return Error{tc.error().code,
                                 fmt::format("test case {}: {}", suite.testCases.size(),
                                             tc.error().message)};
                suite.testCases.push_back(std::move(tc).value());
            }
        }
        if (suite.testCases.empty())
            return Error{ErrorCode::InvalidArgument, "suite requires at least one test case"};

        if (auto it = j.find("suggestions"); it != j.end() && it->is_array()) {
            for (const auto& raw : *it) {
                auto s = OptimizationSuggestion::fromJson(raw);
                if (!s)
                    return s.error();
                suite.suggestions.push_back(std::move(s).value());
            }
        }

        if (auto it = j.find("options"); it != j.end() && it->is_object()) {
            TestGeneratorOptions opts;
            opts.normalCases = it->value("normal_cases", opts.normalCases);
            opts.edgeCases = it->value("edge_cases", opts.edgeCases);
            opts.adversarialCases = it->value("adversarial_cases", opts.adversarialCases);
            if (auto seed = it->find("seed");
                seed != it->end() && seed->is_number_integer() && seed->get<int64_t>() >= 0)
                opts.seed = seed->get<uint64_t>();
            suite.generator = opts;
        }
        return suite;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, fmt::format("malformed suite: {}", e.what())};
    }
}

Result<EvaluationSuite> loadSuite(const std::filesystem::path& path) {
    auto doc = readJsonFile(path);
    if (!doc)
        return doc.error();
    auto suite = EvaluationSuite::fromJson(doc.value());
    if (suite)
        spdlog::debug("loaded suite '{}' with {} test cases from {}", suite.value().name,
                      suite.value().testCases.size(), path.string());
    return suite;
}

Result<PromptAnalysis> FixtureAnalyzer::analyzePrompt(const RunContext& ctx,
                                                      const std::string& promptText,
                                                      const std::vector<Example>&) {
    if (auto check = ctx.checkpoint("analyze"); !check)
        return check.error();
    auto analysis = analysis_;
    analysis.promptText = promptText;
    return analysis;
}

Result<std::vector<TestCase>> FixtureGenerator::generateTestCases(const RunContext& ctx,
                                                                  const PromptAnalysis&,
                                                                  const TestGeneratorOptions&) {
    if (auto check = ctx.checkpoint("generate"); !check)
        return check.error();
    return testCases_;
}

double RecordedOutputExecutor::passThreshold(TaskType taskType) noexcept {
    switch (taskType) {
        case TaskType::Classification:
            return 1.0;
        case TaskType::Generation:
        case TaskType::Summarization:
        case TaskType::Completion:
            return 0.5;
        default:
            return 0.8;
    }
}

double RecordedOutputExecutor::scoreOutput(TaskType taskType, const json& expected,
                                           const json& actual) {
    switch (taskType) {
        case TaskType::Classification: {
            auto want = lowered(MetricsCalculator::extractClassLabel(expected));
            auto got = lowered(MetricsCalculator::extractClassLabel(actual));
            return !want.empty() && want == got ? 1.0 : 0.0;
        }
        case TaskType::Generation:
        case TaskType::Summarization:
        case TaskType::Completion: {
            auto ref = text::tokenize(MetricsCalculator::extractText(expected));
            auto pred = text::tokenize(MetricsCalculator::extractText(actual));
            return text::rougeL(pred, ref);
        }
        default:
            if (expected == actual)
                return 1.0;
            if (expected.is_object() && actual.is_object())
                return fieldMatchRatio(expected, actual);
            return 0.0;
    }
}

Result<std::vector<TestCase>>
RecordedOutputExecutor::executeTestCases(const RunContext& ctx,
                                         const std::vector<TestCase>& testCases,
                                         const std::string&, const ExecutorOptions&) {
    std::vector<TestCase> out;
    out.reserve(testCases.size());
    for (const auto& tc : testCases) {
        if (auto check = ctx.checkpoint("execute"); !check)
            return check.error();
        if (!tc.actualOutput)
            return Error{ErrorCode::NotFound,
                         fmt::format("no recorded output for test case '{}'", tc.name)};

        auto done = tc;
        done.score = std::clamp(scoreOutput(taskType_, tc.expectedOutput, *tc.actualOutput), 0.0,
                                1.0);
        done.status = done.score >= passThreshold(taskType_) ? TestCaseStatus::Passed
                                                             : TestCaseStatus::Failed;
        done.executedAt = std::chrono::system_clock::now();
        done.simulated = false;
        out.push_back(std::move(done));
    }
    return out;
}

Result<std::vector<OptimizationSuggestion>>
FixtureOptimizer::suggestImprovements(const RunContext& ctx, const std::string& promptText,
                                      const EvaluationMetrics&, const ErrorAnalysis&) {
    if (auto check = ctx.checkpoint("suggest"); !check)
        return check.error();
    auto out = suggestions_;
    for (auto& s : out) {
        if (s.oldPrompt.empty())
            s.oldPrompt = promptText;
    }
    return out;
}

PipelineCollaborators makeSuiteCollaborators(const EvaluationSuite& suite,
                                             std::shared_ptr<IEvaluationRepository> repository) {
    PipelineCollaborators c;
    c.analyzer = std::make_shared<FixtureAnalyzer>(suite.analysis);
    c.generator = std::make_shared<FixtureGenerator>(suite.testCases);
    c.executor = std::make_shared<RecordedOutputExecutor>(suite.analysis.taskType);
    if (!suite.suggestions.empty())
        c.optimizer = std::make_shared<FixtureOptimizer>(suite.suggestions);
    c.repository = std::move(repository);
    return c;
}

} // namespace evalforge::evaluation
