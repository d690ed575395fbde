#include <evalforge/evaluation/metrics_calculator.h>
#include <evalforge/evaluation/text_similarity.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <set>

namespace evalforge::evaluation {

namespace {

using json = nlohmann::json;

constexpr std::array<const char*, 6> kClassFields{"class",    "label",      "sentiment",
                                                   "category", "prediction", "result"};
constexpr std::array<const char*, 7> kTextFields{"text",    "result", "output",   "response",
                                                  "summary", "answer", "generated"};

std::string scalarToString(const json& v) {
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_null())
        return {};
    return v.dump();
}

template <std::size_t N>
std::string firstField(const json& output, const std::array<const char*, N>& fields) {
    if (!output.is_object())
        return {};
    for (const char* field : fields) {
        if (auto it = output.find(field); it != output.end())
            return scalarToString(*it);
    }
    return {};
}

double safeRatio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

} // namespace

double categoryPassRate(const std::vector<TestCase>& testCases, TestCaseCategory category) {
    int total = 0;
    int passed = 0;
    for (const auto& tc : testCases) {
        if (tc.category != category)
            continue;
        ++total;
        if (tc.status == TestCaseStatus::Passed)
            ++passed;
    }
    return safeRatio(passed, total);
}

std::string MetricsCalculator::extractClassLabel(const json& output) {
    return firstField(output, kClassFields);
}

std::string MetricsCalculator::extractText(const json& output) {
    return firstField(output, kTextFields);
}

Result<EvaluationMetrics> MetricsCalculator::calculateMetrics(const std::vector<TestCase>& testCases,
                                                              TaskType taskType) {
    PromptAnalysis analysis;
    analysis.taskType = taskType;
    return calculateMetrics(testCases, analysis);
}

Result<EvaluationMetrics> MetricsCalculator::calculateMetrics(const std::vector<TestCase>& testCases,
                                                              const PromptAnalysis& analysis) {
    if (testCases.empty())
        return Error{ErrorCode::InvalidArgument, "no test cases provided for metrics calculation"};

    EvaluationMetrics metrics;
    metrics.evaluationId = testCases.front().evaluationId;
    metrics.calculatedAt = std::chrono::system_clock::now();

    double totalScore = 0.0;
    double totalWeight = 0.0;
    for (const auto& tc : testCases) {
        if (tc.status == TestCaseStatus::Passed)
            ++metrics.passedCount;
        totalScore += tc.score * tc.weight;
        totalWeight += tc.weight;
        metrics.simulated = metrics.simulated || tc.simulated;
    }
    metrics.totalCount = static_cast<int>(testCases.size());
    metrics.passRate = static_cast<double>(metrics.passedCount) / metrics.totalCount;
    metrics.overallScore = safeRatio(totalScore, totalWeight);

    switch (analysis.taskType) {
        case TaskType::Classification: {
            std::vector<std::string> predictions;
            std::vector<std::string> truth;
            for (const auto& tc : testCases) {
                if (!tc.actualOutput)
                    continue;
                auto pred = extractClassLabel(*tc.actualOutput);
                auto expected = extractClassLabel(tc.expectedOutput);
                if (pred.empty() || expected.empty())
                    continue;
                predictions.push_back(std::move(pred));
                truth.push_back(std::move(expected));
            }
            if (predictions.empty()) {
                spdlog::debug("metrics: no scorable classification pairs in {} test cases",
                              testCases.size());
                break;
            }
            auto cm = calculateClassificationMetrics(predictions, truth,
                                                     analysis.outputSchema.classes);
            if (!cm)
                return cm.error();
            metrics.classification = std::move(cm).value();
            break;
        }
        case TaskType::Generation:
        case TaskType::Summarization: {
            std::vector<std::string> predictions;
            std::vector<std::string> references;
            for (const auto& tc : testCases) {
                if (!tc.actualOutput)
                    continue;
                auto pred = extractText(*tc.actualOutput);
                auto ref = extractText(tc.expectedOutput);
                if (pred.empty() || ref.empty())
                    continue;
                predictions.push_back(std::move(pred));
                references.push_back(std::move(ref));
            }
            if (predictions.empty()) {
                spdlog::debug("metrics: no scorable generation pairs in {} test cases",
                              testCases.size());
                break;
            }
            auto gm = calculateGenerationMetrics(predictions, references);
            if (!gm)
                return gm.error();
            metrics.generation = std::move(gm).value();
            break;
        }
        default:
            for (auto& [key, value] : calculateTaskSpecificMetrics(testCases, analysis.taskType))
                metrics.customMetrics[key] = value;
            break;
    }

    for (auto& [key, value] : calculateCustomMetrics(testCases))
        metrics.customMetrics[key] = value;

    return metrics;
}

Result<ClassificationMetrics>
MetricsCalculator::calculateClassificationMetrics(const std::vector<std::string>& predictions,
                                                  const std::vector<std::string>& groundTruth,
                                                  std::vector<std::string> classes) const {
    if (predictions.size() != groundTruth.size())
        return Error{ErrorCode::InvalidArgument,
                     "predictions and ground truth must have the same length"};
    if (predictions.empty())
        return Error{ErrorCode::InvalidArgument, "no predictions provided"};

    if (classes.empty()) {
        std::set<std::string> seen(predictions.begin(), predictions.end());
        seen.insert(groundTruth.begin(), groundTruth.end());
        classes.assign(seen.begin(), seen.end());
    } else {
        std::set<std::string> known;
        std::vector<std::string> unique;
        for (auto& c : classes) {
            if (known.insert(c).second)
                unique.push_back(c);
        }
        classes = std::move(unique);
        auto addUnknown = [&](const std::string& label) {
            if (known.insert(label).second)
                classes.push_back(label);
        };
        for (std::size_t i = 0; i < predictions.size(); ++i) {
            addUnknown(groundTruth[i]);
            addUnknown(predictions[i]);
        }
    }

    ClassificationMetrics m;
    for (const auto& truth : classes) {
        auto& row = m.confusionMatrix[truth];
        for (const auto& pred : classes)
            row[pred] = 0;
        m.support[truth] = 0;
    }

    int correct = 0;
    for (std::size_t i = 0; i < predictions.size(); ++i) {
        ++m.confusionMatrix[groundTruth[i]][predictions[i]];
        ++m.support[groundTruth[i]];
        if (predictions[i] == groundTruth[i])
            ++correct;
    }
    m.accuracy = static_cast<double>(correct) / static_cast<double>(predictions.size());

    double f1Sum = 0.0;
    double weightedF1Sum = 0.0;
    int totalSupport = 0;
    for (const auto& cls : classes) {
        const int tp = m.confusionMatrix[cls][cls];
        int fp = 0;
        int fn = 0;
        for (const auto& other : classes) {
            if (other == cls)
                continue;
            fp += m.confusionMatrix[other][cls];
            fn += m.confusionMatrix[cls][other];
        }

        const double precision = safeRatio(tp, tp + fp);
        const double recall = safeRatio(tp, tp + fn);
        const double f1 = safeRatio(2.0 * precision * recall, precision + recall);
        m.precision[cls] = precision;
        m.recall[cls] = recall;
        m.f1Score[cls] = f1;

        f1Sum += f1;
        weightedF1Sum += f1 * m.support[cls];
        totalSupport += m.support[cls];
    }
    m.macroF1 = safeRatio(f1Sum, static_cast<double>(classes.size()));
    m.weightedF1 = safeRatio(weightedF1Sum, totalSupport);
    return m;
}

Result<GenerationMetrics>
MetricsCalculator::calculateGenerationMetrics(const std::vector<std::string>& predictions,
                                              const std::vector<std::string>& references) const {
    if (predictions.size() != references.size())
        return Error{ErrorCode::InvalidArgument,
                     "predictions and references must have the same length"};
    if (predictions.empty())
        return Error{ErrorCode::InvalidArgument, "no predictions provided"};

    GenerationMetrics m;
    for (std::size_t i = 0; i < predictions.size(); ++i) {
        const auto pred = text::tokenize(predictions[i]);
        const auto ref = text::tokenize(references[i]);
        m.bleu += text::bleu(pred, ref);
        m.rouge1 += text::rouge1(pred, ref);
        m.rouge2 += text::rouge2(pred, ref);
        m.rougeL += text::rougeL(pred, ref);
        m.diversity += text::lexicalDiversity(pred);
        m.coherence += text::coherence(predictions[i]);
        m.relevance += text::relevance(pred, ref);
    }

    const auto n = static_cast<double>(predictions.size());
    m.bleu /= n;
    m.rouge1 /= n;
    m.rouge2 /= n;
    m.rougeL /= n;
    m.diversity /= n;
    m.coherence /= n;
    m.relevance /= n;

    m.bertScore = m.rouge1;
    m.perplexity = std::max(1.0, 100.0 - m.rouge1 * 100.0);
    return m;
}

std::map<std::string, double>
MetricsCalculator::calculateCustomMetrics(const std::vector<TestCase>& testCases) const {
    std::map<std::string, double> out;
    if (testCases.empty())
        return out;

    int errors = 0;
    int simulated = 0;
    double totalScore = 0.0;
    double totalWeight = 0.0;
    for (const auto& tc : testCases) {
        if (tc.status == TestCaseStatus::Failed || tc.status == TestCaseStatus::Error)
            ++errors;
        if (tc.simulated)
            ++simulated;
        totalScore += tc.score * tc.weight;
        totalWeight += tc.weight;
    }

    const auto n = static_cast<double>(testCases.size());
    out["error_rate"] = errors / n;
    out["edge_case_performance"] = categoryPassRate(testCases, TestCaseCategory::EdgeCase);
    out["adversarial_performance"] = categoryPassRate(testCases, TestCaseCategory::Adversarial);
    out["weighted_score"] = safeRatio(totalScore, totalWeight);
    out["simulated_fraction"] = simulated / n;
    return out;
}

std::map<std::string, double>
MetricsCalculator::calculateTaskSpecificMetrics(const std::vector<TestCase>& testCases,
                                                TaskType taskType) const {
    std::map<std::string, double> out;
    if (testCases.empty())
        return out;

    switch (taskType) {
        case TaskType::Extraction: {
            const double precision = categoryPassRate(testCases, TestCaseCategory::Normal);
            const double recall = categoryPassRate(testCases, TestCaseCategory::EdgeCase);
            out["extraction_precision"] = precision;
            out["extraction_recall"] = recall;
            out["extraction_f1"] = safeRatio(2.0 * precision * recall, precision + recall);
            break;
        }
        case TaskType::QuestionAnswering:
            out["answer_accuracy"] = categoryPassRate(testCases, TestCaseCategory::Normal);
            out["answer_completeness"] = categoryPassRate(testCases, TestCaseCategory::EdgeCase);
            break;
        case TaskType::Transformation: {
            const auto n = static_cast<double>(testCases.size());
            auto wellFormed = std::count_if(testCases.begin(), testCases.end(), [](const auto& tc) {
                return tc.status != TestCaseStatus::Error;
            });
            auto passed = std::count_if(testCases.begin(), testCases.end(), [](const auto& tc) {
                return tc.status == TestCaseStatus::Passed;
            });
            out["format_compliance"] = static_cast<double>(wellFormed) / n;
            out["content_preservation"] = static_cast<double>(passed) / n;
            break;
        }
        default:
            break;
    }
    return out;
}

} // namespace evalforge::evaluation
