#include <evalforge/cli/command.h>
#include <evalforge/cli/evalforge_cli.h>
#include <evalforge/evaluation/error_heuristics.h>
#include <evalforge/evaluation/metrics_calculator.h>
#include <evalforge/evaluation/suite_fixtures.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <iostream>

namespace evalforge::cli {

using json = nlohmann::json;
using namespace evalforge::evaluation;

class ScoreCommand : public ICommand {
public:
    std::string getName() const override { return "score"; }

    std::string getDescription() const override {
        return "Compute metrics for already executed test cases";
    }

    void registerCommand(CLI::App& app, EvalforgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--cases", casesPath_,
                        "JSON array of test cases, or an object with a test_cases array")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("-t,--task-type", taskType_, "Task type of the prompt")
            ->required()
            ->check(CLI::IsMember({"classification", "generation", "extraction", "summarization",
                                   "question_answering", "transformation", "completion"}));
        cmd->add_option("--classes", classes_, "Known output classes for classification");
        cmd->add_flag("--errors", withErrors_, "Include heuristic error analysis");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto doc = readJsonFile(casesPath_);
        if (!doc)
            return doc.error();

        const json* list = &doc.value();
        if (list->is_object()) {
            auto it = list->find("test_cases");
            if (it == list->end())
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("{} has no test_cases array", casesPath_)};
            list = &*it;
        }
        if (!list->is_array())
            return Error{ErrorCode::InvalidArgument, "test cases must be a JSON array"};

        std::vector<TestCase> cases;
        for (const auto& raw : *list) {
            auto tc = TestCase::fromJson(raw);
            if (!tc)
                return tc.error();
            cases.push_back(std::move(tc).value());
        }

        auto type = parseTaskType(taskType_);
        if (!type)
            return type.error();
        PromptAnalysis analysis;
        analysis.taskType = type.value();
        analysis.outputSchema.classes = classes_;

        MetricsCalculator calculator;
        auto metrics = calculator.calculateMetrics(cases, analysis);
        if (!metrics)
            return metrics.error();
        spdlog::debug("scored {} test cases as {}", cases.size(), taskType_);

        json out = metrics.value().toJson();
        if (withErrors_)
            out["error_analysis"] = basicErrorAnalysis(cases).toJson();
        std::cout << out.dump(2) << std::endl;
        return {};
    }

private:
    EvalforgeCLI* cli_{nullptr};
    std::string casesPath_;
    std::string taskType_;
    std::vector<std::string> classes_;
    bool withErrors_{false};
};

std::unique_ptr<ICommand> createScoreCommand() {
    return std::make_unique<ScoreCommand>();
}

} // namespace evalforge::cli
