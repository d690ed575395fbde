#include <evalforge/cli/command.h>
#include <evalforge/cli/evalforge_cli.h>
#include <evalforge/evaluation/memory_repository.h>
#include <evalforge/evaluation/orchestrator.h>
#include <evalforge/evaluation/suite_fixtures.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <iostream>

namespace evalforge::cli {

using namespace evalforge::evaluation;

namespace {

void renderText(const Evaluation& e) {
    std::cout << fmt::format("Evaluation {} '{}': {} ({:.0f}%)\n", e.id, e.name,
                             evaluationStatusToString(e.status), e.progress);
    if (!e.errorMessage.empty())
        std::cout << fmt::format("  error: {}\n", e.errorMessage);
    if (e.metrics) {
        const auto& m = *e.metrics;
        std::cout << fmt::format("  tests:     {}/{} passed (pass rate {:.3f})\n", m.passedCount,
                                 m.totalCount, m.passRate);
        std::cout << fmt::format("  overall:   {:.3f}\n", m.overallScore);
        if (m.classification)
            std::cout << fmt::format("  accuracy:  {:.3f}\n", m.classification->accuracy);
        if (m.simulated)
            std::cout << "  note: outputs were simulated\n";
    }
    if (e.errorAnalysis) {
        for (const auto& [pattern, count] : e.errorAnalysis->errorPatterns)
            std::cout << fmt::format("  pattern:   {} x{}\n", pattern, count);
    }
    for (const auto& s : e.suggestions)
        std::cout << fmt::format("  suggest:   [{}] {}\n", suggestionPriorityToString(s.priority),
                                 s.title);
}

} // namespace

class RunCommand : public ICommand {
public:
    std::string getName() const override { return "run"; }

    std::string getDescription() const override {
        return "Run the evaluation pipeline over a recorded suite";
    }

    void registerCommand(CLI::App& app, EvalforgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("-s,--suite", suitePath_, "Suite JSON file")
            ->required()
            ->check(CLI::ExistingFile);
        projectOpt_ = cmd->add_option("--project", projectId_, "Override the suite project id");
        cmd->add_flag("--no-suggest", noSuggest_, "Skip the suggest stage");
        cmd->add_option("--format", format_, "Output format: json, text")
            ->default_val("json")
            ->check(CLI::IsMember({"json", "text"}));

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto suite = loadSuite(suitePath_);
        if (!suite)
            return suite.error();
        const auto& s = suite.value();

        auto cfg = cli_->orchestratorConfig();
        auto repository = std::make_shared<InMemoryEvaluationRepository>();
        EvaluationOrchestrator orchestrator(makeSuiteCollaborators(s, repository), cfg);

        auto options = orchestrator.defaultOptions();
        options.name = s.name;
        options.description = s.description;
        if (s.generator) {
            options.generator = *s.generator;
            if (!options.generator.seed)
                options.generator.seed = cfg.generator.seed;
        }
        options.autoSuggest = options.autoSuggest && !noSuggest_;

        ProjectId projectId = projectOpt_->count() > 0 ? projectId_ : s.projectId;
        auto created = orchestrator.createEvaluation(projectId, s.prompt, options);
        if (!created)
            return created.error();

        auto ran = orchestrator.runEvaluation(created.value().id);
        // Report the stored record either way; a failed run still carries its reason.
        auto stored = orchestrator.getEvaluation(created.value().id);
        if (!stored)
            return stored.error();

        if (format_ == "text")
            renderText(stored.value());
        else
            std::cout << stored.value().toJson().dump(2) << std::endl;

        if (!ran)
            return ran.error();
        return {};
    }

private:
    EvalforgeCLI* cli_{nullptr};
    std::string suitePath_;
    ProjectId projectId_{1};
    CLI::Option* projectOpt_{nullptr};
    bool noSuggest_{false};
    std::string format_{"json"};
};

std::unique_ptr<ICommand> createRunCommand() {
    return std::make_unique<RunCommand>();
}

} // namespace evalforge::cli
