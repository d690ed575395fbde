#include <evalforge/cli/command.h>
#include <evalforge/cli/evalforge_cli.h>
#include <evalforge/evaluation/custom_metrics.h>
#include <evalforge/evaluation/memory_repository.h>
#include <evalforge/evaluation/suite_fixtures.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <iostream>

namespace evalforge::cli {

using json = nlohmann::json;
using namespace evalforge::evaluation;

class CustomCommand : public ICommand {
public:
    std::string getName() const override { return "custom"; }

    std::string getDescription() const override {
        return "Evaluate project-defined custom metrics over sample records";
    }

    void registerCommand(CLI::App& app, EvalforgeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--metrics", metricsPath_, "JSON array of metric definitions")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("--samples", samplesPath_, "JSON array of sample objects")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("--project", projectId_, "Project the metrics belong to")
            ->default_val(1);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto metricsDoc = readJsonFile(metricsPath_);
        if (!metricsDoc)
            return metricsDoc.error();
        auto samplesDoc = readJsonFile(samplesPath_);
        if (!samplesDoc)
            return samplesDoc.error();
        if (!metricsDoc.value().is_array())
            return Error{ErrorCode::InvalidArgument, "metric definitions must be a JSON array"};
        if (!samplesDoc.value().is_array())
            return Error{ErrorCode::InvalidArgument, "samples must be a JSON array"};

        CustomMetricsEvaluator evaluator(std::make_shared<InMemoryCustomMetricStore>());
        for (const auto& raw : metricsDoc.value()) {
            auto metric = CustomMetric::fromJson(raw);
            if (!metric)
                return metric.error();
            auto m = std::move(metric).value();
            m.id = 0;
            m.projectId = projectId_;
            auto saved = evaluator.saveMetric(m);
            if (!saved)
                return Error{saved.error().code,
                             fmt::format("metric '{}': {}", m.name, saved.error().message)};
        }

        std::vector<json> samples(samplesDoc.value().begin(), samplesDoc.value().end());
        auto results = evaluator.evaluateSamples(projectId_, samples);
        if (!results)
            return results.error();

        json out = json::array();
        for (const auto& r : results.value())
            out.push_back(r.toJson());
        spdlog::debug("evaluated {} metrics over {} samples", results.value().size(),
                      samples.size());
        std::cout << out.dump(2) << std::endl;
        return {};
    }

private:
    EvalforgeCLI* cli_{nullptr};
    std::string metricsPath_;
    std::string samplesPath_;
    ProjectId projectId_{1};
};

std::unique_ptr<ICommand> createCustomCommand() {
    return std::make_unique<CustomCommand>();
}

} // namespace evalforge::cli
