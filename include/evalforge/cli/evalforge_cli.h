#pragma once

#include <evalforge/cli/command.h>
#include <evalforge/config/engine_config.h>
#include <evalforge/evaluation/orchestrator.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>

namespace evalforge::cli {

/**
 * Main CLI application class
 */
class EvalforgeCLI {
public:
    EvalforgeCLI();
    ~EvalforgeCLI();

    /**
     * Run the CLI with given arguments. Returns the process exit code.
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until parsing and configuration are complete.
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    const config::EngineConfig& getConfig() const { return config_; }

    bool getVerbose() const { return verbose_; }

    // Seed from --seed, when given.
    std::optional<uint64_t> getSeedOverride() const;

    // Engine settings with --seed applied.
    evaluation::EvaluationOrchestrator::Config orchestratorConfig() const;

private:
    void registerBuiltinCommands();
    Result<void> loadConfiguration();
    void applyLogging();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::string configPath_;
    bool verbose_{false};
    uint64_t seed_{0};
    CLI::Option* seedOpt_{nullptr};
    config::EngineConfig config_;
};

} // namespace evalforge::cli
