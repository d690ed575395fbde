#pragma once

#include <evalforge/core/types.h>

#include <memory>
#include <string>
#include <CLI/CLI.hpp>

namespace evalforge::cli {

class EvalforgeCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "run", "score")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, EvalforgeCLI* cli) = 0;

    /**
     * Execute the command. Called once after parsing and configuration loading.
     */
    virtual Result<void> execute() = 0;
};

std::unique_ptr<ICommand> createRunCommand();
std::unique_ptr<ICommand> createScoreCommand();
std::unique_ptr<ICommand> createCustomCommand();

} // namespace evalforge::cli
