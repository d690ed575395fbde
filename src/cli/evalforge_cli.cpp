#include <evalforge/cli/evalforge_cli.h>
#include <evalforge/version.hpp>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>

namespace evalforge::cli {

EvalforgeCLI::EvalforgeCLI() {
    // Finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("evalforge: prompt evaluation engine", "evalforge");
    app_->set_version_flag("--version", EVALFORGE_VERSION_LONG_STRING);
    app_->require_subcommand(1);

    app_->add_option("-c,--config", configPath_,
                     "Config file (default: $EVALFORGE_CONFIG or ~/.config/evalforge/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    seedOpt_ = app_->add_option("--seed", seed_, "Seed for simulated execution and generation");
}

EvalforgeCLI::~EvalforgeCLI() = default;

void EvalforgeCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void EvalforgeCLI::registerBuiltinCommands() {
    if (!commands_.empty())
        return;
    registerCommand(createRunCommand());
    registerCommand(createScoreCommand());
    registerCommand(createCustomCommand());
}

std::optional<uint64_t> EvalforgeCLI::getSeedOverride() const {
    if (seedOpt_ && seedOpt_->count() > 0)
        return seed_;
    return std::nullopt;
}

evaluation::EvaluationOrchestrator::Config EvalforgeCLI::orchestratorConfig() const {
    auto cfg = config_.toOrchestratorConfig();
    if (auto seed = getSeedOverride()) {
        cfg.simulationSeed = *seed;
        cfg.generator.seed = *seed;
    }
    return cfg;
}

Result<void> EvalforgeCLI::loadConfiguration() {
    auto loaded = config::loadEngineConfig(configPath_);
    if (!loaded)
        return loaded.error();
    config_ = std::move(loaded).value();
    return {};
}

void EvalforgeCLI::applyLogging() {
    // Precedence: EVALFORGE_LOG_LEVEL > --verbose > logging.level
    const char* envLvl = std::getenv("EVALFORGE_LOG_LEVEL");
    bool envSet = envLvl && *envLvl;
    if (!envSet && verbose_) {
        spdlog::set_level(spdlog::level::debug);
    } else if (auto lvl = config::parseLogLevel(config_.logging.level)) {
        spdlog::set_level(lvl.value());
    }
    if (!config_.logging.pattern.empty())
        spdlog::set_pattern(config_.logging.pattern);
}

int EvalforgeCLI::run(int argc, char* argv[]) {
    try {
        registerBuiltinCommands();
        app_->parse(argc, argv);

        if (auto cfg = loadConfiguration(); !cfg) {
            std::cerr << "[FAIL] " << cfg.error().message << "\n";
            spdlog::error("configuration: {}", cfg.error().message);
            return 1;
        }
        applyLogging();
        if (!config_.sourcePath.empty())
            spdlog::debug("using config {}", config_.sourcePath.string());

        if (!pendingCommand_)
            return 0;

        auto result = pendingCommand_->execute();
        if (!result) {
            std::cerr << "[FAIL] " << pendingCommand_->getName() << ": "
                      << result.error().message << "\n";
            spdlog::error("{} failed: {} ({})", pendingCommand_->getName(), result.error().message,
                          errorToString(result.error().code));
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace evalforge::cli
