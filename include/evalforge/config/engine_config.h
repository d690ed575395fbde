#pragma once

#include <evalforge/core/types.h>
#include <evalforge/evaluation/auto_trigger.h>
#include <evalforge/evaluation/orchestrator.h>
#include <evalforge/evaluation/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include <spdlog/common.h>

namespace evalforge::config {

struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%H:%M:%S] [%l] %v"};
};

/**
 * @brief Settings for the engine and the command line tool.
 *
 * Loaded from a flat TOML file with [pipeline], [executor], [simulation], [trigger]
 * and [logging] sections, then overridden from EVALFORGE_* environment variables.
 */
struct EngineConfig {
    evaluation::TestGeneratorOptions generator{};
    evaluation::ExecutorOptions executor{};
    bool autoSuggest{true};
    std::size_t workerThreads{2};
    std::chrono::seconds runTimeout{0};
    std::chrono::seconds executeStageTimeout{0};
    uint64_t simulationSeed{42};
    evaluation::TriggerConfig trigger{};
    LoggingConfig logging{};

    // File the values came from; empty when only defaults apply.
    std::filesystem::path sourcePath;

    evaluation::EvaluationOrchestrator::Config toOrchestratorConfig() const;
};

// Applies flattened "section.key" values. Unknown keys are ignored.
Result<void> applyConfigValues(EngineConfig& cfg, const std::map<std::string, std::string>& kv);

// EVALFORGE_LOG_LEVEL, EVALFORGE_SIM_SEED, EVALFORGE_WORKERS
Result<void> applyEnvOverrides(EngineConfig& cfg);

/**
 * @brief Resolves and loads the configuration.
 *
 * An explicit path must exist (NotFound otherwise). When no explicit path is given and
 * the resolved default file is absent, defaults are used.
 */
Result<EngineConfig> loadEngineConfig(const std::string& explicitPath = "");

Result<spdlog::level::level_enum> parseLogLevel(const std::string& name);

} // namespace evalforge::config
