#include <evalforge/config/config_helpers.h>
#include <evalforge/config/engine_config.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace evalforge::config {

namespace {

template <typename T>
Result<T> parseNumber(const std::string& key, const std::string& raw, T minValue) {
    T value{};
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || raw.empty())
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("config key '{}': '{}' is not a valid number", key, raw)};
    if (value < minValue)
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("config key '{}': {} is below the minimum {}", key, value,
                                 minValue)};
    return value;
}

Result<std::chrono::seconds> parseSeconds(const std::string& key, const std::string& raw) {
    auto n = parseNumber<int64_t>(key, raw, int64_t{0});
    if (!n)
        return n.error();
    return std::chrono::seconds{n.value()};
}

Result<bool> parseBool(const std::string& key, const std::string& raw) {
    std::string v = raw;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("config key '{}': '{}' is not a boolean", key, raw)};
}

Result<std::vector<evaluation::TaskType>> parseTaskTypes(const std::string& key,
                                                         const std::string& raw) {
    std::vector<evaluation::TaskType> out;
    for (const auto& name : parse_string_list(raw)) {
        auto t = evaluation::parseTaskType(name);
        if (!t)
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("config key '{}': {}", key, t.error().message)};
        out.push_back(t.value());
    }
    return out;
}

// Assigns the parsed value or propagates the parse error.
#define EVALFORGE_CONFIG_ASSIGN(target, expr)                                                      \
    do {                                                                                           \
        auto parsed_ = (expr);                                                                     \
        if (!parsed_)                                                                              \
            return parsed_.error();                                                                \
        target = std::move(parsed_).value();                                                       \
    } while (0)

} // namespace

Result<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical")
        return spdlog::level::critical;
    if (v == "off")
        return spdlog::level::off;
    return Error{ErrorCode::InvalidArgument, fmt::format("unknown log level '{}'", name)};
}

Result<void> applyConfigValues(EngineConfig& cfg, const std::map<std::string, std::string>& kv) {
    for (const auto& [key, value] : kv) {
        if (key == "pipeline.normal_cases") {
            EVALFORGE_CONFIG_ASSIGN(cfg.generator.normalCases, parseNumber<int>(key, value, 0));
        } else if (key == "pipeline.edge_cases") {
            EVALFORGE_CONFIG_ASSIGN(cfg.generator.edgeCases, parseNumber<int>(key, value, 0));
        } else if (key == "pipeline.adversarial_cases") {
            EVALFORGE_CONFIG_ASSIGN(cfg.generator.adversarialCases,
                                    parseNumber<int>(key, value, 0));
        } else if (key == "pipeline.worker_threads") {
            EVALFORGE_CONFIG_ASSIGN(cfg.workerThreads,
                                    parseNumber<std::size_t>(key, value, std::size_t{1}));
        } else if (key == "pipeline.auto_suggest") {
            EVALFORGE_CONFIG_ASSIGN(cfg.autoSuggest, parseBool(key, value));
        } else if (key == "pipeline.run_timeout_seconds") {
            EVALFORGE_CONFIG_ASSIGN(cfg.runTimeout,
                                    parseSeconds(key, value));
        } else if (key == "executor.max_concurrency") {
            EVALFORGE_CONFIG_ASSIGN(cfg.executor.maxConcurrency, parseNumber<int>(key, value, 1));
        } else if (key == "executor.timeout_seconds") {
            EVALFORGE_CONFIG_ASSIGN(cfg.executor.timeoutSeconds, parseNumber<int>(key, value, 1));
        } else if (key == "executor.retry_count") {
            EVALFORGE_CONFIG_ASSIGN(cfg.executor.retryCount, parseNumber<int>(key, value, 0));
        } else if (key == "executor.overall_timeout_seconds") {
            EVALFORGE_CONFIG_ASSIGN(cfg.executeStageTimeout,
                                    parseSeconds(key, value));
        } else if (key == "simulation.seed") {
            EVALFORGE_CONFIG_ASSIGN(cfg.simulationSeed,
                                    parseNumber<uint64_t>(key, value, uint64_t{0}));
        } else if (key == "trigger.enabled") {
            EVALFORGE_CONFIG_ASSIGN(cfg.trigger.enabled, parseBool(key, value));
        } else if (key == "trigger.threshold") {
            EVALFORGE_CONFIG_ASSIGN(cfg.trigger.triggerThreshold, parseNumber<int>(key, value, 1));
        } else if (key == "trigger.min_prompt_length") {
            EVALFORGE_CONFIG_ASSIGN(cfg.trigger.minPromptLength,
                                    parseNumber<std::size_t>(key, value, std::size_t{0}));
        } else if (key == "trigger.max_prompt_length") {
            EVALFORGE_CONFIG_ASSIGN(cfg.trigger.maxPromptLength,
                                    parseNumber<std::size_t>(key, value, std::size_t{1}));
        } else if (key == "trigger.delay_seconds") {
            EVALFORGE_CONFIG_ASSIGN(cfg.trigger.delayBetweenRuns,
                                    parseSeconds(key, value));
        } else if (key == "trigger.exclude_patterns") {
            cfg.trigger.excludePatterns = parse_string_list(value);
        } else if (key == "trigger.task_types") {
            EVALFORGE_CONFIG_ASSIGN(cfg.trigger.includeTaskTypes, parseTaskTypes(key, value));
        } else if (key == "logging.level") {
            if (auto lvl = parseLogLevel(value); !lvl)
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("config key '{}': {}", key, lvl.error().message)};
            cfg.logging.level = value;
        } else if (key == "logging.pattern") {
            cfg.logging.pattern = value;
        } else {
            spdlog::debug("config: ignoring unknown key '{}'", key);
        }
    }
    if (cfg.trigger.minPromptLength > cfg.trigger.maxPromptLength)
        return Error{ErrorCode::InvalidArgument,
                     "config: trigger.min_prompt_length exceeds trigger.max_prompt_length"};
    return {};
}

Result<void> applyEnvOverrides(EngineConfig& cfg) {
    if (const char* lvl = std::getenv("EVALFORGE_LOG_LEVEL"); lvl && *lvl) {
        if (auto parsed = parseLogLevel(lvl); !parsed)
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("EVALFORGE_LOG_LEVEL: {}", parsed.error().message)};
        cfg.logging.level = lvl;
    }
    if (const char* seed = std::getenv("EVALFORGE_SIM_SEED"); seed && *seed) {
        EVALFORGE_CONFIG_ASSIGN(cfg.simulationSeed,
                                parseNumber<uint64_t>("EVALFORGE_SIM_SEED", seed, uint64_t{0}));
    }
    if (const char* workers = std::getenv("EVALFORGE_WORKERS"); workers && *workers) {
        EVALFORGE_CONFIG_ASSIGN(cfg.workerThreads, parseNumber<std::size_t>("EVALFORGE_WORKERS",
                                                                            workers, std::size_t{1}));
    }
    return {};
}

Result<EngineConfig> loadEngineConfig(const std::string& explicitPath) {
    EngineConfig cfg;
    auto path = get_config_path(explicitPath);
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);

    if (!exists && !explicitPath.empty())
        return Error{ErrorCode::NotFound,
                     fmt::format("config file not found: {}", path.string())};

    if (exists) {
        auto kv = parse_simple_toml_flat(path);
        if (auto applied = applyConfigValues(cfg, kv); !applied)
            return applied.error();
        cfg.sourcePath = path;
        spdlog::debug("config: loaded {} keys from {}", kv.size(), path.string());
    } else {
        spdlog::debug("config: {} not found, using defaults", path.string());
    }

    if (auto env = applyEnvOverrides(cfg); !env)
        return env.error();
    return cfg;
}

evaluation::EvaluationOrchestrator::Config EngineConfig::toOrchestratorConfig() const {
    evaluation::EvaluationOrchestrator::Config out;
    out.generator = generator;
    out.executor = executor;
    out.autoSuggest = autoSuggest;
    out.runTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(runTimeout);
    out.executeStageTimeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(executeStageTimeout);
    out.workerThreads = workerThreads;
    out.simulationSeed = simulationSeed;
    return out;
}

#undef EVALFORGE_CONFIG_ASSIGN

} // namespace evalforge::config
