#include <gtest/gtest.h>

#include <evalforge/config/config_helpers.h>
#include <evalforge/config/engine_config.h>

#include "../../common/test_helpers.h"

using namespace evalforge;
using namespace evalforge::config;
using evalforge::tests::ScopedEnv;
using evalforge::tests::TempDirScope;
using evalforge::tests::write_file;

TEST(ConfigHelpersTest, ParsesSectionsCommentsAndArrays) {
    TempDirScope dir;
    auto path = write_file(dir.path() / "config.toml", R"(# top comment
[pipeline]
normal_cases = 4   # inline
auto_suggest = "false"

[trigger]
exclude_patterns = ["api#key", 'secret']

[logging]
pattern = "[%l] # %v"
)");
    auto kv = parse_simple_toml_flat(path);
    EXPECT_EQ(kv.at("pipeline.normal_cases"), "4");
    EXPECT_EQ(kv.at("pipeline.auto_suggest"), "false");
    EXPECT_EQ(kv.at("logging.pattern"), "[%l] # %v");

    auto patterns = parse_string_list(kv.at("trigger.exclude_patterns"));
    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0], "api#key");
    EXPECT_EQ(patterns[1], "secret");

    EXPECT_TRUE(parse_simple_toml_flat(dir.path() / "missing.toml").empty());
}

TEST(ConfigHelpersTest, StringListAcceptsBareCommaList) {
    auto items = parse_string_list(" classification, generation ,, ");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "classification");
    EXPECT_EQ(items[1], "generation");
}

TEST(ConfigHelpersTest, EnvTruthy) {
    EXPECT_TRUE(env_truthy("1"));
    EXPECT_TRUE(env_truthy("yes"));
    EXPECT_FALSE(env_truthy("OFF"));
    EXPECT_FALSE(env_truthy(""));
    EXPECT_FALSE(env_truthy(nullptr));
}

TEST(ConfigHelpersTest, ConfigPathResolution) {
    TempDirScope dir;
    ScopedEnv xdg("XDG_CONFIG_HOME", dir.path().c_str());
    ScopedEnv cfgEnv("EVALFORGE_CONFIG", nullptr);
    EXPECT_EQ(get_config_path(), dir.path() / "evalforge" / "config.toml");

    ScopedEnv cfgSet("EVALFORGE_CONFIG", "/etc/evalforge.toml");
    EXPECT_EQ(get_config_path(), std::filesystem::path("/etc/evalforge.toml"));
    EXPECT_EQ(get_config_path("/tmp/explicit.toml"), std::filesystem::path("/tmp/explicit.toml"));
}

TEST(EngineConfigTest, AppliesKnownKeys) {
    EngineConfig cfg;
    std::map<std::string, std::string> kv{{"pipeline.normal_cases", "6"},
                                          {"pipeline.edge_cases", "2"},
                                          {"pipeline.adversarial_cases", "0"},
                                          {"pipeline.worker_threads", "4"},
                                          {"pipeline.auto_suggest", "off"},
                                          {"pipeline.run_timeout_seconds", "600"},
                                          {"executor.max_concurrency", "8"},
                                          {"executor.timeout_seconds", "45"},
                                          {"executor.retry_count", "2"},
                                          {"executor.overall_timeout_seconds", "120"},
                                          {"simulation.seed", "1234"},
                                          {"trigger.threshold", "5"},
                                          {"trigger.delay_seconds", "60"},
                                          {"trigger.task_types", "[\"classification\"]"},
                                          {"logging.level", "debug"},
                                          {"something.else", "ignored"}};
    ASSERT_TRUE(applyConfigValues(cfg, kv));

    EXPECT_EQ(cfg.generator.normalCases, 6);
    EXPECT_EQ(cfg.generator.edgeCases, 2);
    EXPECT_EQ(cfg.generator.adversarialCases, 0);
    EXPECT_EQ(cfg.workerThreads, 4u);
    EXPECT_FALSE(cfg.autoSuggest);
    EXPECT_EQ(cfg.executor.maxConcurrency, 8);
    EXPECT_EQ(cfg.executor.timeoutSeconds, 45);
    EXPECT_EQ(cfg.executor.retryCount, 2);
    EXPECT_EQ(cfg.simulationSeed, 1234u);
    EXPECT_EQ(cfg.trigger.triggerThreshold, 5);
    EXPECT_EQ(cfg.trigger.delayBetweenRuns, std::chrono::seconds(60));
    ASSERT_EQ(cfg.trigger.includeTaskTypes.size(), 1u);
    EXPECT_EQ(cfg.trigger.includeTaskTypes[0], evaluation::TaskType::Classification);
    EXPECT_EQ(cfg.logging.level, "debug");

    auto oc = cfg.toOrchestratorConfig();
    EXPECT_EQ(oc.runTimeout, std::chrono::milliseconds(600000));
    EXPECT_EQ(oc.executeStageTimeout, std::chrono::milliseconds(120000));
    EXPECT_EQ(oc.workerThreads, 4u);
    EXPECT_EQ(oc.simulationSeed, 1234u);
    EXPECT_FALSE(oc.autoSuggest);
}

TEST(EngineConfigTest, InvalidValuesNameTheKey) {
    struct Case {
        const char* key;
        const char* value;
    };
    for (auto c : {Case{"pipeline.normal_cases", "-1"}, Case{"pipeline.worker_threads", "0"},
                   Case{"executor.timeout_seconds", "abc"}, Case{"pipeline.auto_suggest", "maybe"},
                   Case{"logging.level", "loud"}, Case{"trigger.task_types", "poetry"}}) {
        EngineConfig cfg;
        auto r = applyConfigValues(cfg, {{c.key, c.value}});
        ASSERT_FALSE(r) << c.key;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument) << c.key;
        EXPECT_NE(r.error().message.find(c.key), std::string::npos) << r.error().message;
    }
}

TEST(EngineConfigTest, PromptLengthBoundsMustBeOrdered) {
    EngineConfig cfg;
    auto r = applyConfigValues(cfg, {{"trigger.min_prompt_length", "500"},
                                     {"trigger.max_prompt_length", "100"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(EngineConfigTest, LoadUsesDefaultsWhenFileIsAbsent) {
    TempDirScope dir;
    ScopedEnv xdg("XDG_CONFIG_HOME", dir.path().c_str());
    ScopedEnv cfgEnv("EVALFORGE_CONFIG", nullptr);
    ScopedEnv lvl("EVALFORGE_LOG_LEVEL", nullptr);
    ScopedEnv seed("EVALFORGE_SIM_SEED", nullptr);
    ScopedEnv workers("EVALFORGE_WORKERS", nullptr);

    auto cfg = loadEngineConfig();
    ASSERT_TRUE(cfg);
    EXPECT_TRUE(cfg.value().sourcePath.empty());
    EXPECT_EQ(cfg.value().simulationSeed, 42u);
    EXPECT_EQ(cfg.value().generator.normalCases, 15);
    EXPECT_EQ(cfg.value().logging.level, "info");
}

TEST(EngineConfigTest, ExplicitMissingPathIsNotFound) {
    TempDirScope dir;
    auto r = loadEngineConfig((dir.path() / "nope.toml").string());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST(EngineConfigTest, EnvironmentOverridesFile) {
    TempDirScope dir;
    auto path = write_file(dir.path() / "engine.toml", R"([simulation]
seed = 7
[pipeline]
worker_threads = 3
[logging]
level = "warn"
)");
    ScopedEnv lvl("EVALFORGE_LOG_LEVEL", "error");
    ScopedEnv seed("EVALFORGE_SIM_SEED", "99");
    ScopedEnv workers("EVALFORGE_WORKERS", nullptr);

    auto cfg = loadEngineConfig(path.string());
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().sourcePath, path);
    EXPECT_EQ(cfg.value().simulationSeed, 99u);
    EXPECT_EQ(cfg.value().workerThreads, 3u);
    EXPECT_EQ(cfg.value().logging.level, "error");

    ScopedEnv badWorkers("EVALFORGE_WORKERS", "zero");
    auto bad = loadEngineConfig(path.string());
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}

TEST(EngineConfigTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("WARNING").value(), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("off").value(), spdlog::level::off);
    EXPECT_FALSE(parseLogLevel("chatty"));
}
