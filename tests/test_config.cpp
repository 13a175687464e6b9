// tests/test_config.cpp
//
// Regression/robustness tests for chronicle/core/Config.{hpp,cpp}.
//
// Goals:
//   - Saving creates the directory and round-trips values
//   - A missing file is the normal first-run case
//   - Corrupt files are reported (strict) or replaced by defaults (tolerant)

#include <doctest/doctest.h>

#include "chronicle/core/Config.hpp"
#include "chronicle/core/Errors.hpp"

#include "test_support/fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void write_text(const fs::path& path, const std::string& text)
{
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // namespace

TEST_CASE("SaveConfig creates the directory and LoadConfigOrThrow round-trips values")
{
    const fs::path file = chronicle::test::make_unique_temp_dir("config") / "nested" / "config.json";

    chronicle::EngineConfig cfg;
    cfg.maxTurnsPerSession = 42;
    cfg.runIndefinitely = true;
    cfg.overrideAvailableActions = {"rest", "explore"};
    cfg.cooldownPeriod = 3;
    cfg.movementStepCooldownMs = 50;
    cfg.turnIntervalMs = 10;
    cfg.seed = 123456789u;
    cfg.dataDirectory = "campaign";
    cfg.logging.level = "debug";
    cfg.logging.file = "logs/run.log";

    REQUIRE(chronicle::SaveConfig(cfg, file));

    const chronicle::EngineConfig loaded = chronicle::LoadConfigOrThrow(file);
    CHECK(loaded.maxTurnsPerSession == 42);
    CHECK(loaded.runIndefinitely);
    CHECK(loaded.overrideAvailableActions == std::vector<std::string>{"rest", "explore"});
    CHECK(loaded.cooldownPeriod == 3);
    CHECK(loaded.movementStepCooldownMs == 50);
    CHECK(loaded.turnIntervalMs == 10);
    CHECK(loaded.seed == 123456789u);
    CHECK(loaded.dataDirectory == fs::path("campaign"));
    CHECK(loaded.logging.level == "debug");
    CHECK(loaded.logging.file == "logs/run.log");
    CHECK_FALSE(loaded.logging.disable);
}

TEST_CASE("LoadConfig returns false for a missing file (first run)")
{
    const fs::path dir = chronicle::test::make_unique_temp_dir("config_missing");

    chronicle::EngineConfig cfg;
    cfg.maxTurnsPerSession = 999;
    CHECK_FALSE(chronicle::LoadConfig(cfg, dir / "config.json"));
    CHECK(cfg.maxTurnsPerSession == chronicle::EngineConfig{}.maxTurnsPerSession);

    CHECK_THROWS_AS((void)chronicle::LoadConfigOrThrow(dir / "config.json"), chronicle::ConfigError);
}

TEST_CASE("Malformed config files are rejected or replaced by defaults")
{
    const fs::path dir = chronicle::test::make_unique_temp_dir("config_bad");
    const fs::path file = dir / "config.json";

    SUBCASE("not JSON")
    {
        write_text(file, "maxTurnsPerSession = 5");
    }
    SUBCASE("not an object")
    {
        write_text(file, "[1, 2, 3]");
    }
    SUBCASE("wrong value type")
    {
        write_text(file, R"({"maxTurnsPerSession": "many"})");
    }

    CHECK_THROWS_AS((void)chronicle::LoadConfigOrThrow(file), chronicle::ConfigError);

    chronicle::EngineConfig cfg;
    cfg.cooldownPeriod = 7;
    CHECK_FALSE(chronicle::LoadConfig(cfg, file));
    CHECK(cfg.cooldownPeriod == 1);
}

TEST_CASE("Out-of-range values are clamped and missing keys keep defaults")
{
    const fs::path file = chronicle::test::make_unique_temp_dir("config_clamp") / "config.json";
    write_text(file, R"({
        "cooldownPeriod": 0,
        "movementStepCooldownMs": -20,
        "turnIntervalMs": -1,
        "logging": {"disable": true}
    })");

    const chronicle::EngineConfig cfg = chronicle::LoadConfigOrThrow(file);
    CHECK(cfg.cooldownPeriod == 1);
    CHECK(cfg.movementStepCooldownMs == 0);
    CHECK(cfg.turnIntervalMs == 0);
    CHECK(cfg.maxTurnsPerSession == 10);
    CHECK(cfg.logging.disable);
    CHECK(cfg.logging.level == chronicle::logsys::LogConfig{}.level);
}

TEST_CASE("The shipped config.json loads")
{
    const chronicle::EngineConfig cfg =
        chronicle::LoadConfigOrThrow(fs::path(CHRONICLE_TEST_DATA_DIR) / "config.json");
    CHECK(cfg.maxTurnsPerSession == 24);
    CHECK(cfg.cooldownPeriod == 1);
    CHECK(cfg.seed == 0u);
    CHECK(cfg.dataDirectory == fs::path("data"));
    CHECK(cfg.logging.level == "info");
}
