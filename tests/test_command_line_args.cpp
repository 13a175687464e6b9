// tests/test_command_line_args.cpp
//
// Regression coverage for chronicle/app/CommandLineArgs.{hpp,cpp}.
//
// Goals:
//   - Options are case-insensitive
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "chronicle/app/CommandLineArgs.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] chronicle::app::CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    std::vector<std::string_view> v;
    v.reserve(argv.size());
    for (const auto& a : argv)
        v.push_back(a);
    return chronicle::app::ParseCommandLineArgs(v);
}

} // namespace

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({
        "chronicle_run",
        "--QUIET",
        "--Forever",
        "-H",
    });

    CHECK(args.quiet);
    CHECK(args.showHelp);
    REQUIRE(args.runIndefinitely.has_value());
    CHECK(args.runIndefinitely.value());
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs accepts both value forms and keeps paths verbatim")
{
    const auto args = Parse({
        "chronicle_run",
        "--turns=12",
        "--SEED",
        "77",
        "--data",
        "./Campaign Data",
        "--Config=Cfg/Engine.JSON",
        "--log-level=debug",
    });

    REQUIRE(args.turns);
    REQUIRE(args.seed);
    REQUIRE(args.dataDir);
    REQUIRE(args.configPath);
    REQUIRE(args.logLevel);
    CHECK(args.turns.value() == 12);
    CHECK(args.seed.value() == 77u);
    CHECK(args.dataDir.value() == "./Campaign Data");
    CHECK(args.configPath.value() == "Cfg/Engine.JSON");
    CHECK(args.logLevel.value() == "debug");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs: the last of --forever/--bounded wins")
{
    const auto bounded = Parse({"chronicle_run", "--forever", "--bounded"});
    REQUIRE(bounded.runIndefinitely.has_value());
    CHECK_FALSE(bounded.runIndefinitely.value());

    const auto forever = Parse({"chronicle_run", "--bounded", "--run-indefinitely"});
    REQUIRE(forever.runIndefinitely.has_value());
    CHECK(forever.runIndefinitely.value());

    CHECK_FALSE(Parse({"chronicle_run"}).runIndefinitely.has_value());
}

TEST_CASE("CommandLineArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "chronicle_run",
        "--bogus",
        "--turns",
        "lots",
        "positional",
        "--seed=-1",
        "--data=",
        "--config",
    });

    CHECK_FALSE(args.turns.has_value());
    CHECK_FALSE(args.seed.has_value());
    CHECK_FALSE(args.dataDir.has_value());
    CHECK_FALSE(args.configPath.has_value());

    const std::vector<std::string> expected{
        "--bogus",
        "--turns",
        "positional",
        "--seed=-1",
        "--data=",
        "--config",
    };
    CHECK(args.unknown == expected);
}

TEST_CASE("CommandLineArgs rejects a negative turn count")
{
    const auto args = Parse({"chronicle_run", "-n", "-3"});
    CHECK_FALSE(args.turns.has_value());
    REQUIRE(args.unknown.size() == 1);
    CHECK(args.unknown.front() == "--turns=-3");
}

TEST_CASE("CommandLineArgs help text lists the session options")
{
    const std::string help = chronicle::app::BuildCommandLineHelpText();
    CHECK(help.find("--turns") != std::string::npos);
    CHECK(help.find("--data") != std::string::npos);
    CHECK(help.find("--log-level") != std::string::npos);
}
