#include "CommandLine.hpp"
#include "vpg/core/Error.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using vpg::app::Command;
using vpg::app::ParseCommandLine;

TEST_CASE("No arguments selects help", "[cli]") {
    REQUIRE(ParseCommandLine({}).command == Command::Help);
    REQUIRE(ParseCommandLine({"folder", "a", "b", "c", "--help"}).command == Command::Help);
}

TEST_CASE("File command collects paths and options", "[cli]") {
    const auto options = ParseCommandLine({"file", "src.json", "edit.json", "-o", "out.json",
                                           "--side", "both", "--array", "index", "--add",
                                           "--collapse", "25", "--auto-depends", "--vanilla"});

    REQUIRE(options.command == Command::File);
    REQUIRE(options.positional == std::vector<std::string>{"src.json", "edit.json"});
    REQUIRE(options.outputFile == std::filesystem::path("out.json"));
    REQUIRE(options.side == std::optional<std::optional<std::string>>(std::optional<std::string>()));
    REQUIRE(options.arrayMode == vpg::patch::ArrayDiffMode::IndexByIndex);
    REQUIRE(options.preferAddMerge == false);
    REQUIRE(options.collapseThreshold == 25);
    REQUIRE(options.autoDepends);
    REQUIRE(options.vanillaFiles);
}

TEST_CASE("Bad command lines raise ConfigError", "[cli]") {
    using vpg::core::ConfigError;
    REQUIRE_THROWS_AS(ParseCommandLine({"merge", "a", "b"}), ConfigError);
    REQUIRE_THROWS_AS(ParseCommandLine({"file", "a"}), ConfigError);
    REQUIRE_THROWS_AS(ParseCommandLine({"folder", "a", "b", "c", "--bogus"}), ConfigError);
    REQUIRE_THROWS_AS(ParseCommandLine({"file", "a", "b", "--side"}), ConfigError);
    REQUIRE_THROWS_AS(ParseCommandLine({"file", "a", "b", "--side", "north"}), ConfigError);
    REQUIRE_THROWS_AS(ParseCommandLine({"file", "a", "b", "--collapse", "0"}), ConfigError);
    REQUIRE_THROWS_AS(ParseCommandLine({"file", "a", "b", "--collapse", "12x"}), ConfigError);
    REQUIRE_THROWS_AS(ParseCommandLine({"folder", "a", "b", "c", "-o", "x.json"}), ConfigError);
}

TEST_CASE("Command-line values override the config", "[cli]") {
    vpg::utils::ToolConfig config;
    config.diff.collapseThreshold = 10;
    config.batch.vanillaFiles = true;

    const auto options = ParseCommandLine({"folder", "a", "b", "c", "--side", "client", "--no-escape", "-v"});
    vpg::app::ApplyOverrides(options, config);

    REQUIRE(config.diff.side == std::optional<std::string>("client"));
    REQUIRE_FALSE(config.diff.escapePathSegments);
    REQUIRE(config.diff.collapseThreshold == 10);
    REQUIRE(config.batch.vanillaFiles);
    REQUIRE(config.logging.debug);
}
