#include "vpg/patch/PatchGenerator.hpp"

#include "TestHelpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using vpg::patch::DiffConfig;
using vpg::patch::PatchOpType;

namespace {

std::string ManyKeys(int count, int value) {
    std::string text = "{";
    for (int i = 0; i < count; ++i) {
        if (i > 0) {
            text += ",";
        }
        text += "\"k" + std::to_string(i) + "\": " + std::to_string(value);
    }
    return text + "}";
}

} // namespace

TEST_CASE("Generate returns nothing for identical documents", "[generator]") {
    const auto doc = ParseJson(R"({"code": "stone", "variants": [1, 2, 3]})");
    REQUIRE(vpg::patch::Generate(doc, doc, "game:blocks/stone.json", DiffConfig{}).empty());
}

TEST_CASE("Generate collapses large diffs into one root replace", "[generator]") {
    const auto original = ParseJson(ManyKeys(5, 1));
    const auto edited = ParseJson(ManyKeys(5, 2));

    DiffConfig config;
    config.collapseThreshold = 3;
    config.side = "client";
    vpg::patch::DependsOnList deps{{"mymod", std::nullopt}};

    const auto ops = vpg::patch::Generate(original, edited, "mymod:big.json", config, deps);
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].op == PatchOpType::Replace);
    REQUIRE(ops[0].path == "/");
    REQUIRE(ops[0].file == "mymod:big.json");
    REQUIRE(ops[0].side == std::optional<std::string>("client"));
    REQUIRE(ops[0].dependsOn == std::optional<vpg::patch::DependsOnList>(deps));
    REQUIRE(vpg::json::Equivalent(*ops[0].value, edited));
}

TEST_CASE("Generate keeps diffs at exactly the threshold", "[generator]") {
    const auto original = ParseJson(ManyKeys(3, 1));
    const auto edited = ParseJson(ManyKeys(3, 2));

    DiffConfig config;
    config.collapseThreshold = 3;

    const auto ops = vpg::patch::Generate(original, edited, "game:x.json", config);
    REQUIRE(ops.size() == 3);
    REQUIRE(ops[0].path == "/k0");
}

TEST_CASE("Generate without an original adds every top-level key", "[generator]") {
    const auto edited = ParseJson(R"({"a": 1, "b": [2]})");
    const auto ops = vpg::patch::Generate(nullptr, edited, "game:new.json", DiffConfig{});

    REQUIRE(ops.size() == 2);
    REQUIRE(ops[0].op == PatchOpType::AddMerge);
    REQUIRE(ops[0].path == "/a");
    REQUIRE(ops[1].path == "/b");
    REQUIRE(*ops[1].value == ParseJson("[2]"));
}

TEST_CASE("Generate without an original adds a non-object document at the root", "[generator]") {
    const auto edited = ParseJson(R"([1, 2])");
    DiffConfig config;
    config.preferAddMerge = false;
    const auto ops = vpg::patch::Generate(nullptr, edited, "game:list.json", config);

    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].op == PatchOpType::Add);
    REQUIRE(ops[0].path == "/");
    REQUIRE(*ops[0].value == edited);
}
