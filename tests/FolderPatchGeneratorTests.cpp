#include "vpg/batch/FolderPatchGenerator.hpp"
#include "vpg/core/Error.hpp"
#include "vpg/patch/PatchWriter.hpp"
#include "vpg/utils/Hash.hpp"

#include "TestHelpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using vpg::batch::BuildOutputNameMap;
using vpg::batch::MakeFlatPatchFileName;
using vpg::patch::PatchOpType;

namespace {

struct BatchFixture {
    TempDir dir{"vpg_folder"};
    std::filesystem::path sourceRoot = dir.path() / "vanilla" / "assets" / "mymod";
    std::filesystem::path editedRoot = dir.path() / "edited" / "assets" / "mymod";
    std::filesystem::path outRoot = dir.path() / "patches";

    BatchFixture() {
        WriteFile(sourceRoot / "blocks" / "stone.json", R"({"code": "stone", "hardness": 2})");
        WriteFile(editedRoot / "blocks" / "stone.json", R"({"code": "stone", "hardness": 3})");

        WriteFile(sourceRoot / "blocks" / "same.json", R"({"code": "same"})");
        WriteFile(editedRoot / "blocks" / "same.json", R"({"code": "same"})");

        WriteFile(editedRoot / "items" / "new.json", R"({"a": 1, "b": 2})");

        WriteFile(sourceRoot / "a" / "b.json", R"({"v": 1})");
        WriteFile(editedRoot / "a" / "b.json", R"({"v": 2})");
        WriteFile(sourceRoot / "a__b.json", R"({"w": 1})");
        WriteFile(editedRoot / "a__b.json", R"({"w": 2})");

        WriteFile(editedRoot / "notes.txt", "not json");
    }

    vpg::batch::FolderBatchOptions Options() const {
        vpg::batch::FolderBatchOptions options;
        options.autoDepends = true;
        return options;
    }

    std::string HashedName(const std::string& relativePath) const {
        return "a__b__" + vpg::utils::ShortHash(relativePath) + ".json";
    }
};

} // namespace

TEST_CASE("MakeFlatPatchFileName flattens and sanitizes", "[batch][naming]") {
    REQUIRE(MakeFlatPatchFileName("blocks/stone/rock.json") == "blocks__stone__rock.json");
    REQUIRE(MakeFlatPatchFileName("a:b?.json") == "a_b_.json");
    REQUIRE(MakeFlatPatchFileName("weird<name>|x*.json") == "weird_name__x_.json");
    REQUIRE(MakeFlatPatchFileName("noext") == "noext.json");
    REQUIRE(MakeFlatPatchFileName("upper.JSON") == "upper.JSON");
}

TEST_CASE("AppendHashBeforeExtension inserts before the extension", "[batch][naming]") {
    REQUIRE(vpg::batch::AppendHashBeforeExtension("a__b.json", "deadbeef") == "a__b__deadbeef.json");
}

TEST_CASE("BuildOutputNameMap hashes every member of a collision", "[batch][naming]") {
    std::vector<std::string> colliding;
    const auto names = BuildOutputNameMap({"c.json", "a__b.json", "a/b.json"}, &colliding);

    REQUIRE(names.size() == 3);
    REQUIRE(names.at("c.json") == "c.json");
    REQUIRE(names.at("a/b.json") == "a__b__" + vpg::utils::ShortHash("a/b.json") + ".json");
    REQUIRE(names.at("a__b.json") == "a__b__" + vpg::utils::ShortHash("a__b.json") + ".json");
    REQUIRE(names.at("a/b.json") != names.at("a__b.json"));
    REQUIRE(colliding == std::vector<std::string>{"a__b.json"});
}

TEST_CASE("BuildOutputNameMap never reuses the name of a real file", "[batch][naming]") {
    const std::string shadowed = "a__b__" + vpg::utils::ShortHash("a/b.json") + ".json";
    const auto names = BuildOutputNameMap({"a/b.json", "a__b.json", shadowed});

    REQUIRE(names.size() == 3);
    REQUIRE(names.at(shadowed) == shadowed);
    REQUIRE(names.at("a/b.json") == "a__b__" + vpg::utils::ShortHash("a/b.json", 8) + ".json");
    REQUIRE(names.at("a__b.json") == "a__b__" + vpg::utils::ShortHash("a__b.json") + ".json");

    std::vector<std::string> outputs;
    for (const auto& [input, output] : names) {
        outputs.push_back(output);
    }
    std::sort(outputs.begin(), outputs.end());
    REQUIRE(std::adjacent_find(outputs.begin(), outputs.end()) == outputs.end());
}

TEST_CASE("BuildOutputNameMap does not depend on input order", "[batch][naming]") {
    const auto first = BuildOutputNameMap({"x/y.json", "x__y.json", "z.json"});
    const auto second = BuildOutputNameMap({"z.json", "x__y.json", "x/y.json"});
    REQUIRE(first == second);
}

TEST_CASE("BuildOutputNameMap treats names differing only in case as colliding", "[batch][naming]") {
    const auto names = BuildOutputNameMap({"Stone.json", "stone.json"});
    REQUIRE(names.at("Stone.json") != names.at("stone.json"));
    REQUIRE(names.at("Stone.json").find(vpg::utils::ShortHash("Stone.json")) != std::string::npos);
    REQUIRE(names.at("stone.json").find(vpg::utils::ShortHash("stone.json")) != std::string::npos);
}

TEST_CASE("GenerateFolder writes one flat patch per changed file", "[batch]") {
    BatchFixture fixture;
    WriteFile(fixture.outRoot / "stale.json", "[]");
    WriteFile(fixture.outRoot / "keep.txt", "user file");

    const auto result = vpg::batch::GenerateFolder(fixture.sourceRoot, fixture.editedRoot,
                                                   fixture.outRoot, fixture.Options());

    REQUIRE(result.errors.empty());
    REQUIRE(result.filesScanned == 5);
    REQUIRE(result.patchesWritten == 4);
    REQUIRE(result.totalOpsWritten == 5);

    std::vector<std::string> expected{
        fixture.HashedName("a/b.json"),
        fixture.HashedName("a__b.json"),
        "blocks__stone.json",
        "items__new.json",
        "keep.txt"
    };
    std::sort(expected.begin(), expected.end());
    REQUIRE(ListFileNames(fixture.outRoot) == expected);

    const auto stone = vpg::patch::ReadPatchFile(fixture.outRoot / "blocks__stone.json");
    REQUIRE(stone.size() == 1);
    REQUIRE(stone[0].file == "mymod:blocks/stone.json");
    REQUIRE(stone[0].op == PatchOpType::Replace);
    REQUIRE(stone[0].path == "/hardness");
    REQUIRE(stone[0].side == std::optional<std::string>("server"));
    REQUIRE(stone[0].dependsOn);
    REQUIRE(stone[0].dependsOn->size() == 1);
    REQUIRE(stone[0].dependsOn->front().modId == "mymod");

    const auto added = vpg::patch::ReadPatchFile(fixture.outRoot / "items__new.json");
    REQUIRE(added.size() == 2);
    REQUIRE(added[0].op == PatchOpType::AddMerge);
    REQUIRE(added[0].path == "/a");
    REQUIRE(added[1].path == "/b");
}

TEST_CASE("GenerateFolder is deterministic across reruns", "[batch]") {
    BatchFixture fixture;

    vpg::batch::GenerateFolder(fixture.sourceRoot, fixture.editedRoot, fixture.outRoot, fixture.Options());
    const auto firstNames = ListFileNames(fixture.outRoot);
    std::map<std::string, std::string> firstContents;
    for (const auto& name : firstNames) {
        firstContents[name] = ReadFile(fixture.outRoot / name);
    }

    const auto second = vpg::batch::GenerateFolder(fixture.sourceRoot, fixture.editedRoot,
                                                   fixture.outRoot, fixture.Options());
    REQUIRE(second.patchesWritten == 4);
    REQUIRE(ListFileNames(fixture.outRoot) == firstNames);
    for (const auto& name : firstNames) {
        REQUIRE(ReadFile(fixture.outRoot / name) == firstContents[name]);
    }
}

TEST_CASE("GenerateFolder removes outputs that no longer have a change", "[batch]") {
    BatchFixture fixture;
    vpg::batch::GenerateFolder(fixture.sourceRoot, fixture.editedRoot, fixture.outRoot, fixture.Options());
    REQUIRE(std::filesystem::exists(fixture.outRoot / "blocks__stone.json"));

    WriteFile(fixture.editedRoot / "blocks" / "stone.json", R"({"code": "stone", "hardness": 2})");
    const auto result = vpg::batch::GenerateFolder(fixture.sourceRoot, fixture.editedRoot,
                                                   fixture.outRoot, fixture.Options());

    REQUIRE(result.patchesWritten == 3);
    REQUIRE_FALSE(std::filesystem::exists(fixture.outRoot / "blocks__stone.json"));
}

TEST_CASE("GenerateFolder records per-file errors and keeps going", "[batch]") {
    BatchFixture fixture;
    WriteFile(fixture.editedRoot / "broken.json", R"({"code": )");

    const auto result = vpg::batch::GenerateFolder(fixture.sourceRoot, fixture.editedRoot,
                                                   fixture.outRoot, fixture.Options());

    REQUIRE(result.filesScanned == 6);
    REQUIRE(result.patchesWritten == 4);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors.front().rfind("broken.json: ", 0) == 0);
    REQUIRE(result.errors.front().find("Parse error") != std::string::npos);
}

TEST_CASE("GenerateFolder falls back to the game domain outside an assets tree", "[batch]") {
    TempDir dir("vpg_folder_plain");
    const auto source = dir.path() / "src";
    const auto edited = dir.path() / "edit";
    WriteFile(source / "traders" / "smith.json", R"({"stock": [1]})");
    WriteFile(edited / "traders" / "smith.json", R"({"stock": [1, 2]})");

    vpg::batch::FolderBatchOptions options;
    options.autoDepends = true;
    options.config.arrayMode = vpg::patch::ArrayDiffMode::IndexByIndex;

    const auto result = vpg::batch::GenerateFolder(source, edited, dir.path() / "out", options);
    REQUIRE(result.patchesWritten == 1);

    const auto ops = vpg::patch::ReadPatchFile(dir.path() / "out" / "traders__smith.json");
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].file == "game:traders/smith.json");
    REQUIRE(ops[0].path == "/stock/-");
    REQUIRE_FALSE(ops[0].dependsOn);
}

TEST_CASE("GenerateFolder rejects missing input folders", "[batch]") {
    TempDir dir("vpg_folder_missing");
    std::filesystem::create_directories(dir.path() / "edit");

    REQUIRE_THROWS_AS(vpg::batch::GenerateFolder(dir.path() / "nope", dir.path() / "edit",
                                                 dir.path() / "out", vpg::patch::DiffConfig{}, false),
                      vpg::core::NotFoundError);
    REQUIRE_THROWS_AS(vpg::batch::GenerateFolder(dir.path() / "edit", dir.path() / "nope",
                                                 dir.path() / "out", vpg::patch::DiffConfig{}, false),
                      vpg::core::NotFoundError);
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "out"));
}
