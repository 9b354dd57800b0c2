#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vpg/json/Value.hpp"

namespace vpg::patch {

enum class PatchOpType {
    Add,
    AddMerge,
    Remove,
    Replace
};

const char* ToString(PatchOpType type);
std::optional<PatchOpType> ParsePatchOpType(std::string_view text);

struct DependsOnEntry {
    std::string modId;
    std::optional<bool> invert;

    bool operator==(const DependsOnEntry&) const = default;
};

using DependsOnList = std::vector<DependsOnEntry>;

struct PatchOperation {
    std::optional<DependsOnList> dependsOn;
    std::string file;
    PatchOpType op = PatchOpType::Replace;
    std::string path;
    std::optional<std::string> fromPath;
    // Present for add/addmerge/replace, absent for remove.
    std::optional<json::Value> value;
    // Absent means the patch applies on both sides.
    std::optional<std::string> side;
};

using PatchList = std::vector<PatchOperation>;

json::Value ToJson(const DependsOnEntry& entry);
json::Value ToJson(const PatchOperation& operation);
json::Value ToJson(const PatchList& operations);

/// Reads a patch array back. Throws core::ParseError naming @p sourceName on malformed entries.
PatchList PatchFromJson(const json::Value& document, const std::string& sourceName);

} // namespace vpg::patch
