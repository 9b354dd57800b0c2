#include "vpg/patch/PatchOperation.hpp"

#include <fmt/format.h>

#include "vpg/core/Error.hpp"

namespace vpg::patch {

namespace {

std::string RequireString(const json::Value& entry, const char* key,
                          const std::string& sourceName, std::size_t index) {
    const auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        throw core::ParseError(sourceName,
                               fmt::format("patch entry {} needs a string '{}'", index, key));
    }
    return it->get<std::string>();
}

std::optional<std::string> OptionalString(const json::Value& entry, const char* key,
                                          const std::string& sourceName, std::size_t index) {
    const auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw core::ParseError(sourceName,
                               fmt::format("patch entry {} has a non-string '{}'", index, key));
    }
    return it->get<std::string>();
}

DependsOnList ParseDependsOn(const json::Value& node, const std::string& sourceName, std::size_t index) {
    if (!node.is_array()) {
        throw core::ParseError(sourceName,
                               fmt::format("patch entry {}: 'dependsOn' must be an array", index));
    }
    DependsOnList list;
    list.reserve(node.size());
    for (const auto& dep : node) {
        if (!dep.is_object()) {
            throw core::ParseError(sourceName,
                                   fmt::format("patch entry {}: dependsOn entries must be objects", index));
        }
        DependsOnEntry entry;
        entry.modId = RequireString(dep, "modid", sourceName, index);
        const auto invert = dep.find("invert");
        if (invert != dep.end() && !invert->is_null()) {
            if (!invert->is_boolean()) {
                throw core::ParseError(sourceName,
                                       fmt::format("patch entry {}: 'invert' must be a bool", index));
            }
            entry.invert = invert->get<bool>();
        }
        list.push_back(std::move(entry));
    }
    return list;
}

} // namespace

const char* ToString(PatchOpType type) {
    switch (type) {
        case PatchOpType::Add:      return "add";
        case PatchOpType::AddMerge: return "addmerge";
        case PatchOpType::Remove:   return "remove";
        case PatchOpType::Replace:  return "replace";
    }
    return "replace";
}

std::optional<PatchOpType> ParsePatchOpType(std::string_view text) {
    if (text == "add") return PatchOpType::Add;
    if (text == "addmerge") return PatchOpType::AddMerge;
    if (text == "remove") return PatchOpType::Remove;
    if (text == "replace") return PatchOpType::Replace;
    return std::nullopt;
}

json::Value ToJson(const DependsOnEntry& entry) {
    json::Value node = json::Value::object();
    node["modid"] = entry.modId;
    if (entry.invert) {
        node["invert"] = *entry.invert;
    }
    return node;
}

json::Value ToJson(const PatchOperation& operation) {
    json::Value node = json::Value::object();
    if (operation.dependsOn) {
        json::Value deps = json::Value::array();
        for (const auto& dep : *operation.dependsOn) {
            deps.push_back(ToJson(dep));
        }
        node["dependsOn"] = std::move(deps);
    }
    node["file"] = operation.file;
    node["op"] = ToString(operation.op);
    node["path"] = operation.path;
    if (operation.fromPath) {
        node["fromPath"] = *operation.fromPath;
    }
    if (operation.value) {
        node["value"] = *operation.value;
    }
    if (operation.side) {
        node["side"] = *operation.side;
    }
    return node;
}

json::Value ToJson(const PatchList& operations) {
    json::Value array = json::Value::array();
    for (const auto& operation : operations) {
        array.push_back(ToJson(operation));
    }
    return array;
}

PatchList PatchFromJson(const json::Value& document, const std::string& sourceName) {
    if (!document.is_array()) {
        throw core::ParseError(sourceName, "patch document must be a JSON array");
    }

    PatchList operations;
    operations.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i) {
        const auto& entry = document[i];
        if (!entry.is_object()) {
            throw core::ParseError(sourceName, fmt::format("patch entry {} is not an object", i));
        }

        PatchOperation operation;
        operation.file = RequireString(entry, "file", sourceName, i);
        const std::string opText = RequireString(entry, "op", sourceName, i);
        const auto opType = ParsePatchOpType(opText);
        if (!opType) {
            throw core::ParseError(sourceName,
                                   fmt::format("patch entry {} has unknown op '{}'", i, opText));
        }
        operation.op = *opType;
        operation.path = RequireString(entry, "path", sourceName, i);
        operation.fromPath = OptionalString(entry, "fromPath", sourceName, i);
        operation.side = OptionalString(entry, "side", sourceName, i);

        const auto deps = entry.find("dependsOn");
        if (deps != entry.end() && !deps->is_null()) {
            operation.dependsOn = ParseDependsOn(*deps, sourceName, i);
        }

        const auto value = entry.find("value");
        if (value != entry.end()) {
            operation.value = *value;
        }
        operations.push_back(std::move(operation));
    }
    return operations;
}

} // namespace vpg::patch
