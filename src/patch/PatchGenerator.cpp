#include "vpg/patch/PatchGenerator.hpp"

#include <algorithm>

#include "vpg/core/Logger.hpp"

namespace vpg::patch {

namespace {

PatchList CollapseIfNeeded(PatchList operations,
                           const json::Value& edited,
                           const std::string& targetFile,
                           const DiffConfig& config,
                           const std::optional<DependsOnList>& dependsOn) {
    if (operations.size() <= static_cast<std::size_t>(std::max(config.collapseThreshold, 0))) {
        return operations;
    }

    vpg::core::Logger::Info("[PatchGenerator] {} produced {} operations (threshold {}), collapsing to a root replace",
                            targetFile, operations.size(), config.collapseThreshold);

    PatchOperation replace;
    replace.dependsOn = dependsOn;
    replace.file = targetFile;
    replace.op = PatchOpType::Replace;
    replace.path = "/";
    replace.value = edited;
    replace.side = config.side;

    PatchList collapsed;
    collapsed.push_back(std::move(replace));
    return collapsed;
}

} // namespace

PatchList Generate(const json::Value& original,
                   const json::Value& edited,
                   const std::string& targetFile,
                   const DiffConfig& config,
                   const std::optional<DependsOnList>& dependsOn) {
    return Generate(&original, edited, targetFile, config, dependsOn);
}

PatchList Generate(const json::Value* original,
                   const json::Value& edited,
                   const std::string& targetFile,
                   const DiffConfig& config,
                   const std::optional<DependsOnList>& dependsOn) {
    const DiffEngine engine(config, targetFile, dependsOn);

    PatchList operations;
    if (original) {
        engine.Diff(original, &edited, "", operations);
    } else if (edited.is_object()) {
        const json::Value empty = json::Value::object();
        engine.Diff(&empty, &edited, "", operations);
    } else {
        engine.Diff(nullptr, &edited, "", operations);
    }

    vpg::core::Logger::Debug("[PatchGenerator] {}: {} operation(s)", targetFile, operations.size());
    return CollapseIfNeeded(std::move(operations), edited, targetFile, config, dependsOn);
}

} // namespace vpg::patch
