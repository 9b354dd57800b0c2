#pragma once

#include <optional>
#include <string>

#include "vpg/json/Value.hpp"
#include "vpg/patch/DiffEngine.hpp"
#include "vpg/patch/PatchOperation.hpp"

namespace vpg::patch {

/**
 * @brief Diffs a whole document.
 *
 * When the diff produces more than config.collapseThreshold operations, the
 * result is replaced by a single `replace` of "/" carrying the edited document.
 */
PatchList Generate(const json::Value& original,
                   const json::Value& edited,
                   const std::string& targetFile,
                   const DiffConfig& config,
                   const std::optional<DependsOnList>& dependsOn = std::nullopt);

/**
 * @brief Variant for an edited document with no original counterpart.
 *
 * A missing @p original on an object document is diffed against an empty
 * object, so every top-level key becomes an add. Any other document becomes a
 * single add at "/".
 */
PatchList Generate(const json::Value* original,
                   const json::Value& edited,
                   const std::string& targetFile,
                   const DiffConfig& config,
                   const std::optional<DependsOnList>& dependsOn = std::nullopt);

} // namespace vpg::patch
