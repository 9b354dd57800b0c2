#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "vpg/patch/DiffEngine.hpp"
#include "vpg/patch/PatchOperation.hpp"

namespace vpg::batch {

/// Dependency on the id's domain, or nothing for ids in the vanilla "game" domain.
std::optional<patch::DependsOnList> AutoDependsOn(const std::string& fileId);

/// "<dir>/<stem>.patches.json" next to the source file.
std::filesystem::path DefaultOutputPath(const std::filesystem::path& sourceFile);

struct SingleFileRequest {
    std::filesystem::path sourceFile;
    std::filesystem::path editedFile;
    std::optional<std::filesystem::path> outputFile;
    patch::DiffConfig config;
    bool autoDepends = false;
    bool vanillaAliasing = false;
};

struct SingleFileResult {
    std::string fileId;
    std::filesystem::path outputFile;
    std::size_t operationCount = 0;
};

/**
 * @brief Diffs one source/edited pair and writes the patch file.
 *
 * The target id is inferred from the source path and is required. The patch is
 * written even when it is empty. Throws core::NotFoundError, core::ParseError
 * or core::IoError; nothing written before the failure should be used.
 */
SingleFileResult GenerateSingleFile(const SingleFileRequest& request);

} // namespace vpg::batch
