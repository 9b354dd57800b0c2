#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "vpg/patch/DiffEngine.hpp"

namespace vpg::batch {

struct FolderBatchResult {
    int filesScanned = 0;
    int patchesWritten = 0;
    int totalOpsWritten = 0;
    std::vector<std::string> errors;

    bool HasErrors() const { return !errors.empty(); }
};

struct FolderBatchOptions {
    patch::DiffConfig config;
    bool autoDepends = false;
    bool vanillaAliasing = false;
};

/// True when @p path ends in ".json", ignoring case.
bool HasJsonExtension(const std::filesystem::path& path);

/// "blocks/stone/rock.json" becomes "blocks__stone__rock.json".
std::string MakeFlatPatchFileName(const std::string& relativePath);

/// "name.json" becomes "name__<hash>.json".
std::string AppendHashBeforeExtension(const std::string& fileName, const std::string& hash);

/**
 * @brief Maps every relative path to its output file name.
 *
 * Paths whose flattened names collide (ignoring case) all get a hash of their
 * relative path appended, so the mapping only depends on the set of inputs.
 * A hashed name that matches another input's name gets a longer hash, so no
 * two inputs ever share an output name.
 * @p collidingBaseNames receives the bare names of colliding groups.
 */
std::map<std::string, std::string> BuildOutputNameMap(const std::vector<std::string>& relativePaths,
                                                      std::vector<std::string>* collidingBaseNames = nullptr);

/**
 * @brief Writes one patch per changed JSON file under @p editedRoot into the flat @p outRoot.
 *
 * Top-level JSON files already in @p outRoot are deleted first. Per-file
 * failures are recorded in the result and do not stop the batch. Throws
 * core::NotFoundError when either input root is not a directory, and
 * core::IoError when @p outRoot cannot be created.
 */
FolderBatchResult GenerateFolder(const std::filesystem::path& sourceRoot,
                                 const std::filesystem::path& editedRoot,
                                 const std::filesystem::path& outRoot,
                                 const FolderBatchOptions& options);

inline FolderBatchResult GenerateFolder(const std::filesystem::path& sourceRoot,
                                        const std::filesystem::path& editedRoot,
                                        const std::filesystem::path& outRoot,
                                        const patch::DiffConfig& config,
                                        bool autoDepends,
                                        bool vanillaAliasing = false) {
    return GenerateFolder(sourceRoot, editedRoot, outRoot,
                          FolderBatchOptions{config, autoDepends, vanillaAliasing});
}

} // namespace vpg::batch
