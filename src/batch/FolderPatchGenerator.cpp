#include "vpg/batch/FolderPatchGenerator.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <string_view>
#include <system_error>

#include "vpg/assets/FileId.hpp"
#include "vpg/batch/PatchJob.hpp"
#include "vpg/core/Error.hpp"
#include "vpg/core/Logger.hpp"
#include "vpg/json/Value.hpp"
#include "vpg/patch/PatchGenerator.hpp"
#include "vpg/patch/PatchWriter.hpp"
#include "vpg/utils/Hash.hpp"

namespace vpg::batch {

namespace {

constexpr std::string_view kJsonExtension = ".json";
constexpr std::string_view kFlatSeparator = "__";
// Characters rejected in file names by at least one of Windows, macOS or Linux.
constexpr std::string_view kInvalidFileNameChars = "<>:\"/\\|?*";
constexpr std::size_t kShortHashBytes = 4;
constexpr std::size_t kFullHashBytes = 32;

std::string ToLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool LessIgnoreCase(const std::string& lhs, const std::string& rhs) {
    const std::string lowerLhs = ToLower(lhs);
    const std::string lowerRhs = ToLower(rhs);
    if (lowerLhs != lowerRhs) {
        return lowerLhs < lowerRhs;
    }
    return lhs < rhs;
}

std::filesystem::path NormalizeRoot(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    return absolute.lexically_normal();
}

void RequireDirectory(const std::filesystem::path& path, const char* role) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        throw core::NotFoundError(path.string(), std::string(role) + " folder not found");
    }
}

// Stale outputs from an earlier run would otherwise linger under old names.
void ClearTopLevelJsonFiles(const std::filesystem::path& outRoot) {
    std::error_code ec;
    std::filesystem::directory_iterator it(outRoot, ec);
    if (ec) {
        vpg::core::Logger::Warning("[FolderPatchGenerator] Cannot list '{}': {}", outRoot.string(), ec.message());
        return;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc) || !HasJsonExtension(it->path())) {
            continue;
        }
        if (!std::filesystem::remove(it->path(), entryEc) && entryEc) {
            vpg::core::Logger::Warning("[FolderPatchGenerator] Could not delete stale output '{}': {}",
                                       it->path().string(), entryEc.message());
        }
    }
    if (ec) {
        vpg::core::Logger::Warning("[FolderPatchGenerator] Stopped clearing '{}': {}",
                                   outRoot.string(), ec.message());
    }
}

void RemoveLegacyOutput(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        vpg::core::Logger::Debug("[FolderPatchGenerator] Removed un-hashed output '{}'", path.string());
    } else if (ec) {
        vpg::core::Logger::Warning("[FolderPatchGenerator] Could not delete '{}': {}", path.string(), ec.message());
    }
}

std::vector<std::string> CollectRelativeJsonPaths(const std::filesystem::path& editedRoot) {
    std::vector<std::string> relativePaths;
    try {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(editedRoot)) {
            if (!entry.is_regular_file() || !HasJsonExtension(entry.path())) {
                continue;
            }
            relativePaths.push_back(entry.path().lexically_relative(editedRoot).generic_string());
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        throw core::IoError(editedRoot.string(), ex.what());
    }
    std::sort(relativePaths.begin(), relativePaths.end());
    return relativePaths;
}

std::string ResolveFileId(const std::filesystem::path& editedFile,
                          const std::filesystem::path& sourceFile,
                          const std::string& relativePath,
                          bool vanillaAliasing) {
    if (auto id = assets::InferFileId(editedFile, vanillaAliasing)) {
        return id->ToString();
    }
    if (auto id = assets::InferFileId(sourceFile, vanillaAliasing)) {
        return id->ToString();
    }
    return std::string(assets::kVanillaDomain) + ":" + relativePath;
}

} // namespace

bool HasJsonExtension(const std::filesystem::path& path) {
    return ToLower(path.extension().string()) == kJsonExtension;
}

std::string MakeFlatPatchFileName(const std::string& relativePath) {
    std::string name;
    name.reserve(relativePath.size() + 8);
    for (const char c : relativePath) {
        if (c == '/' || c == '\\') {
            name.append(kFlatSeparator);
        } else if (static_cast<unsigned char>(c) < 0x20 ||
                   kInvalidFileNameChars.find(c) != std::string_view::npos) {
            name.push_back('_');
        } else {
            name.push_back(c);
        }
    }
    if (!HasJsonExtension(name)) {
        name.append(kJsonExtension);
    }
    return name;
}

std::string AppendHashBeforeExtension(const std::string& fileName, const std::string& hash) {
    const std::filesystem::path path(fileName);
    return path.stem().string() + std::string(kFlatSeparator) + hash + path.extension().string();
}

std::map<std::string, std::string> BuildOutputNameMap(const std::vector<std::string>& relativePaths,
                                                      std::vector<std::string>* collidingBaseNames) {
    struct Group {
        std::string baseName;
        std::vector<std::string> members;
    };

    std::vector<std::string> sorted = relativePaths;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    std::map<std::string, Group> groups;
    for (const auto& relativePath : sorted) {
        const std::string flat = MakeFlatPatchFileName(relativePath);
        auto& group = groups[ToLower(flat)];
        if (group.members.empty()) {
            group.baseName = flat;
        }
        group.members.push_back(relativePath);
    }

    // Unique names are claimed first so a hashed name can never shadow a real file.
    std::map<std::string, std::string> names;
    std::set<std::string> taken;
    for (const auto& [key, group] : groups) {
        if (group.members.size() == 1) {
            names[group.members.front()] = group.baseName;
            taken.insert(key);
        }
    }

    for (auto& [key, group] : groups) {
        if (group.members.size() == 1) {
            continue;
        }

        std::sort(group.members.begin(), group.members.end(), LessIgnoreCase);
        for (const auto& relativePath : group.members) {
            std::size_t hashBytes = kShortHashBytes;
            std::string name = AppendHashBeforeExtension(group.baseName, utils::ShortHash(relativePath, hashBytes));
            while (taken.count(ToLower(name)) != 0 && hashBytes < kFullHashBytes) {
                hashBytes *= 2;
                name = AppendHashBeforeExtension(group.baseName, utils::ShortHash(relativePath, hashBytes));
            }
            for (int suffix = 2; taken.count(ToLower(name)) != 0; ++suffix) {
                name = AppendHashBeforeExtension(group.baseName,
                                                 utils::ShortHash(relativePath, hashBytes) + "_" + std::to_string(suffix));
            }
            if (hashBytes != kShortHashBytes) {
                vpg::core::Logger::Warning("[FolderPatchGenerator] '{}' clashed with an existing output name, using '{}'",
                                           relativePath, name);
            }
            taken.insert(ToLower(name));
            names[relativePath] = name;
        }
        if (collidingBaseNames) {
            collidingBaseNames->push_back(group.baseName);
        }
    }
    return names;
}

FolderBatchResult GenerateFolder(const std::filesystem::path& sourceRoot,
                                 const std::filesystem::path& editedRoot,
                                 const std::filesystem::path& outRoot,
                                 const FolderBatchOptions& options) {
    const std::filesystem::path source = NormalizeRoot(sourceRoot);
    const std::filesystem::path edited = NormalizeRoot(editedRoot);
    const std::filesystem::path out = NormalizeRoot(outRoot);

    RequireDirectory(source, "Source");
    RequireDirectory(edited, "Edited");

    std::error_code ec;
    std::filesystem::create_directories(out, ec);
    if (ec) {
        throw core::IoError(out.string(), "cannot create output folder: " + ec.message());
    }

    vpg::core::Logger::Info("[FolderPatchGenerator] Comparing '{}' against '{}' into '{}'",
                            edited.string(), source.string(), out.string());

    ClearTopLevelJsonFiles(out);

    const std::vector<std::string> relativePaths = CollectRelativeJsonPaths(edited);

    std::vector<std::string> collidingBaseNames;
    const auto names = BuildOutputNameMap(relativePaths, &collidingBaseNames);
    for (const auto& baseName : collidingBaseNames) {
        RemoveLegacyOutput(out / baseName);
    }

    FolderBatchResult result;
    result.filesScanned = static_cast<int>(relativePaths.size());

    for (const auto& relativePath : relativePaths) {
        const std::filesystem::path editedFile = edited / std::filesystem::path(relativePath);
        const std::filesystem::path sourceFile = source / std::filesystem::path(relativePath);
        const std::filesystem::path outFile = out / names.at(relativePath);

        try {
            const std::string fileId =
                ResolveFileId(editedFile, sourceFile, relativePath, options.vanillaAliasing);

            std::optional<patch::DependsOnList> dependsOn;
            if (options.autoDepends) {
                dependsOn = AutoDependsOn(fileId);
            }

            std::optional<json::Value> original;
            std::error_code existsEc;
            if (std::filesystem::is_regular_file(sourceFile, existsEc)) {
                original = json::LoadDocument(sourceFile);
            }
            const json::Value editedDocument = json::LoadDocument(editedFile);

            const patch::PatchList operations = patch::Generate(
                original ? &*original : nullptr, editedDocument, fileId, options.config, dependsOn);

            if (operations.empty()) {
                vpg::core::Logger::Debug("[FolderPatchGenerator] {}: unchanged", relativePath);
                continue;
            }

            patch::WritePatchFile(outFile, operations);
            ++result.patchesWritten;
            result.totalOpsWritten += static_cast<int>(operations.size());
            vpg::core::Logger::Debug("[FolderPatchGenerator] {}: {} op(s) -> {}",
                                     relativePath, operations.size(), outFile.filename().string());
        } catch (const std::exception& ex) {
            result.errors.push_back(relativePath + ": " + ex.what());
            vpg::core::Logger::Warning("[FolderPatchGenerator] {}: {}", relativePath, ex.what());
        }
    }

    vpg::core::Logger::Info("[FolderPatchGenerator] Scanned {} file(s), wrote {} patch file(s) with {} op(s), {} error(s)",
                            result.filesScanned, result.patchesWritten, result.totalOpsWritten,
                            result.errors.size());
    return result;
}

} // namespace vpg::batch
