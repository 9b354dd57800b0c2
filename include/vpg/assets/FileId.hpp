#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace vpg::assets {

// Logical target of a patch, written "domain:relative/path".
struct FileId {
    std::string domain;
    std::string relativePath;

    std::string ToString() const { return domain + ":" + relativePath; }

    bool operator==(const FileId&) const = default;
};

/// Domain every vanilla asset folder is patched through.
inline constexpr std::string_view kVanillaDomain = "game";

/// True for "game", ignoring case.
bool IsVanillaDomain(std::string_view domain);

/// True for "game", "creative" and "survival", ignoring case.
bool IsVanillaDomainAlias(std::string_view domain);

/**
 * @brief Infers the file id of an asset from its location on disk.
 *
 * Looks for the first `assets` segment (case-insensitive) followed by a domain
 * segment and at least one more segment. With @p vanillaAliasing, vanilla
 * folder names collapse to the "game" domain.
 */
std::optional<FileId> InferFileId(const std::filesystem::path& absolutePath,
                                  bool vanillaAliasing = false);

/// Applies vanilla alias collapsing to an existing "domain:relative" id.
std::string NormalizeVanillaFileId(const std::string& fileId);

/// Text before the first ':', or nothing when there is no non-empty domain.
std::optional<std::string> GetDomain(std::string_view fileId);

} // namespace vpg::assets
