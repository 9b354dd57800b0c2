#pragma once

#include <filesystem>
#include <string>

#include "vpg/patch/PatchOperation.hpp"

namespace vpg::patch {

/// Two-space indented JSON array with a trailing newline.
std::string SerializePatch(const PatchList& operations);

/**
 * @brief Writes a patch file, creating missing parent directories.
 *
 * The text goes to a temporary sibling first and is renamed over @p outPath,
 * so a failed write never leaves a truncated patch behind. Throws core::IoError.
 */
void WritePatchFile(const std::filesystem::path& outPath, const PatchList& operations);

/// Reads a patch file written by WritePatchFile.
PatchList ReadPatchFile(const std::filesystem::path& path);

} // namespace vpg::patch
