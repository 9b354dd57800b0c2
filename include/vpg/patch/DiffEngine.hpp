#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "vpg/json/Value.hpp"
#include "vpg/patch/PatchOperation.hpp"

namespace vpg::patch {

enum class ArrayDiffMode {
    // Any change rewrites the whole array in one replace.
    ReplaceWhole,
    // Shared indices are diffed, extra entries removed from the end or appended.
    IndexByIndex
};

struct DiffConfig {
    ArrayDiffMode arrayMode = ArrayDiffMode::ReplaceWhole;
    bool escapePathSegments = true;
    std::optional<std::string> side = std::string("server");
    bool preferAddMerge = true;
    int collapseThreshold = 800;
};

/// Pointer-escapes an object key: `~` becomes `~0`, then `/` becomes `~1`.
std::string EscapePathSegment(std::string_view segment);

/// Joins a parent pointer and an already escaped segment: ("", "a") gives "/a", ("/a", "") gives "/a/".
std::string AppendPathSegment(const std::string& basePath, std::string_view segment);

/// Raw pointers are emitted unchanged, except the root pointer "" which is addressed as "/".
std::string ToPatchPath(const std::string& rawPath);

/**
 * @brief Recursive structural diff between two value trees.
 *
 * Every operation produced by one engine shares the same target file, side and
 * dependency list. The engine never modifies either input; emitted values are
 * copies.
 */
class DiffEngine {
public:
    DiffEngine(const DiffConfig& config,
               std::string targetFile,
               std::optional<DependsOnList> dependsOn = std::nullopt);

    /**
     * @brief Appends the operations turning @p original into @p edited at @p path.
     *
     * A null @p original means the key does not exist on the original side, a
     * null @p edited means it was deleted. @p path is a raw pointer ("" for the
     * document root, "/a/b" below it).
     */
    void Diff(const json::Value* original,
              const json::Value* edited,
              const std::string& path,
              PatchList& out) const;

    const DiffConfig& config() const { return m_config; }
    const std::string& targetFile() const { return m_targetFile; }

private:
    void DiffObjects(const json::Value& original, const json::Value& edited,
                     const std::string& path, PatchList& out) const;
    void DiffArrays(const json::Value& original, const json::Value& edited,
                    const std::string& path, PatchList& out) const;

    PatchOpType AddType() const;
    std::string KeyPath(const std::string& path, const std::string& key) const;

    void Emit(PatchList& out, PatchOpType type, const std::string& path,
              const json::Value* value) const;

    DiffConfig m_config;
    std::string m_targetFile;
    std::optional<DependsOnList> m_dependsOn;
};

} // namespace vpg::patch
