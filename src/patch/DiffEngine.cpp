#include "vpg/patch/DiffEngine.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace vpg::patch {

namespace {

constexpr std::string_view kAppendToken = "-";

using KeyIndex = std::unordered_map<std::string_view, const json::Value*>;

KeyIndex IndexKeys(const json::Value& object) {
    KeyIndex index;
    index.reserve(object.size());
    for (auto it = object.begin(); it != object.end(); ++it) {
        index.emplace(it.key(), &it.value());
    }
    return index;
}

} // namespace

std::string EscapePathSegment(std::string_view segment) {
    std::string escaped;
    escaped.reserve(segment.size());
    for (const char c : segment) {
        if (c == '~') {
            escaped.append("~0");
        } else if (c == '/') {
            escaped.append("~1");
        } else {
            escaped.push_back(c);
        }
    }
    return escaped;
}

std::string AppendPathSegment(const std::string& basePath, std::string_view segment) {
    std::string joined;
    joined.reserve(basePath.size() + segment.size() + 1);
    joined.append(basePath);
    joined.push_back('/');
    joined.append(segment);
    return joined;
}

std::string ToPatchPath(const std::string& rawPath) {
    if (rawPath.empty()) {
        return "/";
    }
    return rawPath;
}

DiffEngine::DiffEngine(const DiffConfig& config,
                       std::string targetFile,
                       std::optional<DependsOnList> dependsOn)
    : m_config(config),
      m_targetFile(std::move(targetFile)),
      m_dependsOn(std::move(dependsOn)) {}

PatchOpType DiffEngine::AddType() const {
    return m_config.preferAddMerge ? PatchOpType::AddMerge : PatchOpType::Add;
}

std::string DiffEngine::KeyPath(const std::string& path, const std::string& key) const {
    if (m_config.escapePathSegments) {
        return AppendPathSegment(path, EscapePathSegment(key));
    }
    return AppendPathSegment(path, key);
}

void DiffEngine::Emit(PatchList& out, PatchOpType type, const std::string& path,
                      const json::Value* value) const {
    PatchOperation operation;
    operation.dependsOn = m_dependsOn;
    operation.file = m_targetFile;
    operation.op = type;
    operation.path = ToPatchPath(path);
    if (type != PatchOpType::Remove) {
        operation.value = value ? *value : json::Value();
    }
    operation.side = m_config.side;
    out.push_back(std::move(operation));
}

void DiffEngine::Diff(const json::Value* original,
                      const json::Value* edited,
                      const std::string& path,
                      PatchList& out) const {
    if (!original) {
        Emit(out, AddType(), path, edited);
        return;
    }
    if (!edited) {
        Emit(out, PatchOpType::Remove, path, nullptr);
        return;
    }

    const json::ValueKind kind = json::KindOf(*original);
    if (kind != json::KindOf(*edited)) {
        Emit(out, PatchOpType::Replace, path, edited);
        return;
    }

    switch (kind) {
        case json::ValueKind::Null:
        case json::ValueKind::Bool:
        case json::ValueKind::Integer:
        case json::ValueKind::Float:
        case json::ValueKind::String:
            if (!json::Equivalent(*original, *edited)) {
                Emit(out, PatchOpType::Replace, path, edited);
            }
            return;
        case json::ValueKind::Object:
            DiffObjects(*original, *edited, path, out);
            return;
        case json::ValueKind::Array:
            DiffArrays(*original, *edited, path, out);
            return;
    }

    if (!json::Equivalent(*original, *edited)) {
        Emit(out, PatchOpType::Replace, path, edited);
    }
}

// Removed keys first, then added keys, then shared keys. Removed and shared
// keys follow the original's key order, added keys the edited document's.
void DiffEngine::DiffObjects(const json::Value& original, const json::Value& edited,
                             const std::string& path, PatchList& out) const {
    const KeyIndex originalKeys = IndexKeys(original);
    const KeyIndex editedKeys = IndexKeys(edited);

    for (auto it = original.begin(); it != original.end(); ++it) {
        if (!editedKeys.contains(it.key())) {
            Emit(out, PatchOpType::Remove, KeyPath(path, it.key()), nullptr);
        }
    }

    for (auto it = edited.begin(); it != edited.end(); ++it) {
        if (!originalKeys.contains(it.key())) {
            Emit(out, AddType(), KeyPath(path, it.key()), &it.value());
        }
    }

    for (auto it = original.begin(); it != original.end(); ++it) {
        const auto match = editedKeys.find(it.key());
        if (match != editedKeys.end()) {
            Diff(&it.value(), match->second, KeyPath(path, it.key()), out);
        }
    }
}

void DiffEngine::DiffArrays(const json::Value& original, const json::Value& edited,
                            const std::string& path, PatchList& out) const {
    if (m_config.arrayMode == ArrayDiffMode::ReplaceWhole) {
        if (!json::Equivalent(original, edited)) {
            Emit(out, PatchOpType::Replace, path, &edited);
        }
        return;
    }

    const std::size_t originalSize = original.size();
    const std::size_t editedSize = edited.size();
    const std::size_t shared = std::min(originalSize, editedSize);

    for (std::size_t i = 0; i < shared; ++i) {
        Diff(&original[i], &edited[i], AppendPathSegment(path, std::to_string(i)), out);
    }

    // Highest index first so each removal stays valid after the consumer re-indexes.
    for (std::size_t i = originalSize; i > editedSize; --i) {
        Emit(out, PatchOpType::Remove, AppendPathSegment(path, std::to_string(i - 1)), nullptr);
    }

    const std::string appendPath = AppendPathSegment(path, kAppendToken);
    for (std::size_t i = originalSize; i < editedSize; ++i) {
        Emit(out, AddType(), appendPath, &edited[i]);
    }
}

} // namespace vpg::patch
