#include "vpg/utils/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <system_error>

#include <fmt/format.h>

#include "vpg/core/Error.hpp"
#include "vpg/core/Logger.hpp"
#include "vpg/json/Value.hpp"

namespace vpg::utils {

namespace {

std::string ToLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

static std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path);
    }
    return normalized.lexically_normal();
}

static std::filesystem::path ResolvePath(const std::filesystem::path& baseDir,
                                         const std::string& value) {
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

template <typename T>
static T GetOrDefault(const json::Value& obj, const char* section, const char* key,
                      const T& fallback, ConfigLoadResult& result) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        result.errors.push_back(fmt::format("{}.{}: {}", section, key, e.what()));
        return fallback;
    }
}

// Integers only; values outside the int range are reported and clamped to it.
int GetThreshold(const json::Value& obj, const char* section, const char* key,
                 int fallback, ConfigLoadResult& result) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        result.errors.push_back(fmt::format("{}.{}: expected an integer, got {}", section, key, it->dump()));
        return fallback;
    }

    constexpr std::int64_t kMax = std::numeric_limits<int>::max();
    constexpr std::int64_t kMin = std::numeric_limits<int>::min();
    if (it->is_number_unsigned()) {
        const std::uint64_t value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(kMax)) {
            result.errors.push_back(fmt::format("{}.{} ({}) is out of range, using {}", section, key, value, kMax));
            return static_cast<int>(kMax);
        }
        return static_cast<int>(value);
    }

    const std::int64_t value = it->get<std::int64_t>();
    if (value < kMin) {
        // ValidateConfig reports and raises it to the minimum.
        return static_cast<int>(kMin);
    }
    return static_cast<int>(value);
}

json::Value Section(const json::Value& root, const char* name, ConfigLoadResult& result) {
    const auto it = root.find(name);
    if (it == root.end()) {
        return json::Value::object();
    }
    if (!it->is_object()) {
        result.errors.push_back(fmt::format("'{}' section must be an object", name));
        return json::Value::object();
    }
    return *it;
}

} // namespace

std::optional<patch::ArrayDiffMode> ParseArrayMode(std::string_view text) {
    const std::string value = ToLower(text);
    if (value == "replacewhole" || value == "replace") {
        return patch::ArrayDiffMode::ReplaceWhole;
    }
    if (value == "indexbyindex" || value == "index") {
        return patch::ArrayDiffMode::IndexByIndex;
    }
    return std::nullopt;
}

std::optional<std::optional<std::string>> ParseSide(std::string_view text) {
    const std::string value = ToLower(text);
    if (value == "server" || value == "client") {
        return std::optional<std::string>(value);
    }
    if (value == "both") {
        return std::optional<std::string>();
    }
    return std::nullopt;
}

const char* ArrayModeName(patch::ArrayDiffMode mode) {
    switch (mode) {
        case patch::ArrayDiffMode::ReplaceWhole: return "replaceWhole";
        case patch::ArrayDiffMode::IndexByIndex: return "indexByIndex";
    }
    return "replaceWhole";
}

ToolConfig ConfigLoader::CreateDefault() {
    return ToolConfig{};
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() ? std::filesystem::current_path()
                                                       : NormalizePath(path).parent_path();

    ConfigLoadResult result;
    result.config = CreateDefault();

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        result.warnings.push_back(fmt::format("Config file '{}' not found, using defaults",
                                              path.empty() ? "<none>" : path.string()));
        vpg::core::Logger::Warning("[ConfigLoader] {}", result.warnings.back());
        return result;
    }

    json::Value root;
    try {
        root = json::LoadDocument(path);
    } catch (const core::Error& e) {
        result.errors.push_back(e.what());
        vpg::core::Logger::Error("[ConfigLoader] {}", result.errors.back());
        return result;
    }
    if (!root.is_object()) {
        result.errors.push_back(fmt::format("Config file '{}' must contain a JSON object", path.string()));
        vpg::core::Logger::Error("[ConfigLoader] {}", result.errors.back());
        return result;
    }

    ToolConfig& config = result.config;

    const json::Value diffObj = Section(root, "diff", result);
    const auto arrayMode = GetOrDefault<std::string>(diffObj, "diff", "arrayMode",
                                                     ArrayModeName(config.diff.arrayMode), result);
    if (const auto mode = ParseArrayMode(arrayMode)) {
        config.diff.arrayMode = *mode;
    } else {
        result.errors.push_back(fmt::format("diff.arrayMode: unknown mode '{}'", arrayMode));
    }
    config.diff.escapePathSegments =
        GetOrDefault<bool>(diffObj, "diff", "escapePathSegments", config.diff.escapePathSegments, result);
    config.diff.preferAddMerge =
        GetOrDefault<bool>(diffObj, "diff", "preferAddMerge", config.diff.preferAddMerge, result);
    config.diff.collapseThreshold =
        GetThreshold(diffObj, "diff", "collapseThreshold", config.diff.collapseThreshold, result);
    if (diffObj.contains("side")) {
        const auto side = GetOrDefault<std::string>(diffObj, "diff", "side", "server", result);
        if (const auto parsed = ParseSide(side)) {
            config.diff.side = *parsed;
        } else {
            result.errors.push_back(fmt::format("diff.side: unknown side '{}'", side));
        }
    }

    const json::Value batchObj = Section(root, "batch", result);
    config.batch.autoDepends = GetOrDefault<bool>(batchObj, "batch", "autoDepends", config.batch.autoDepends, result);
    config.batch.vanillaFiles = GetOrDefault<bool>(batchObj, "batch", "vanillaFiles", config.batch.vanillaFiles, result);

    const json::Value loggingObj = Section(root, "logging", result);
    const auto logFile = GetOrDefault<std::string>(loggingObj, "logging", "file", std::string(), result);
    if (!logFile.empty()) {
        config.logging.file = ResolvePath(baseDir, logFile);
    }
    config.logging.debug = GetOrDefault<bool>(loggingObj, "logging", "debug", config.logging.debug, result);

    result.loadedFromFile = true;

    ValidateConfig(config, result);

    for (const auto& warning : result.warnings) {
        vpg::core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        vpg::core::Logger::Error("[ConfigLoader] {}", error);
    }
    vpg::core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());

    return result;
}

void ConfigLoader::ValidateConfig(ToolConfig& config, ConfigLoadResult& result) {
    if (config.diff.collapseThreshold < kMinCollapseThreshold) {
        result.errors.push_back(
            fmt::format("diff.collapseThreshold ({}) must be at least {}",
                        config.diff.collapseThreshold, kMinCollapseThreshold));
        config.diff.collapseThreshold = kMinCollapseThreshold;
    }

    if (!config.diff.escapePathSegments) {
        result.warnings.push_back("diff.escapePathSegments is off, keys containing '/' or '~' will produce ambiguous paths");
    }
}

} // namespace vpg::utils
