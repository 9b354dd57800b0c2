#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vpg/patch/DiffEngine.hpp"

namespace vpg::utils {

struct BatchConfig {
    bool autoDepends = false;
    bool vanillaFiles = false;
};

struct LoggingConfig {
    std::filesystem::path file;
    bool debug = false;
};

struct ToolConfig {
    patch::DiffConfig diff;
    BatchConfig batch;
    LoggingConfig logging;
};

struct ConfigLoadResult {
    ToolConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Values that were rejected and replaced by defaults
    std::vector<std::string> warnings;    // Non-critical issues that should be logged

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

/// Accepts "replaceWhole"/"replace" and "indexByIndex"/"index", ignoring case.
std::optional<patch::ArrayDiffMode> ParseArrayMode(std::string_view text);

/**
 * @brief Accepts "server", "client" and "both", ignoring case.
 * @return The side to write into patches; an empty optional inside means "both".
 */
std::optional<std::optional<std::string>> ParseSide(std::string_view text);

const char* ArrayModeName(patch::ArrayDiffMode mode);

class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);

    static constexpr int kMinCollapseThreshold = 1;

private:
    static ToolConfig CreateDefault();
    static void ValidateConfig(ToolConfig& config, ConfigLoadResult& result);
};

} // namespace vpg::utils
