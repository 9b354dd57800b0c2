#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "vpg/patch/DiffEngine.hpp"
#include "vpg/utils/Config.hpp"

namespace vpg::app {

enum class Command {
    Help,
    File,
    Folder,
    FileId,
    Inspect
};

// Values left empty fall back to the config file.
struct CommandLineOptions {
    Command command = Command::Help;
    std::vector<std::string> positional;

    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> outputFile;
    std::optional<std::filesystem::path> logFile;

    std::optional<patch::ArrayDiffMode> arrayMode;
    std::optional<std::optional<std::string>> side;
    std::optional<bool> preferAddMerge;
    std::optional<bool> escapePathSegments;
    std::optional<int> collapseThreshold;
    bool autoDepends = false;
    bool vanillaFiles = false;

    bool quiet = false;
    bool verbose = false;
};

/// Throws core::ConfigError on unknown options, bad values or wrong argument counts.
CommandLineOptions ParseCommandLine(const std::vector<std::string>& args);

void ApplyOverrides(const CommandLineOptions& options, utils::ToolConfig& config);

std::string UsageText();

} // namespace vpg::app
