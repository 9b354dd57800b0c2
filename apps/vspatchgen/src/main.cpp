#include <cstdlib>
#include <exception>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "CommandLine.hpp"
#include "vpg/assets/FileId.hpp"
#include "vpg/batch/FolderPatchGenerator.hpp"
#include "vpg/batch/PatchJob.hpp"
#include "vpg/core/Error.hpp"
#include "vpg/core/Logger.hpp"
#include "vpg/patch/PatchWriter.hpp"
#include "vpg/utils/Config.hpp"

namespace {

constexpr int kExitUsage = 2;

void ConfigureLogging(const vpg::app::CommandLineOptions& options, const vpg::utils::ToolConfig& config) {
    if (options.quiet) {
        vpg::core::Logger::SetMinimumLevel(vpg::core::LogLevel::Warning);
    }
    vpg::core::Logger::SetDebugEnabled(config.logging.debug);
    if (!config.logging.file.empty()) {
        vpg::core::Logger::SetLogFile(config.logging.file);
    }
}

int RunFile(const vpg::app::CommandLineOptions& options, const vpg::utils::ToolConfig& config) {
    vpg::batch::SingleFileRequest request;
    request.sourceFile = options.positional[0];
    request.editedFile = options.positional[1];
    request.outputFile = options.outputFile;
    request.config = config.diff;
    request.autoDepends = config.batch.autoDepends;
    request.vanillaAliasing = config.batch.vanillaFiles;

    const auto result = vpg::batch::GenerateSingleFile(request);
    fmt::print("Done. Wrote {} patch op(s).\nTarget file: {}\nOutput: {}\n",
               result.operationCount, result.fileId, result.outputFile.string());
    return EXIT_SUCCESS;
}

int RunFolder(const vpg::app::CommandLineOptions& options, const vpg::utils::ToolConfig& config) {
    vpg::batch::FolderBatchOptions batchOptions;
    batchOptions.config = config.diff;
    batchOptions.autoDepends = config.batch.autoDepends;
    batchOptions.vanillaAliasing = config.batch.vanillaFiles;

    const auto result = vpg::batch::GenerateFolder(options.positional[0],
                                                   options.positional[1],
                                                   options.positional[2],
                                                   batchOptions);

    fmt::print("Scanned {} file(s). Wrote {} patch file(s) containing {} op(s).\n",
               result.filesScanned, result.patchesWritten, result.totalOpsWritten);
    if (result.HasErrors()) {
        fmt::print("{} file(s) failed:\n", result.errors.size());
        for (const auto& error : result.errors) {
            fmt::print("  {}\n", error);
        }
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int RunFileId(const vpg::app::CommandLineOptions& options, const vpg::utils::ToolConfig& config) {
    const std::filesystem::path path = options.positional[0];
    const auto id = vpg::assets::InferFileId(path, config.batch.vanillaFiles);
    if (!id) {
        throw vpg::core::NotFoundError(path.string(), "no .../assets/<domain>/... segment in path");
    }
    fmt::print("{}\n", id->ToString());
    return EXIT_SUCCESS;
}

int RunInspect(const vpg::app::CommandLineOptions& options) {
    const std::filesystem::path path = options.positional[0];
    const auto operations = vpg::patch::ReadPatchFile(path);

    std::map<std::string, int> perOp;
    std::map<std::string, int> perFile;
    for (const auto& operation : operations) {
        ++perOp[vpg::patch::ToString(operation.op)];
        ++perFile[operation.file];
    }

    fmt::print("{}: {} op(s)\n", path.string(), operations.size());
    for (const auto& [op, count] : perOp) {
        fmt::print("  {:<9} {}\n", op, count);
    }
    for (const auto& [file, count] : perFile) {
        fmt::print("  target {} ({} op(s))\n", file, count);
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    vpg::app::CommandLineOptions options;
    try {
        options = vpg::app::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const vpg::core::ConfigError& ex) {
        fmt::print(stderr, "Error: {}\n\n{}", ex.what(), vpg::app::UsageText());
        return kExitUsage;
    }

    if (options.command == vpg::app::Command::Help) {
        fmt::print("{}", vpg::app::UsageText());
        return EXIT_SUCCESS;
    }

    try {
        vpg::utils::ToolConfig config;
        if (options.configPath) {
            auto configResult = vpg::utils::ConfigLoader::Load(*options.configPath);
            if (configResult.HasErrors()) {
                vpg::core::Logger::Error("[main] Configuration errors detected. Please fix the following:");
                for (const auto& error : configResult.errors) {
                    vpg::core::Logger::Error("[main]   - {}", error);
                }
                return kExitUsage;
            }
            config = configResult.config;
        }
        vpg::app::ApplyOverrides(options, config);
        ConfigureLogging(options, config);

        switch (options.command) {
            case vpg::app::Command::File:    return RunFile(options, config);
            case vpg::app::Command::Folder:  return RunFolder(options, config);
            case vpg::app::Command::FileId:  return RunFileId(options, config);
            case vpg::app::Command::Inspect: return RunInspect(options);
            case vpg::app::Command::Help:    break;
        }
        return EXIT_SUCCESS;
    } catch (const vpg::core::Error& ex) {
        vpg::core::Logger::Error("[main] {}", ex.what());
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        vpg::core::Logger::Error("[main] Fatal exception: {}", ex.what());
        return EXIT_FAILURE;
    }
}
