#include "vpg/batch/PatchJob.hpp"

#include <system_error>

#include "vpg/assets/FileId.hpp"
#include "vpg/core/Error.hpp"
#include "vpg/core/Logger.hpp"
#include "vpg/json/Value.hpp"
#include "vpg/patch/PatchGenerator.hpp"
#include "vpg/patch/PatchWriter.hpp"

namespace vpg::batch {

namespace {

void RequireFile(const std::filesystem::path& path, const char* role) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        throw core::NotFoundError(path.string(), std::string(role) + " file not found");
    }
}

} // namespace

std::optional<patch::DependsOnList> AutoDependsOn(const std::string& fileId) {
    const auto domain = assets::GetDomain(fileId);
    if (!domain || assets::IsVanillaDomain(*domain)) {
        return std::nullopt;
    }
    return patch::DependsOnList{patch::DependsOnEntry{*domain, std::nullopt}};
}

std::filesystem::path DefaultOutputPath(const std::filesystem::path& sourceFile) {
    std::filesystem::path name = sourceFile.stem();
    name += ".patches.json";
    return sourceFile.parent_path() / name;
}

SingleFileResult GenerateSingleFile(const SingleFileRequest& request) {
    RequireFile(request.sourceFile, "Source");
    RequireFile(request.editedFile, "Edited");

    const auto fileId = assets::InferFileId(request.sourceFile, request.vanillaAliasing);
    if (!fileId) {
        throw core::NotFoundError(request.sourceFile.string(),
                                  "cannot infer target file id, expected the source inside .../assets/<domain>/...");
    }

    SingleFileResult result;
    result.fileId = fileId->ToString();
    result.outputFile = request.outputFile ? *request.outputFile : DefaultOutputPath(request.sourceFile);

    std::optional<patch::DependsOnList> dependsOn;
    if (request.autoDepends) {
        dependsOn = AutoDependsOn(result.fileId);
    }

    const json::Value original = json::LoadDocument(request.sourceFile);
    const json::Value edited = json::LoadDocument(request.editedFile);

    const patch::PatchList operations =
        patch::Generate(original, edited, result.fileId, request.config, dependsOn);
    patch::WritePatchFile(result.outputFile, operations);

    result.operationCount = operations.size();
    vpg::core::Logger::Info("[PatchJob] Wrote {} patch op(s) for {} to '{}'",
                            result.operationCount, result.fileId, result.outputFile.string());
    return result;
}

} // namespace vpg::batch
