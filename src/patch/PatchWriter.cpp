#include "vpg/patch/PatchWriter.hpp"

#include <fstream>
#include <system_error>

#include "vpg/core/Error.hpp"
#include "vpg/core/Logger.hpp"
#include "vpg/json/Value.hpp"

namespace vpg::patch {

std::string SerializePatch(const PatchList& operations) {
    std::string text = json::SerializeDocument(ToJson(operations));
    text.push_back('\n');
    return text;
}

void WritePatchFile(const std::filesystem::path& outPath, const PatchList& operations) {
    const std::filesystem::path target = std::filesystem::absolute(outPath);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw core::IoError(target.parent_path().string(),
                            "cannot create output directory: " + ec.message());
    }

    const std::string text = SerializePatch(operations);
    std::filesystem::path temp = target;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw core::IoError(temp.string(), "failed to open file for writing");
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(temp, ec);
            throw core::IoError(temp.string(), "failed while writing file");
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        throw core::IoError(target.string(), "failed to move patch into place: " + reason);
    }

    vpg::core::Logger::Debug("[PatchWriter] Wrote {} operation(s) to '{}'", operations.size(), target.string());
}

PatchList ReadPatchFile(const std::filesystem::path& path) {
    return PatchFromJson(json::LoadDocument(path), path.string());
}

} // namespace vpg::patch
