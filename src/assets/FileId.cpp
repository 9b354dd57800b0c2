#include "vpg/assets/FileId.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace vpg::assets {

namespace {

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

std::filesystem::path Canonicalize(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        resolved = std::filesystem::absolute(path, ec);
        if (ec) {
            resolved = path;
        }
    }
    return resolved.lexically_normal();
}

std::vector<std::string> SplitSegments(const std::filesystem::path& path) {
    std::vector<std::string> segments;
    std::string current;
    for (const char c : path.generic_string()) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

} // namespace

bool IsVanillaDomain(std::string_view domain) {
    return EqualsIgnoreCase(domain, kVanillaDomain);
}

bool IsVanillaDomainAlias(std::string_view domain) {
    return EqualsIgnoreCase(domain, "game") ||
           EqualsIgnoreCase(domain, "creative") ||
           EqualsIgnoreCase(domain, "survival");
}

std::optional<FileId> InferFileId(const std::filesystem::path& absolutePath, bool vanillaAliasing) {
    const std::vector<std::string> segments = SplitSegments(Canonicalize(absolutePath));

    for (std::size_t i = 0; i + 2 < segments.size(); ++i) {
        if (!EqualsIgnoreCase(segments[i], "assets")) {
            continue;
        }

        FileId id;
        id.domain = segments[i + 1];
        if (vanillaAliasing && IsVanillaDomainAlias(id.domain)) {
            id.domain = std::string(kVanillaDomain);
        }
        for (std::size_t j = i + 2; j < segments.size(); ++j) {
            if (!id.relativePath.empty()) {
                id.relativePath.push_back('/');
            }
            id.relativePath.append(segments[j]);
        }
        return id;
    }
    return std::nullopt;
}

std::string NormalizeVanillaFileId(const std::string& fileId) {
    const auto separator = fileId.find(':');
    if (separator == std::string::npos || separator == 0) {
        return fileId;
    }
    if (!IsVanillaDomainAlias(std::string_view(fileId).substr(0, separator))) {
        return fileId;
    }
    return std::string(kVanillaDomain) + fileId.substr(separator);
}

std::optional<std::string> GetDomain(std::string_view fileId) {
    const auto separator = fileId.find(':');
    if (separator == std::string_view::npos || separator == 0) {
        return std::nullopt;
    }
    return std::string(fileId.substr(0, separator));
}

} // namespace vpg::assets
