#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace vpg::utils {

/// Lowercase hex SHA-256 of the bytes of @p text. Throws core::Error if the digest fails.
std::string Sha256Hex(std::string_view text);

/// First @p byteCount digest bytes of Sha256Hex, i.e. 2 * byteCount hex characters.
std::string ShortHash(std::string_view text, std::size_t byteCount = 4);

} // namespace vpg::utils
