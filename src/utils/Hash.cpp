#include "vpg/utils/Hash.hpp"

#include <algorithm>
#include <array>
#include <iterator>

#include <fmt/format.h>
#include <openssl/evp.h>

#include "vpg/core/Error.hpp"

namespace vpg::utils {

namespace {

std::array<unsigned char, 32> Sha256(std::string_view text) {
    std::array<unsigned char, 32> digest{};
    unsigned int length = 0;
    if (EVP_Digest(text.data(), text.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1 ||
        length != digest.size()) {
        throw core::Error("SHA-256 digest failed");
    }
    return digest;
}

} // namespace

std::string Sha256Hex(std::string_view text) {
    return ShortHash(text, 32);
}

std::string ShortHash(std::string_view text, std::size_t byteCount) {
    const auto digest = Sha256(text);
    const std::size_t count = std::min(byteCount, digest.size());

    std::string hex;
    hex.reserve(count * 2);
    for (std::size_t i = 0; i < count; ++i) {
        fmt::format_to(std::back_inserter(hex), "{:02x}", digest[i]);
    }
    return hex;
}

} // namespace vpg::utils
