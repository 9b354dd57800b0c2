#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace vpg::json {

// Insertion-ordered so object keys keep the order they had in the source text.
using Value = nlohmann::ordered_json;

enum class ValueKind {
    Null,
    Bool,
    Integer,
    Float,
    String,
    Array,
    Object
};

ValueKind KindOf(const Value& value);
const char* KindName(ValueKind kind);

inline bool IsScalar(ValueKind kind) {
    return kind != ValueKind::Array && kind != ValueKind::Object;
}

/**
 * @brief Structural equality used by the diff engine.
 *
 * Objects are compared as key sets, arrays element by element. Signed and
 * unsigned integers compare by numeric value; floats compare by their parsed
 * double value. An integer never equals a float, so `1` and `1.0` differ.
 */
bool Equivalent(const Value& lhs, const Value& rhs);

/// Parses JSON text, ignoring `//` and `/* */` comments. Throws core::ParseError.
Value ParseDocument(std::string_view text, const std::string& sourceName);

/// Reads and parses a file. Throws core::IoError or core::ParseError.
Value LoadDocument(const std::filesystem::path& path);

std::string SerializeDocument(const Value& value);

} // namespace vpg::json
