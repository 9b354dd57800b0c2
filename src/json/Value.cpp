#include "vpg/json/Value.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <unordered_map>

#include "vpg/core/Error.hpp"

namespace vpg::json {

namespace {

bool IntegersEqual(const Value& lhs, const Value& rhs) {
    const bool lhsUnsigned = lhs.is_number_unsigned();
    const bool rhsUnsigned = rhs.is_number_unsigned();
    if (lhsUnsigned == rhsUnsigned) {
        return lhsUnsigned ? lhs.get<std::uint64_t>() == rhs.get<std::uint64_t>()
                           : lhs.get<std::int64_t>() == rhs.get<std::int64_t>();
    }
    // The parser only produces signed values for negative numbers.
    const Value& signedSide = lhsUnsigned ? rhs : lhs;
    const Value& unsignedSide = lhsUnsigned ? lhs : rhs;
    const auto s = signedSide.get<std::int64_t>();
    return s >= 0 && static_cast<std::uint64_t>(s) == unsignedSide.get<std::uint64_t>();
}

bool ObjectsEqual(const Value& lhs, const Value& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    std::unordered_map<std::string_view, const Value*> index;
    index.reserve(rhs.size());
    for (auto it = rhs.begin(); it != rhs.end(); ++it) {
        index.emplace(it.key(), &it.value());
    }
    for (auto it = lhs.begin(); it != lhs.end(); ++it) {
        const auto found = index.find(it.key());
        if (found == index.end() || !Equivalent(it.value(), *found->second)) {
            return false;
        }
    }
    return true;
}

} // namespace

ValueKind KindOf(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:
        case Value::value_t::discarded:
            return ValueKind::Null;
        case Value::value_t::boolean:
            return ValueKind::Bool;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
            return ValueKind::Integer;
        case Value::value_t::number_float:
            return ValueKind::Float;
        case Value::value_t::string:
        case Value::value_t::binary:
            return ValueKind::String;
        case Value::value_t::array:
            return ValueKind::Array;
        case Value::value_t::object:
            return ValueKind::Object;
    }
    return ValueKind::Null;
}

const char* KindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:    return "null";
        case ValueKind::Bool:    return "bool";
        case ValueKind::Integer: return "integer";
        case ValueKind::Float:   return "float";
        case ValueKind::String:  return "string";
        case ValueKind::Array:   return "array";
        case ValueKind::Object:  return "object";
    }
    return "unknown";
}

bool Equivalent(const Value& lhs, const Value& rhs) {
    const ValueKind kind = KindOf(lhs);
    if (kind != KindOf(rhs)) {
        return false;
    }

    switch (kind) {
        case ValueKind::Null:
            return true;
        case ValueKind::Bool:
            return lhs.get<bool>() == rhs.get<bool>();
        case ValueKind::Integer:
            return IntegersEqual(lhs, rhs);
        case ValueKind::Float:
            return lhs.get<double>() == rhs.get<double>();
        case ValueKind::String:
            return lhs == rhs;
        case ValueKind::Array: {
            if (lhs.size() != rhs.size()) {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!Equivalent(lhs[i], rhs[i])) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::Object:
            return ObjectsEqual(lhs, rhs);
    }
    return false;
}

Value ParseDocument(std::string_view text, const std::string& sourceName) {
    try {
        return Value::parse(text.begin(), text.end(), nullptr, true, true);
    } catch (const nlohmann::json::parse_error& ex) {
        throw core::ParseError(sourceName, ex.what());
    }
}

Value LoadDocument(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::IoError(path.string(), "failed to open file for reading");
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw core::IoError(path.string(), "failed while reading file");
    }
    return ParseDocument(text, path.string());
}

std::string SerializeDocument(const Value& value) {
    return value.dump(2);
}

} // namespace vpg::json
