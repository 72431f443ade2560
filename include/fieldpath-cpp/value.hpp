/// @file value.hpp
/// @brief Value types: Json, Prop, FieldContent, and visitor helpers.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace fieldpath_cpp {

/// A JSON value tree.
///
/// Objects keep their members in insertion order and keys are unique.
/// Alternatives: null, bool, number (integer, unsigned, float),
/// string, array, object.
using Json = nlohmann::ordered_json;

/// A key into an object (string) or an index into an array (size_t).
using Prop = std::variant<std::string, std::size_t>;

/// Create an object key Prop from a string.
inline auto map_key(std::string key) -> Prop { return Prop{std::move(key)}; }

/// Create an array index Prop from an index.
inline auto list_index(std::size_t idx) -> Prop { return Prop{idx}; }

/// Raw content of a host record field.
///
/// Hosts hand the engine either nothing (the field is unset), raw JSON
/// text, or a value they already decoded. The codec normalizes all three.
///
/// @code
/// auto unset = FieldContent{};
/// auto text = FieldContent{std::string{R"({"a": 1})"}};
/// auto tree = FieldContent{Json{{"a", 1}}};
/// @endcode
using FieldContent = std::variant<std::monostate, std::string, Json>;

/// Check if a FieldContent holds nothing at all.
inline auto is_unset(const FieldContent& c) -> bool {
    return std::holds_alternative<std::monostate>(c);
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& key) { ... },
///     [](std::size_t index) { ... },
/// }, prop);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace fieldpath_cpp
