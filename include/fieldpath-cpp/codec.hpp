/// @file codec.hpp
/// @brief Value codec: field content to Json and back to canonical text.

#pragma once

#include <fieldpath-cpp/value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace fieldpath_cpp {

/// Decode raw field content into a value tree.
///
/// - unset content, blank text, `null` text and a structured null decode to nullopt
///   (the caller substitutes its own default);
/// - text (or a structured string) is parsed as JSON;
/// - a structured object or array is returned as-is.
///
/// @throws MalformedInputError if the text is not valid JSON.
/// @throws InvalidFieldTypeError if the content is a structured number or boolean.
auto decode(const FieldContent& content) -> std::optional<Json>;

/// Encode a value tree as canonical text.
///
/// UTF-8, `indent` spaces per level, non-ASCII characters emitted
/// literally. Encoding the same tree twice yields identical text.
auto encode(const Json& value, int indent = 4) -> std::string;

/// Parse a standalone JSON literal such as `5`, `"text"` or `{"a": 1}`.
/// @throws MalformedInputError if the text is not valid JSON.
auto parse_literal(std::string_view text) -> Json;

}  // namespace fieldpath_cpp
