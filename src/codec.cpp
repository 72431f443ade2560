#include <fieldpath-cpp/codec.hpp>
#include <fieldpath-cpp/error.hpp>

#include <algorithm>
#include <string>
#include <variant>

namespace fieldpath_cpp {

namespace {

auto is_blank(std::string_view text) -> bool {
    return std::ranges::all_of(text, [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    });
}

auto parse_text(std::string_view text) -> std::optional<Json> {
    if (is_blank(text)) return std::nullopt;
    auto value = Json{};
    try {
        value = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw MalformedInputError{std::string{"invalid JSON text: "} + e.what()};
    }
    if (value.is_null()) return std::nullopt;
    return value;
}

}  // anonymous namespace

auto decode(const FieldContent& content) -> std::optional<Json> {
    return std::visit(overload{
        [](std::monostate) -> std::optional<Json> { return std::nullopt; },
        [](const std::string& text) -> std::optional<Json> { return parse_text(text); },
        [](const Json& value) -> std::optional<Json> {
            if (value.is_null()) return std::nullopt;
            if (value.is_string()) return parse_text(value.get_ref<const std::string&>());
            if (value.is_object() || value.is_array()) return value;
            throw InvalidFieldTypeError{
                std::string{"field must contain JSON text or an object/array, got "} +
                value.type_name()};
        },
    }, content);
}

auto encode(const Json& value, int indent) -> std::string {
    // replace: stored strings with broken UTF-8 must not make a document unwritable
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

auto parse_literal(std::string_view text) -> Json {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw MalformedInputError{std::string{"invalid JSON literal: "} + e.what()};
    }
}

}  // namespace fieldpath_cpp
