/// @file engine.hpp
/// @brief The Engine class -- resolve, update and delete against host fields.

#pragma once

#include <fieldpath-cpp/mutate.hpp>
#include <fieldpath-cpp/path_cache.hpp>
#include <fieldpath-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fieldpath_cpp {

/// Tunables for an Engine.
struct EngineOptions {
    /// Compiled expressions kept in the path cache (0 disables caching).
    std::size_t cache_capacity = 256;
    /// Spaces per nesting level in persisted text.
    int indent = 4;
    /// Largest array index update synthesis may pad up to.
    std::size_t max_synthesized_index = 65536;
    /// Field used by Record when no field name is given.
    std::string default_field = "json_payload";
};

/// The host side of a record: where field content comes from and where
/// canonical text goes back to.
///
/// Implementations decide how fields are stored and persisted. The engine
/// never locks a FieldSource; hosts serialize concurrent writers themselves.
class FieldSource {
public:
    virtual ~FieldSource() = default;

    /// Raw content of `name`; unset content if the field is absent.
    virtual auto read_field(std::string_view name) const -> FieldContent = 0;

    /// Store canonical text for `name`.
    virtual void write_field(std::string_view name, std::string text) = 0;
};

/// Evaluates path expressions against host fields.
///
/// Every operation decodes the field, works on that private copy, and
/// only writes canonical text back once the whole mutation succeeded.
/// Data-layer failures are logged once here (operation, field, path) and
/// rethrown as typed Exceptions; argument errors are thrown unlogged.
///
/// An Engine is safe to share across threads.
///
/// @code
/// auto engine = Engine{};
/// auto name = engine.resolve(record, "$.user.name", "unknown", "json_payload");
/// engine.update(record, "$.user.tags[0]", "vip", "json_payload");
/// @endcode
class Engine {
public:
    Engine() : Engine{EngineOptions{}} {}
    explicit Engine(EngineOptions options);

    Engine(const Engine&) = delete;
    auto operator=(const Engine&) -> Engine& = delete;

    auto options() const -> const EngineOptions& { return options_; }

    /// Read the value(s) `path` selects.
    /// @return `default_value` if the field is empty or nothing matched,
    ///   the value itself for one match, an array of values for several.
    auto resolve(const FieldSource& source, std::string_view path,
                 const Json& default_value, std::string_view field_name) const -> Json;

    /// Set `value` at `path` (see apply_update) and persist the result.
    /// @return The full updated document.
    auto update(FieldSource& source, std::string_view path, const Json& value,
                std::string_view field_name) const -> Json;

    /// Delete everything `path` selects (see apply_delete) and persist the result.
    /// Deleting from an empty field or matching nothing changes nothing.
    /// @return The full document after compaction (null if the field is empty).
    auto remove(FieldSource& source, std::string_view path,
                std::string_view field_name) const -> Json;

    /// JSON Pointers of every location `path` currently selects.
    auto locate(const FieldSource& source, std::string_view path,
                std::string_view field_name) const -> std::vector<std::string>;

    /// Number of locations `path` currently selects.
    auto count(const FieldSource& source, std::string_view path,
               std::string_view field_name) const -> std::size_t;

    /// Compile `path` through the engine's cache.
    /// @throws PathSyntaxError on invalid grammar.
    auto compile_path(std::string_view path) const -> std::shared_ptr<const PathExpression>;

    /// The engine's compiled-expression cache.
    auto path_cache() const -> PathCache& { return cache_; }

private:
    EngineOptions options_;
    mutable PathCache cache_;
};

}  // namespace fieldpath_cpp
