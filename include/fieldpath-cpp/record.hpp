/// @file record.hpp
/// @brief An in-memory host record whose fields the engine reads and writes.

#pragma once

#include <fieldpath-cpp/engine.hpp>
#include <fieldpath-cpp/value.hpp>

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fieldpath_cpp {

/// A named set of fields holding JSON text or already-decoded values.
///
/// Record is thread-safe (shared_mutex internally): resolve_path() takes a
/// shared lock, update_path() and delete_path() an exclusive one, so writers
/// on the same record are serialized and never lose each other's changes.
/// After an update or delete the field holds canonical text.
///
/// @code
/// auto rec = Record{};
/// rec.set_field("json_payload", std::string{R"({"a": {"b": 1}})"});
/// rec.resolve_path("$.a.b");            // 1
/// rec.update_path("$.a.c", "x");        // {"a": {"b": 1, "c": "x"}}
/// rec.delete_path("$.a.b");             // {"a": {"c": "x"}}
/// @endcode
class Record : public FieldSource {
public:
    /// Construct with a private Engine using default options.
    Record();

    /// Construct with a shared Engine (its cache is shared too).
    explicit Record(std::shared_ptr<const Engine> engine);

    ~Record() override;

    Record(const Record&) = delete;
    auto operator=(const Record&) -> Record& = delete;

    // -- Fields ---------------------------------------------------------------

    /// Replace the content of a field.
    void set_field(std::string_view name, FieldContent content);

    /// Remove a field entirely.
    void clear_field(std::string_view name);

    /// Content of a field (unset if absent).
    auto field(std::string_view name) const -> FieldContent;

    /// Text content of a field, or nullopt if it is absent or structured.
    auto field_text(std::string_view name) const -> std::optional<std::string>;

    /// Check if a field has been set.
    auto has_field(std::string_view name) const -> bool;

    /// Names of all set fields, sorted.
    auto field_names() const -> std::vector<std::string>;

    // -- FieldSource ----------------------------------------------------------

    auto read_field(std::string_view name) const -> FieldContent override;
    void write_field(std::string_view name, std::string text) override;

    // -- Path operations ------------------------------------------------------
    // `field_name` defaults to the engine's default_field ("json_payload").

    /// See Engine::resolve.
    auto resolve_path(std::string_view path, const Json& default_value = Json{},
                      std::optional<std::string_view> field_name = std::nullopt) const -> Json;

    /// See Engine::update.
    auto update_path(std::string_view path, const Json& value,
                     std::optional<std::string_view> field_name = std::nullopt) -> Json;

    /// See Engine::remove.
    auto delete_path(std::string_view path,
                     std::optional<std::string_view> field_name = std::nullopt) -> Json;

    /// See Engine::locate.
    auto locate_path(std::string_view path,
                     std::optional<std::string_view> field_name = std::nullopt) const
        -> std::vector<std::string>;

    auto engine() const -> const std::shared_ptr<const Engine>& { return engine_; }

private:
    auto field_or_default(std::optional<std::string_view> field_name) const -> std::string_view;

    std::shared_ptr<const Engine> engine_;
    std::map<std::string, FieldContent, std::less<>> fields_;
    mutable std::shared_mutex mutex_;
};

}  // namespace fieldpath_cpp
