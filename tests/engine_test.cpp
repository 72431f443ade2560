#include <fieldpath-cpp/codec.hpp>
#include <fieldpath-cpp/engine.hpp>
#include <fieldpath-cpp/error.hpp>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <ctime>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fieldpath_cpp;

namespace {

// -- Test helpers -------------------------------------------------------------

class MemorySource : public FieldSource {
public:
    auto read_field(std::string_view name) const -> FieldContent override {
        auto it = fields.find(name);
        return it == fields.end() ? FieldContent{} : it->second;
    }

    void write_field(std::string_view name, std::string text) override {
        ++writes;
        fields.insert_or_assign(std::string{name}, FieldContent{std::move(text)});
    }

    auto text(std::string_view name) const -> std::string {
        return std::get<std::string>(fields.at(std::string{name}));
    }

    std::map<std::string, FieldContent, std::less<>> fields;
    int writes = 0;
};

auto source_with(std::string text, std::string field = "data") -> MemorySource {
    auto source = MemorySource{};
    source.fields.emplace(std::move(field), FieldContent{std::move(text)});
    return source;
}

class ThrowingSource : public FieldSource {
public:
    auto read_field(std::string_view) const -> FieldContent override {
        throw std::runtime_error{"storage offline"};
    }
    void write_field(std::string_view, std::string) override {}
};

class RejectingWriteSource : public MemorySource {
public:
    void write_field(std::string_view, std::string) override {
        throw std::runtime_error{"read-only replica"};
    }
};

// Collects engine failure lines logged while it is alive.
class FailureLog : public google::LogSink {
public:
    FailureLog() { google::AddLogSink(this); }
    ~FailureLog() override { google::RemoveLogSink(this); }

    FailureLog(const FailureLog&) = delete;
    auto operator=(const FailureLog&) -> FailureLog& = delete;

    void send(google::LogSeverity severity, const char*, const char*, int,
              const struct ::tm*, const char* message, std::size_t message_len) override {
        auto line = std::string{message, message_len};
        if (line.find("fieldpath: op=") != std::string::npos) {
            lines.push_back(std::move(line));
            severities.push_back(severity);
        }
    }

    std::vector<std::string> lines;
    std::vector<google::LogSeverity> severities;
};

}  // anonymous namespace

// =============================================================================
// resolve
// =============================================================================

TEST(EngineResolve, single_match_returns_value) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": {"b": 1}})");
    EXPECT_EQ(engine.resolve(source, "$.a.b", Json{}, "data"), 1);
    EXPECT_EQ(engine.resolve(source, "$.a", Json{}, "data"), (Json{{"b", 1}}));
}

TEST(EngineResolve, several_matches_return_array) {
    auto engine = Engine{};
    auto source = source_with(R"({"arr": [1, 2, 3]})");
    EXPECT_EQ(engine.resolve(source, "$.arr[*]", Json{}, "data"), Json::array({1, 2, 3}));
}

TEST(EngineResolve, one_element_wildcard_returns_bare_value) {
    auto engine = Engine{};
    auto source = source_with(R"({"arr": [7]})");
    EXPECT_EQ(engine.resolve(source, "$.arr[*]", Json{}, "data"), 7);
}

TEST(EngineResolve, default_when_nothing_matches) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    EXPECT_EQ(engine.resolve(source, "$.missing", "fallback", "data"), "fallback");
    EXPECT_TRUE(engine.resolve(source, "$.missing", Json{}, "data").is_null());
}

TEST(EngineResolve, default_when_field_is_empty) {
    auto engine = Engine{};
    auto absent = MemorySource{};
    EXPECT_EQ(engine.resolve(absent, "$.a", 42, "data"), 42);

    for (const auto* text : {"", "   ", "null"}) {
        auto source = source_with(text);
        EXPECT_EQ(engine.resolve(source, "$.a", 42, "data"), 42) << "'" << text << "'";
    }

    auto structured_null = MemorySource{};
    structured_null.fields.emplace("data", FieldContent{Json{}});
    EXPECT_EQ(engine.resolve(structured_null, "$.a", 42, "data"), 42);
}

TEST(EngineResolve, matched_null_is_returned_not_default) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": null})");
    EXPECT_TRUE(engine.resolve(source, "$.a", "fallback", "data").is_null());
}

TEST(EngineResolve, structured_content) {
    auto engine = Engine{};
    auto source = MemorySource{};
    source.fields.emplace("data", FieldContent{Json{{"user", {{"name", "Ada"}}}}});
    EXPECT_EQ(engine.resolve(source, "$.user.name", Json{}, "data"), "Ada");
}

TEST(EngineResolve, never_writes) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    engine.resolve(source, "$..*", Json{}, "data");
    EXPECT_EQ(source.writes, 0);
}

TEST(EngineResolve, path_is_trimmed) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    EXPECT_EQ(engine.resolve(source, "  $.a \n", Json{}, "data"), 1);
}

// =============================================================================
// update
// =============================================================================

TEST(EngineUpdate, writes_canonical_text) {
    auto engine = Engine{};
    auto source = source_with(R"({"x":{"y":1}})");
    auto result = engine.update(source, "$.x.y", 5, "data");
    EXPECT_EQ(result, Json::parse(R"({"x": {"y": 5}})"));
    EXPECT_EQ(source.writes, 1);
    EXPECT_EQ(source.text("data"), "{\n    \"x\": {\n        \"y\": 5\n    }\n}");
}

TEST(EngineUpdate, absent_field_starts_fresh_object) {
    auto engine = Engine{};
    auto source = MemorySource{};
    EXPECT_EQ(engine.update(source, "$.x.y", 5, "data"), Json::parse(R"({"x": {"y": 5}})"));
    EXPECT_EQ(*decode(source.read_field("data")), Json::parse(R"({"x": {"y": 5}})"));
}

TEST(EngineUpdate, absent_field_with_index_starts_array) {
    auto engine = Engine{};
    auto source = MemorySource{};
    EXPECT_EQ(engine.update(source, "$[0].id", 1, "data"), Json::parse(R"([{"id": 1}])"));
}

TEST(EngineUpdate, structured_content_is_persisted_as_text) {
    auto engine = Engine{};
    auto source = MemorySource{};
    source.fields.emplace("data", FieldContent{Json{{"a", 1}}});
    engine.update(source, "$.b", "é", "data");
    EXPECT_EQ(source.text("data"), "{\n    \"a\": 1,\n    \"b\": \"é\"\n}");
}

TEST(EngineUpdate, only_named_field_changes) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})", "one");
    source.fields.emplace("two", FieldContent{std::string{R"({"a": 2})"}});
    engine.update(source, "$.a", 10, "one");
    EXPECT_EQ(std::get<std::string>(source.fields.at("two")), R"({"a": 2})");
}

TEST(EngineUpdate, failure_leaves_field_untouched) {
    auto engine = Engine{};
    auto original = std::string{R"({"a": 5})"};
    auto source = source_with(original);
    EXPECT_THROW(engine.update(source, "$.a.b", 1, "data"), UnsupportedOperationError);
    EXPECT_THROW(engine.update(source, "$.a[-1]", 1, "data"), UnsupportedOperationError);
    EXPECT_THROW(engine.update(source, "$..nope", 1, "data"), UnsupportedPatternError);
    EXPECT_EQ(source.writes, 0);
    EXPECT_EQ(source.text("data"), original);
}

TEST(EngineUpdate, custom_indent) {
    auto engine = Engine{EngineOptions{.indent = 2}};
    auto source = MemorySource{};
    engine.update(source, "$.a", 1, "data");
    EXPECT_EQ(source.text("data"), "{\n  \"a\": 1\n}");
}

TEST(EngineUpdate, synthesis_limit_from_options) {
    auto engine = Engine{EngineOptions{.max_synthesized_index = 3}};
    auto source = MemorySource{};
    EXPECT_NO_THROW(engine.update(source, "$.l[3]", 1, "data"));
    EXPECT_THROW(engine.update(source, "$.m[4]", 1, "data"), UnsupportedOperationError);
}

// =============================================================================
// remove
// =============================================================================

TEST(EngineRemove, deletes_and_writes) {
    auto engine = Engine{};
    auto source = source_with(R"({"arr": [1, 2, 3]})");
    EXPECT_EQ(engine.remove(source, "$.arr[1]", "data"), Json::parse(R"({"arr": [1, 3]})"));
    EXPECT_EQ(source.writes, 1);
    EXPECT_EQ(*decode(source.read_field("data")), Json::parse(R"({"arr": [1, 3]})"));
}

TEST(EngineRemove, no_match_does_not_write) {
    auto engine = Engine{};
    auto source = source_with(R"({"a":1,"b":2})");
    EXPECT_EQ(engine.remove(source, "$.c", "data"), Json::parse(R"({"a": 1, "b": 2})"));
    EXPECT_EQ(source.writes, 0);
    EXPECT_EQ(source.text("data"), R"({"a":1,"b":2})");
}

TEST(EngineRemove, repeated_delete_is_stable) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1, "b": 2})");
    auto first = engine.remove(source, "$.a", "data");
    auto text = source.text("data");
    auto second = engine.remove(source, "$.a", "data");
    EXPECT_EQ(first, second);
    EXPECT_EQ(source.text("data"), text);
    EXPECT_EQ(source.writes, 1);
}

TEST(EngineRemove, empty_field_returns_null) {
    auto engine = Engine{};
    auto source = MemorySource{};
    EXPECT_TRUE(engine.remove(source, "$.a", "data").is_null());
    EXPECT_EQ(source.writes, 0);
    EXPECT_FALSE(source.fields.contains("data"));
}

TEST(EngineRemove, root_is_unsupported) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    EXPECT_THROW(engine.remove(source, "$", "data"), UnsupportedOperationError);
    EXPECT_EQ(source.writes, 0);
}

// =============================================================================
// locate / count
// =============================================================================

TEST(EngineLocate, pointers_in_document_order) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": {"id": 1}, "l": [{"id": 2}, {"id": 3}]})");
    EXPECT_EQ(engine.locate(source, "$..id", "data"),
              (std::vector<std::string>{"/a/id", "/l/0/id", "/l/1/id"}));
    EXPECT_EQ(engine.count(source, "$..id", "data"), 3u);
}

TEST(EngineLocate, empty_field) {
    auto engine = Engine{};
    auto source = MemorySource{};
    EXPECT_TRUE(engine.locate(source, "$.a", "data").empty());
    EXPECT_EQ(engine.count(source, "$.a", "data"), 0u);
}

TEST(EngineLocate, still_validates_path_on_empty_field) {
    auto engine = Engine{};
    auto source = MemorySource{};
    EXPECT_THROW(engine.locate(source, "$[", "data"), PathSyntaxError);
    EXPECT_THROW(engine.count(source, "$[", "data"), PathSyntaxError);
    EXPECT_THROW(engine.remove(source, "$[", "data"), PathSyntaxError);
}

// =============================================================================
// Errors at the boundary
// =============================================================================

TEST(EngineErrors, blank_path_is_invalid_argument) {
    auto engine = Engine{};
    auto source = source_with("{}");
    EXPECT_THROW(engine.resolve(source, "", Json{}, "data"), InvalidArgumentError);
    EXPECT_THROW(engine.update(source, "  \t", 1, "data"), InvalidArgumentError);
    EXPECT_THROW(engine.remove(source, "\n", "data"), InvalidArgumentError);
}

TEST(EngineErrors, empty_field_name_is_invalid_argument) {
    auto engine = Engine{};
    auto source = source_with("{}");
    EXPECT_THROW(engine.resolve(source, "$.a", Json{}, ""), InvalidArgumentError);
    EXPECT_THROW(engine.update(source, "$.a", 1, ""), InvalidArgumentError);
    EXPECT_THROW(engine.remove(source, "$.a", ""), InvalidArgumentError);
    EXPECT_THROW(engine.locate(source, "$.a", ""), InvalidArgumentError);
}

TEST(EngineErrors, arguments_are_checked_before_data) {
    auto engine = Engine{};
    auto source = source_with("{ not json");
    EXPECT_THROW(engine.resolve(source, " ", Json{}, "data"), InvalidArgumentError);
}

TEST(EngineErrors, malformed_content) {
    auto engine = Engine{};
    auto source = source_with(R"({"invalid": json})");
    EXPECT_THROW(engine.resolve(source, "$.a", Json{}, "data"), MalformedInputError);
    EXPECT_THROW(engine.update(source, "$.a", 1, "data"), MalformedInputError);
    EXPECT_THROW(engine.remove(source, "$.a", "data"), MalformedInputError);
    EXPECT_EQ(source.writes, 0);
}

TEST(EngineErrors, invalid_field_type) {
    auto engine = Engine{};
    auto source = MemorySource{};
    source.fields.emplace("data", FieldContent{Json(12345)});
    EXPECT_THROW(engine.resolve(source, "$.a", Json{}, "data"), InvalidFieldTypeError);
    EXPECT_THROW(engine.update(source, "$.a", 1, "data"), InvalidFieldTypeError);
}

TEST(EngineErrors, path_syntax) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    EXPECT_THROW(engine.resolve(source, "a.b", Json{}, "data"), PathSyntaxError);
    EXPECT_THROW(engine.update(source, "$[?(@.x)]", 1, "data"), PathSyntaxError);
}

TEST(EngineErrors, typed_errors_are_one_family) {
    auto engine = Engine{};
    auto source = source_with("[oops");
    try {
        engine.resolve(source, "$.a", Json{}, "data");
        FAIL() << "expected an Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::malformed_input);
    }
}

TEST(EngineErrors, foreign_read_failure_becomes_execution_error) {
    auto engine = Engine{};
    auto source = ThrowingSource{};
    try {
        engine.resolve(source, "$.a", Json{}, "data");
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(std::string{e.what()}, "storage offline");
    }
}

TEST(EngineErrors, foreign_write_failure_becomes_execution_error) {
    auto engine = Engine{};
    auto source = RejectingWriteSource{};
    EXPECT_THROW(engine.update(source, "$.a", 1, "data"), ExecutionError);
}

TEST(EngineErrors, data_failure_is_logged_once_with_context) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    auto log = FailureLog{};
    EXPECT_THROW(engine.update(source, "$.a[", 1, "data"), PathSyntaxError);
    ASSERT_EQ(log.lines.size(), 1u);
    EXPECT_EQ(log.severities.front(), google::GLOG_WARNING);
    const auto& line = log.lines.front();
    EXPECT_NE(line.find("op=update"), std::string::npos) << line;
    EXPECT_NE(line.find("field=data"), std::string::npos) << line;
    EXPECT_NE(line.find("path=$.a["), std::string::npos) << line;
    EXPECT_NE(line.find("kind=path_syntax"), std::string::npos) << line;
}

TEST(EngineErrors, foreign_failure_is_logged_once) {
    auto engine = Engine{};
    auto source = ThrowingSource{};
    auto log = FailureLog{};
    EXPECT_THROW(engine.resolve(source, "$.a", Json{}, "data"), ExecutionError);
    ASSERT_EQ(log.lines.size(), 1u);
    EXPECT_NE(log.lines.front().find("op=resolve"), std::string::npos) << log.lines.front();
    EXPECT_NE(log.lines.front().find("kind=execution_error"), std::string::npos)
        << log.lines.front();
}

TEST(EngineErrors, argument_errors_are_not_logged) {
    auto engine = Engine{};
    auto source = source_with("{ not json");
    auto log = FailureLog{};
    EXPECT_THROW(engine.update(source, "   ", 1, "data"), InvalidArgumentError);
    EXPECT_THROW(engine.remove(source, "", "data"), InvalidArgumentError);
    EXPECT_THROW(engine.resolve(source, "$.a", Json{}, ""), InvalidArgumentError);
    EXPECT_THROW(engine.locate(source, "$.a", ""), InvalidArgumentError);
    EXPECT_TRUE(log.lines.empty());
}

TEST(EngineErrors, successful_operations_are_not_logged) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    auto log = FailureLog{};
    engine.update(source, "$.b", 2, "data");
    engine.remove(source, "$.a", "data");
    EXPECT_EQ(engine.resolve(source, "$.b", Json{}, "data"), 2);
    EXPECT_TRUE(log.lines.empty());
}

// =============================================================================
// Path cache
// =============================================================================

TEST(EngineCache, compiled_paths_are_reused) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    engine.resolve(source, "$.a", Json{}, "data");
    engine.resolve(source, "$.a", Json{}, "data");
    engine.update(source, "$.a", 2, "data");
    EXPECT_EQ(engine.path_cache().size(), 1u);
    EXPECT_EQ(engine.compile_path("$.a").get(), engine.compile_path("$.a").get());
}

TEST(EngineCache, trimmed_path_shares_entry) {
    auto engine = Engine{};
    auto source = source_with(R"({"a": 1})");
    engine.resolve(source, "$.a", Json{}, "data");
    engine.resolve(source, "  $.a  ", Json{}, "data");
    EXPECT_EQ(engine.path_cache().size(), 1u);
}

TEST(EngineCache, capacity_from_options) {
    auto engine = Engine{EngineOptions{.cache_capacity = 0}};
    auto source = source_with(R"({"a": 1})");
    EXPECT_EQ(engine.resolve(source, "$.a", Json{}, "data"), 1);
    EXPECT_EQ(engine.path_cache().size(), 0u);
    EXPECT_EQ(engine.options().cache_capacity, 0u);
}

TEST(EngineConfig, defaults) {
    auto options = EngineOptions{};
    EXPECT_EQ(options.cache_capacity, 256u);
    EXPECT_EQ(options.indent, 4);
    EXPECT_EQ(options.max_synthesized_index, 65536u);
    EXPECT_EQ(options.default_field, "json_payload");
}
