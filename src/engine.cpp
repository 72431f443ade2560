#include <fieldpath-cpp/engine.hpp>
#include <fieldpath-cpp/codec.hpp>
#include <fieldpath-cpp/error.hpp>
#include <fieldpath-cpp/query.hpp>

#include <glog/logging.h>

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace fieldpath_cpp {

namespace {

auto trim(std::string_view text) -> std::string_view {
    constexpr auto ws = std::string_view{" \t\n\r\f\v"};
    auto first = text.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

// Argument problems are the caller's, not the data's: thrown, never logged.
auto validated_path(std::string_view path, std::string_view field_name) -> std::string_view {
    auto trimmed = trim(path);
    if (trimmed.empty()) {
        throw InvalidArgumentError{"path cannot be empty or whitespace"};
    }
    if (field_name.empty()) {
        throw InvalidArgumentError{"field name cannot be empty"};
    }
    return trimmed;
}

void log_failure(std::string_view op, std::string_view path, std::string_view field,
                 const Error& error) {
    LOG(WARNING) << "fieldpath: op=" << op << " field=" << field << " path=" << path
                 << " kind=" << to_string_view(error.kind) << ": " << error.message;
}

// The single translation boundary between internal failures and what
// callers see. Typed errors pass through; anything else becomes an
// ExecutionError. Each failure is logged exactly once.
template <typename Fn>
auto guarded(std::string_view op, std::string_view path, std::string_view field, Fn&& fn)
    -> std::invoke_result_t<Fn> {
    try {
        return std::forward<Fn>(fn)();
    } catch (const Exception& e) {
        log_failure(op, path, field, e.error());
        throw;
    } catch (const Json::exception& e) {
        auto error = Error{ErrorKind::execution_error, std::string{"JSON error: "} + e.what()};
        log_failure(op, path, field, error);
        throw ExecutionError{std::move(error.message)};
    } catch (const std::exception& e) {
        auto error = Error{ErrorKind::execution_error, e.what()};
        log_failure(op, path, field, error);
        throw ExecutionError{std::move(error.message)};
    }
}

}  // anonymous namespace

Engine::Engine(EngineOptions options)
    : options_{std::move(options)},
      cache_{options_.cache_capacity} {}

auto Engine::compile_path(std::string_view path) const -> std::shared_ptr<const PathExpression> {
    return cache_.get(path);
}

auto Engine::resolve(const FieldSource& source, std::string_view path,
                     const Json& default_value, std::string_view field_name) const -> Json {
    auto p = validated_path(path, field_name);
    return guarded("resolve", p, field_name, [&]() -> Json {
        auto root = decode(source.read_field(field_name));
        if (!root) return default_value;

        auto expr = compile_path(p);
        auto matches = evaluate(*expr, *root);
        if (matches.empty()) return default_value;
        if (matches.size() == 1) return *matches.front().value;

        auto values = Json::array();
        for (const auto& m : matches) {
            values.push_back(*m.value);
        }
        return values;
    });
}

auto Engine::update(FieldSource& source, std::string_view path, const Json& value,
                    std::string_view field_name) const -> Json {
    auto p = validated_path(path, field_name);
    return guarded("update", p, field_name, [&]() -> Json {
        auto root = decode(source.read_field(field_name));
        auto expr = compile_path(p);
        auto base = root ? std::move(*root) : make_root(*expr);

        auto limits = MutationLimits{.max_synthesized_index = options_.max_synthesized_index};
        auto result = apply_update(*expr, std::move(base), value, limits);
        source.write_field(field_name, encode(result, options_.indent));
        return result;
    });
}

auto Engine::remove(FieldSource& source, std::string_view path,
                    std::string_view field_name) const -> Json {
    auto p = validated_path(path, field_name);
    return guarded("delete", p, field_name, [&]() -> Json {
        auto root = decode(source.read_field(field_name));
        auto expr = compile_path(p);
        if (!root) return Json{};

        if (evaluate(*expr, *root).empty()) return std::move(*root);

        auto result = apply_delete(*expr, std::move(*root));
        source.write_field(field_name, encode(result, options_.indent));
        return result;
    });
}

auto Engine::locate(const FieldSource& source, std::string_view path,
                    std::string_view field_name) const -> std::vector<std::string> {
    auto p = validated_path(path, field_name);
    return guarded("locate", p, field_name, [&]() -> std::vector<std::string> {
        auto root = decode(source.read_field(field_name));
        auto expr = compile_path(p);
        if (!root) return {};

        auto pointers = std::vector<std::string>{};
        for (const auto& m : evaluate(*expr, *root)) {
            pointers.push_back(m.pointer());
        }
        return pointers;
    });
}

auto Engine::count(const FieldSource& source, std::string_view path,
                   std::string_view field_name) const -> std::size_t {
    auto p = validated_path(path, field_name);
    return guarded("count", p, field_name, [&]() -> std::size_t {
        auto root = decode(source.read_field(field_name));
        auto expr = compile_path(p);
        if (!root) return 0;
        return evaluate(*expr, *root).size();
    });
}

}  // namespace fieldpath_cpp
