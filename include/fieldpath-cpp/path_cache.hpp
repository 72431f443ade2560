/// @file path_cache.hpp
/// @brief Thread-safe cache of compiled path expressions keyed by source text.

#pragma once

#include <fieldpath-cpp/path.hpp>

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fieldpath_cpp {

/// Caches compiled PathExpressions so hot paths are parsed once.
///
/// Lookups take a shared lock; inserts take an exclusive lock. When the
/// cache is full it is reset before the new entry is inserted. A capacity
/// of 0 disables caching entirely (every lookup compiles).
class PathCache {
public:
    explicit PathCache(std::size_t capacity = 256) : capacity_{capacity} {}

    PathCache(const PathCache&) = delete;
    auto operator=(const PathCache&) -> PathCache& = delete;

    /// Return the compiled expression for `path`, compiling it on a miss.
    /// Compile failures are not cached.
    /// @throws PathSyntaxError if `path` does not compile.
    auto get(std::string_view path) -> std::shared_ptr<const PathExpression>;

    /// Number of cached expressions.
    auto size() const -> std::size_t;

    auto capacity() const -> std::size_t { return capacity_; }

    /// Drop every cached expression.
    void clear();

private:
    std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const PathExpression>> entries_;
};

}  // namespace fieldpath_cpp
