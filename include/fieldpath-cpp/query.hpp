/// @file query.hpp
/// @brief Query evaluation: locating the nodes a path expression selects.

#pragma once

#include <fieldpath-cpp/path.hpp>
#include <fieldpath-cpp/value.hpp>

#include <string>
#include <vector>

namespace fieldpath_cpp {

/// A located value plus the address needed to overwrite or remove it.
///
/// `path` is the sequence of object keys / array indices leading from the
/// root to the value (empty for the root itself). `value` points into the
/// tree passed to evaluate() and is valid only while that tree is unchanged.
struct Match {
    std::vector<Prop> path;
    const Json* value = nullptr;

    /// The location as an RFC 6901 JSON Pointer ("" for the root).
    auto pointer() const -> std::string;
};

/// Evaluate a compiled expression against a tree.
///
/// Matches come back in document order: siblings left to right, and for
/// recursive descent a node before its descendants. Nothing matching is
/// not an error; the result is simply empty. Never modifies `root`.
auto evaluate(const PathExpression& expr, const Json& root) -> std::vector<Match>;

/// Compare a member value against a filter literal.
///
/// Numbers compare numerically and strings bytewise; other equal-typed
/// values support only == and !=. Values of different types are never
/// equal and never ordered.
auto compare(const Json& lhs, CompareOp op, const Json& rhs) -> bool;

/// Follow `path` from `root` to a mutable node.
/// @throws ExecutionError if the path does not exist in `root`.
auto node_at(Json& root, const std::vector<Prop>& path) -> Json&;

}  // namespace fieldpath_cpp
