/// @file mutate.hpp
/// @brief Updates with path synthesis, and tombstone deletion with compaction.
///
/// Both operations take the tree by value and return the finished tree.
/// If they throw, nothing the caller holds has been modified.

#pragma once

#include <fieldpath-cpp/path.hpp>
#include <fieldpath-cpp/value.hpp>

#include <cstddef>

namespace fieldpath_cpp {

/// Bounds on structure created by apply_update().
struct MutationLimits {
    /// Largest array index synthesis may pad up to.
    std::size_t max_synthesized_index = 65536;
};

/// A fresh root for an empty field, typed by the first selector:
/// an array if the expression starts with an index, an object otherwise.
auto make_root(const PathExpression& expr) -> Json;

/// Set `value` at every location `expr` matches in `root`.
///
/// - One or more matches: every match is overwritten with the same value.
///   Where one match contains another, the outer one wins.
/// - No matches, definite expression (fields and indices only): the
///   missing objects/arrays are created. An index step pads its array
///   with empty objects; an intermediate member is an array if the next
///   step is an index and an object otherwise.
/// - No matches, `<definite prefix>[*].field`: the field is set on every
///   object element of the array the prefix resolves to.
///
/// @code
/// apply_update(compile("$.x.y"), Json::object(), 5);  // {"x": {"y": 5}}
/// @endcode
///
/// @throws UnsupportedOperationError for negative-index creation, indices
///   beyond `limits`, or an existing non-container value in the way.
/// @throws UnsupportedPatternError for any other zero-match wildcard,
///   recursive-descent, slice or filter expression.
auto apply_update(const PathExpression& expr, Json root, const Json& value,
                  const MutationLimits& limits = {}) -> Json;

/// Remove every location `expr` matches in `root`.
///
/// Matches are replaced by an internal tombstone, then the whole tree is
/// compacted: tombstoned object members are erased (survivors keep their
/// order) and tombstoned array elements are removed, closing the gaps.
/// No matches is a successful no-op.
///
/// @throws UnsupportedOperationError if `expr` selects the root itself.
auto apply_delete(const PathExpression& expr, Json root) -> Json;

/// Strip tombstones from every object and array in `node`, recursively.
void compact(Json& node);

/// The transient deletion marker. Never present in a returned tree.
auto tombstone() -> Json;

}  // namespace fieldpath_cpp
