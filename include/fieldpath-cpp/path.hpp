/// @file path.hpp
/// @brief Path expressions: selectors, compiled expressions, and the compiler.
///
/// Supported grammar:
/// @code
///   $                       root
///   .name  .'name'  ['name']  field access
///   [i]                     index (signed; -1 is the last element)
///   [*]  .*                 wildcard
///   ..name  ..*  ..[...]    recursive descent
///   [start:stop]            slice (either bound optional, no step)
///   [?(@.field OP literal)] filter, OP one of == != < <= > >=
/// @endcode

#pragma once

#include <fieldpath-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fieldpath_cpp {

/// Object member access by name.
struct FieldSelector {
    std::string name;

    auto operator==(const FieldSelector&) const -> bool = default;
};

/// Array element access; negative values count from the end.
struct IndexSelector {
    std::int64_t index{0};

    auto operator==(const IndexSelector&) const -> bool = default;
};

/// All children of the current node.
struct WildcardSelector {
    auto operator==(const WildcardSelector&) const -> bool = default;
};

/// The current node and all of its descendants, in document order.
struct RecursiveDescentSelector {
    auto operator==(const RecursiveDescentSelector&) const -> bool = default;
};

/// A contiguous array sub-range with Python slice clamping, no step.
struct SliceSelector {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> stop;

    auto operator==(const SliceSelector&) const -> bool = default;
};

/// Comparison operators usable in a filter.
enum class CompareOp : std::uint8_t { eq, ne, lt, le, gt, ge };

/// Convert a CompareOp to its source token.
constexpr auto to_string_view(CompareOp op) noexcept -> std::string_view {
    switch (op) {
        case CompareOp::eq: return "==";
        case CompareOp::ne: return "!=";
        case CompareOp::lt: return "<";
        case CompareOp::le: return "<=";
        case CompareOp::gt: return ">";
        case CompareOp::ge: return ">=";
    }
    return "?";
}

/// Keeps array elements whose member `field` compares to `literal`.
struct FilterSelector {
    std::string field;
    CompareOp op{CompareOp::eq};
    Json literal;

    auto operator==(const FilterSelector& other) const -> bool {
        return field == other.field && op == other.op && literal == other.literal;
    }
};

/// One step of a compiled path expression.
using Selector = std::variant<
    FieldSelector,
    IndexSelector,
    WildcardSelector,
    RecursiveDescentSelector,
    SliceSelector,
    FilterSelector
>;

/// Check if a selector addresses at most one child (Field or Index).
constexpr auto is_definite(const Selector& s) -> bool {
    return std::holds_alternative<FieldSelector>(s) ||
           std::holds_alternative<IndexSelector>(s);
}

/// A compiled path expression: an ordered sequence of selectors.
///
/// Immutable once compiled; evaluating it has no side effects and the
/// same expression may be used against any number of trees and threads.
///
/// @code
/// auto expr = compile("$.orders[*].id");
/// auto matches = evaluate(expr, doc);
/// @endcode
class PathExpression {
public:
    PathExpression() = default;
    PathExpression(std::string source, std::vector<Selector> selectors)
        : source_{std::move(source)}, selectors_{std::move(selectors)} {}

    auto selectors() const -> const std::vector<Selector>& { return selectors_; }

    /// The text this expression was compiled from.
    auto source() const -> const std::string& { return source_; }

    /// Normalized bracket notation, e.g. `$['a'][0][*]`.
    auto to_string() const -> std::string;

    /// True if every selector is a Field or an Index.
    auto is_definite() const -> bool;

    /// True for the bare root expression `$`.
    auto empty() const -> bool { return selectors_.empty(); }

    auto size() const -> std::size_t { return selectors_.size(); }

    auto operator==(const PathExpression& other) const -> bool {
        return selectors_ == other.selectors_;
    }

private:
    std::string source_;
    std::vector<Selector> selectors_;
};

/// Compile a path expression.
/// @throws PathSyntaxError on invalid grammar; the message names the position.
auto compile(std::string_view path) -> PathExpression;

}  // namespace fieldpath_cpp
