#include <fieldpath-cpp/mutate.hpp>
#include <fieldpath-cpp/error.hpp>
#include <fieldpath-cpp/query.hpp>

#include <glog/logging.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace fieldpath_cpp {

namespace {

auto wants_array(const Selector& next) -> bool {
    return std::holds_alternative<IndexSelector>(next);
}

// Make `slot` a container suitable for the next step. Missing members
// arrive here as null; freshly padded array elements are retyped freely.
void prepare_container(Json& slot, const Selector& next, bool fresh,
                       const std::string& where) {
    auto array = wants_array(next);
    if (fresh || slot.is_null()) {
        slot = array ? Json::array() : Json::object();
        return;
    }
    if (array && slot.is_array()) return;
    if (!array && slot.is_object()) return;
    throw UnsupportedOperationError{
        std::string{"cannot create "} + (array ? "an array element" : "a member") +
        " below existing " + slot.type_name() + " at " + where};
}

void synthesize(const PathExpression& expr, Json& root, const Json& value,
                const MutationLimits& limits) {
    const auto& selectors = expr.selectors();
    auto* node = &root;
    auto where = std::string{"$"};

    for (std::size_t i = 0; i < selectors.size(); ++i) {
        auto last = (i + 1 == selectors.size());
        node = std::visit(overload{
            [&](const FieldSelector& s) -> Json* {
                if (!node->is_object()) {
                    throw UnsupportedOperationError{
                        "cannot create member '" + s.name + "' inside " +
                        node->type_name() + " at " + where};
                }
                where += "." + s.name;
                auto& slot = (*node)[s.name];
                if (last) {
                    slot = value;
                    return &slot;
                }
                prepare_container(slot, selectors[i + 1], false, where);
                return &slot;
            },
            [&](const IndexSelector& s) -> Json* {
                if (s.index < 0) {
                    throw UnsupportedOperationError{
                        "cannot create negative index " + std::to_string(s.index) +
                        " at " + where};
                }
                if (!node->is_array()) {
                    throw UnsupportedOperationError{
                        "cannot create index " + std::to_string(s.index) + " inside " +
                        node->type_name() + " at " + where};
                }
                auto idx = static_cast<std::size_t>(s.index);
                if (idx > limits.max_synthesized_index) {
                    throw UnsupportedOperationError{
                        "index " + std::to_string(idx) + " exceeds the synthesis limit of " +
                        std::to_string(limits.max_synthesized_index)};
                }
                where += "[" + std::to_string(idx) + "]";
                auto fresh = idx >= node->size();
                while (node->size() <= idx) {
                    node->push_back(Json::object());
                }
                auto& slot = (*node)[idx];
                if (last) {
                    slot = value;
                    return &slot;
                }
                prepare_container(slot, selectors[i + 1], fresh, where);
                return &slot;
            },
            [&](const auto&) -> Json* {
                throw UnsupportedPatternError{
                    "cannot synthesize structure for '" + expr.source() + "'"};
            },
        }, selectors[i]);
    }
}

// <definite prefix>[*].field
auto is_wildcard_field_pattern(const PathExpression& expr) -> bool {
    const auto& selectors = expr.selectors();
    if (selectors.size() < 2) return false;
    auto n = selectors.size();
    if (!std::holds_alternative<FieldSelector>(selectors[n - 1])) return false;
    if (!std::holds_alternative<WildcardSelector>(selectors[n - 2])) return false;
    return std::all_of(selectors.begin(), selectors.end() - 2,
                       [](const Selector& s) { return is_definite(s); });
}

void apply_wildcard_field(const PathExpression& expr, Json& root, const Json& value) {
    const auto& selectors = expr.selectors();
    auto prefix = PathExpression{
        expr.source(), std::vector<Selector>(selectors.begin(), selectors.end() - 2)};
    const auto& field = std::get<FieldSelector>(selectors.back()).name;

    auto targets = evaluate(prefix, root);
    if (targets.size() != 1 || !targets.front().value->is_array()) {
        throw UnsupportedPatternError{
            "'" + expr.source() + "' matched nothing and its prefix " + prefix.to_string() +
            " is not an existing array"};
    }

    auto& array = node_at(root, targets.front().path);
    auto updated = std::size_t{0};
    for (auto& element : array) {
        if (!element.is_object()) continue;
        element[field] = value;
        ++updated;
    }
    VLOG(1) << "fieldpath: set '" << field << "' on " << updated << " of " << array.size()
            << " elements of " << prefix.to_string();
}

}  // anonymous namespace

auto make_root(const PathExpression& expr) -> Json {
    if (!expr.empty() && std::holds_alternative<IndexSelector>(expr.selectors().front())) {
        return Json::array();
    }
    return Json::object();
}

auto apply_update(const PathExpression& expr, Json root, const Json& value,
                  const MutationLimits& limits) -> Json {
    auto matches = evaluate(expr, root);

    if (!matches.empty()) {
        // Reverse document order: descendants are written before the
        // ancestors that replace them, and earlier paths stay valid.
        for (auto it = matches.rbegin(); it != matches.rend(); ++it) {
            node_at(root, it->path) = value;
        }
        return root;
    }

    if (expr.is_definite()) {
        synthesize(expr, root, value, limits);
        VLOG(1) << "fieldpath: synthesized missing structure for " << expr.to_string();
        return root;
    }

    if (is_wildcard_field_pattern(expr)) {
        apply_wildcard_field(expr, root, value);
        return root;
    }

    throw UnsupportedPatternError{
        "'" + expr.source() + "' matched nothing and cannot be created"};
}

}  // namespace fieldpath_cpp
