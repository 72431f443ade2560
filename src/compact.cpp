#include <fieldpath-cpp/mutate.hpp>
#include <fieldpath-cpp/error.hpp>
#include <fieldpath-cpp/query.hpp>

#include <algorithm>
#include <vector>

namespace fieldpath_cpp {

// A discarded value cannot come out of a parse, so it never collides with
// a genuine null in the document.
auto tombstone() -> Json {
    return Json(Json::value_t::discarded);
}

void compact(Json& node) {
    // Each container is swept before its children are queued, so the
    // queued pointers stay valid while the rest of the tree is compacted.
    auto pending = std::vector<Json*>{&node};
    while (!pending.empty()) {
        auto* current = pending.back();
        pending.pop_back();
        if (!current->is_structured()) continue;
        for (auto it = current->begin(); it != current->end();) {
            if (it->is_discarded()) {
                it = current->erase(it);
            } else {
                ++it;
            }
        }
        for (auto& child : *current) {
            if (child.is_structured()) pending.push_back(&child);
        }
    }
}

auto apply_delete(const PathExpression& expr, Json root) -> Json {
    auto matches = evaluate(expr, root);
    if (matches.empty()) return root;

    if (std::ranges::any_of(matches, [](const Match& m) { return m.path.empty(); })) {
        throw UnsupportedOperationError{"cannot delete the document root"};
    }

    for (auto it = matches.rbegin(); it != matches.rend(); ++it) {
        node_at(root, it->path) = tombstone();
    }
    compact(root);
    return root;
}

}  // namespace fieldpath_cpp
