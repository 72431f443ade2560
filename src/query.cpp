#include <fieldpath-cpp/query.hpp>
#include <fieldpath-cpp/error.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace fieldpath_cpp {

namespace {

/// Escape a segment for RFC 6901: ~ -> ~0, / -> ~1
auto escape_pointer_segment(const std::string& segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

// One located node. Nodes address their parent by index into the table;
// a full path is rebuilt only for the final matches.
struct Node {
    const Json* value = nullptr;
    std::size_t parent = 0;
    Prop prop;
};

constexpr auto no_parent = static_cast<std::size_t>(-1);

class NodeTable {
public:
    explicit NodeTable(const Json& root) {
        nodes_.push_back(Node{&root, no_parent, Prop{}});
    }

    auto add(std::size_t parent, Prop prop, const Json& value) -> std::size_t {
        nodes_.push_back(Node{&value, parent, std::move(prop)});
        return nodes_.size() - 1;
    }

    auto value(std::size_t id) const -> const Json& { return *nodes_[id].value; }

    auto to_match(std::size_t id) const -> Match {
        auto m = Match{{}, nodes_[id].value};
        for (auto at = id; nodes_[at].parent != no_parent; at = nodes_[at].parent) {
            m.path.push_back(nodes_[at].prop);
        }
        std::reverse(m.path.begin(), m.path.end());
        return m;
    }

private:
    std::vector<Node> nodes_;
};

// Normalize a possibly negative index against an array length.
auto normalize(std::int64_t index, std::size_t len) -> std::int64_t {
    return index < 0 ? index + static_cast<std::int64_t>(len) : index;
}

// Pre-order walk of the subtree under `id`, the node itself first.
void collect_descendants(NodeTable& table, std::size_t id, std::vector<std::size_t>& out) {
    auto pending = std::vector<std::size_t>{id};
    while (!pending.empty()) {
        auto at = pending.back();
        pending.pop_back();
        out.push_back(at);

        const auto& v = table.value(at);
        auto first = pending.size();
        if (v.is_object()) {
            for (auto it = v.begin(); it != v.end(); ++it) {
                pending.push_back(table.add(at, Prop{it.key()}, it.value()));
            }
        } else if (v.is_array()) {
            for (std::size_t i = 0; i < v.size(); ++i) {
                pending.push_back(table.add(at, Prop{i}, v[i]));
            }
        }
        // Leftmost child on top of the stack.
        std::reverse(pending.begin() + static_cast<std::ptrdiff_t>(first), pending.end());
    }
}

void apply_selector(const Selector& selector, NodeTable& table, std::size_t id,
                    std::vector<std::size_t>& out) {
    const auto& v = table.value(id);
    std::visit(overload{
        [&](const FieldSelector& s) {
            if (!v.is_object()) return;
            if (auto it = v.find(s.name); it != v.end()) {
                out.push_back(table.add(id, Prop{s.name}, *it));
            }
        },
        [&](const IndexSelector& s) {
            if (!v.is_array()) return;
            auto idx = normalize(s.index, v.size());
            if (idx < 0 || idx >= static_cast<std::int64_t>(v.size())) return;
            auto i = static_cast<std::size_t>(idx);
            out.push_back(table.add(id, Prop{i}, v[i]));
        },
        [&](const WildcardSelector&) {
            if (v.is_object()) {
                for (auto it = v.begin(); it != v.end(); ++it) {
                    out.push_back(table.add(id, Prop{it.key()}, it.value()));
                }
            } else if (v.is_array()) {
                for (std::size_t i = 0; i < v.size(); ++i) {
                    out.push_back(table.add(id, Prop{i}, v[i]));
                }
            }
        },
        [&](const RecursiveDescentSelector&) {
            collect_descendants(table, id, out);
        },
        [&](const SliceSelector& s) {
            if (!v.is_array()) return;
            auto len = static_cast<std::int64_t>(v.size());
            auto clamp = [len](std::int64_t i) {
                return std::clamp(i < 0 ? i + len : i, std::int64_t{0}, len);
            };
            auto start = clamp(s.start.value_or(0));
            auto stop = clamp(s.stop.value_or(len));
            for (auto i = start; i < stop; ++i) {
                auto idx = static_cast<std::size_t>(i);
                out.push_back(table.add(id, Prop{idx}, v[idx]));
            }
        },
        [&](const FilterSelector& s) {
            if (!v.is_array()) return;
            for (std::size_t i = 0; i < v.size(); ++i) {
                const auto& element = v[i];
                if (!element.is_object()) continue;
                auto it = element.find(s.field);
                if (it == element.end()) continue;
                if (compare(*it, s.op, s.literal)) {
                    out.push_back(table.add(id, Prop{i}, element));
                }
            }
        },
    }, selector);
}

// Nested recursive descents can reach the same node more than once; keep
// the first (document-order) occurrence only.
void drop_duplicates(const NodeTable& table, std::vector<std::size_t>& ids) {
    auto seen = std::unordered_set<const Json*>{};
    auto end = std::remove_if(ids.begin(), ids.end(), [&](std::size_t id) {
        return !seen.insert(&table.value(id)).second;
    });
    ids.erase(end, ids.end());
}

}  // anonymous namespace

auto Match::pointer() const -> std::string {
    auto result = std::string{};
    for (const auto& prop : path) {
        result += "/";
        std::visit(overload{
            [&](const std::string& key) { result += escape_pointer_segment(key); },
            [&](std::size_t index) { result += std::to_string(index); },
        }, prop);
    }
    return result;
}

auto evaluate(const PathExpression& expr, const Json& root) -> std::vector<Match> {
    auto table = NodeTable{root};
    auto current = std::vector<std::size_t>{0};
    auto descended = false;
    for (const auto& selector : expr.selectors()) {
        auto next = std::vector<std::size_t>{};
        for (auto id : current) {
            apply_selector(selector, table, id, next);
        }
        if (std::holds_alternative<RecursiveDescentSelector>(selector)) {
            descended = true;
        }
        if (descended) drop_duplicates(table, next);
        current = std::move(next);
        if (current.empty()) break;
    }

    auto matches = std::vector<Match>{};
    matches.reserve(current.size());
    for (auto id : current) {
        matches.push_back(table.to_match(id));
    }
    return matches;
}

auto compare(const Json& lhs, CompareOp op, const Json& rhs) -> bool {
    auto orderable = (lhs.is_number() && rhs.is_number()) ||
                     (lhs.is_string() && rhs.is_string());
    auto same_type = orderable || lhs.type() == rhs.type();

    switch (op) {
        case CompareOp::eq: return same_type && lhs == rhs;
        case CompareOp::ne: return !same_type || lhs != rhs;
        case CompareOp::lt: return orderable && lhs < rhs;
        case CompareOp::le: return orderable && lhs <= rhs;
        case CompareOp::gt: return orderable && lhs > rhs;
        case CompareOp::ge: return orderable && lhs >= rhs;
    }
    return false;
}

auto node_at(Json& root, const std::vector<Prop>& path) -> Json& {
    auto* node = &root;
    for (const auto& prop : path) {
        node = std::visit(overload{
            [&](const std::string& key) -> Json* {
                if (!node->is_object()) return nullptr;
                auto it = node->find(key);
                return it == node->end() ? nullptr : &*it;
            },
            [&](std::size_t index) -> Json* {
                if (!node->is_array() || index >= node->size()) return nullptr;
                return &(*node)[index];
            },
        }, prop);
        if (node == nullptr) {
            throw ExecutionError{"match location no longer exists in the document"};
        }
    }
    return *node;
}

}  // namespace fieldpath_cpp
