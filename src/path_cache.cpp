#include <fieldpath-cpp/path_cache.hpp>

#include <glog/logging.h>

#include <mutex>

namespace fieldpath_cpp {

auto PathCache::get(std::string_view path) -> std::shared_ptr<const PathExpression> {
    if (capacity_ == 0) {
        return std::make_shared<const PathExpression>(compile(path));
    }

    auto key = std::string{path};
    {
        auto lock = std::shared_lock{mutex_};
        if (auto it = entries_.find(key); it != entries_.end()) {
            return it->second;
        }
    }

    // Compile outside the lock; a concurrent miss on the same key just
    // compiles twice and the first insert wins.
    auto compiled = std::make_shared<const PathExpression>(compile(path));

    auto lock = std::unique_lock{mutex_};
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    if (entries_.size() >= capacity_) {
        VLOG(2) << "fieldpath: path cache full (" << entries_.size() << " entries), resetting";
        entries_.clear();
    }
    entries_.emplace(std::move(key), compiled);
    return compiled;
}

auto PathCache::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return entries_.size();
}

void PathCache::clear() {
    auto lock = std::unique_lock{mutex_};
    entries_.clear();
}

}  // namespace fieldpath_cpp
