#include "kv_cache.hpp"

#include "common/glob.hpp"

namespace hearth {
namespace external {

std::optional<std::string> InMemoryKvCache::get(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.expires_at && std::chrono::steady_clock::now() >= *it->second.expires_at) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void InMemoryKvCache::set(const std::string &key, const std::string &value, std::chrono::seconds ttl) {
    Entry entry;
    entry.value = value;
    if (ttl.count() > 0) {
        entry.expires_at = std::chrono::steady_clock::now() + ttl;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(entry);
}

bool InMemoryKvCache::remove(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

size_t InMemoryKvCache::remove_pattern(const std::string &pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (glob_match(pattern, it->first)) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryKvCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace external
}  // namespace hearth
