#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace conduit::mediator {

// Insert-only associative cache safe for concurrent use.
// Readers take a shared lock; inserts double-check under an exclusive lock
// so the first writer for a key wins.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ConcurrentMap {
public:
    // Stored value for `key`, computing it with `factory(key)` when absent.
    // The factory runs outside any lock and may be called by several threads
    // for the same key; only one result is kept.
    template <typename Factory>
    Value get_or_add(const Key& key, Factory&& factory) {
        // --- Fast path: lookup with shared lock ---
        {
            std::shared_lock<std::shared_mutex> read_lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end()) {
                return it->second;
            }
        }

        Value created = factory(key);

        // --- Slow path: exclusive lock ---
        std::unique_lock<std::shared_mutex> write_lock(mutex_);
        return map_.emplace(key, std::move(created)).first->second;
    }

    std::optional<Value> find(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, Value, Hash> map_;
};

} // namespace conduit::mediator
