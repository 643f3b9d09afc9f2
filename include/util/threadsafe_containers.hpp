// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lansync {
namespace util {

/**
 * ThreadSafeMap - mutex-guarded std::unordered_map (or std::map)
 *
 * Usage:
 *   ThreadSafeMap<uint64_t, ConnectionHandlerPtr> connections_;
 *   connections_.Insert(id, handler);
 *   connections_.Erase(id);
 *
 *   // Iterate a copy, never the live map
 *   for (const auto& [id, handler] : connections_.GetAll()) { ... }
 *
 * - Every operation takes the lock exactly once
 * - No iterator API, so no lock can outlive a call
 */
template <typename Key, typename Value,
          template<typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    // Non-copyable and non-movable (mutex cannot be moved)
    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    /**
     * Insert or update a key-value pair
     * Returns true if inserted, false if updated
     */
    bool Insert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.insert_or_assign(key, value);
        return inserted;
    }

    /**
     * Remove entry by key
     * Returns true if removed, false if key didn't exist
     */
    bool Erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    // Snapshot of all entries (safe to iterate without lock)
    std::vector<std::pair<Key, Value>> GetAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

} // namespace util
} // namespace lansync
