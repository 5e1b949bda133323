// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace devicelink {
namespace util {

/**
 * ThreadSafeMap - mutex-guarded wrapper around std::unordered_map (or std::map)
 *
 * Every operation takes the lock exactly once, so each call is atomic with
 * respect to every other call on the same map. Compound decisions that must
 * not race (insert-if-absent, remove-if-still-the-same-value) are offered as
 * single operations instead of Contains() + insert pairs.
 *
 * Usage:
 *   ThreadSafeMap<NodeId, DeviceContextPtr> contexts_;
 *   if (!contexts_.TryInsert(id, ctx)) { ... lost the race ... }
 *
 *   DeviceContextPtr ctx;
 *   contexts_.Read(id, [&](const DeviceContextPtr& c) { ctx = c; });
 *
 *   contexts_.EraseIf(id, [&](const DeviceContextPtr& c) { return c == ctx; });
 *
 * Callbacks run under the lock: keep them short and never call back into the
 * same map from inside one. Use GetValues() to work on a snapshot instead.
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
     * Insert only if key doesn't exist
     * Returns true if inserted, false if key already exists (value untouched)
     */
    bool TryInsert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.try_emplace(key, value).second;
    }

    /**
     * Call reader(const Value&) under lock if key exists
     * Returns true if key exists and was read
     */
    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            reader(it->second);
            return true;
        }
        return false;
    }

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.count(key) > 0;
    }

    /**
     * Remove entry only if predicate(current value) holds
     * Returns true if removed. Absent keys are a no-op (false).
     */
    template <typename Pred>
    bool EraseIf(const Key& key, Pred&& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !predicate(it->second)) {
            return false;
        }
        map_.erase(it);
        return true;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    // Snapshot of all values (safe to iterate without lock)
    std::vector<Value> GetValues() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Value> values;
        values.reserve(map_.size());
        for (const auto& [_, value] : map_) {
            values.push_back(value);
        }
        return values;
    }

    /**
     * Remove and return every entry in one step
     * Entries inserted after the call are not part of the result.
     */
    std::vector<std::pair<Key, Value>> TakeAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::pair<Key, Value>> drained(map_.begin(), map_.end());
        map_.clear();
        return drained;
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

} // namespace util
} // namespace devicelink
