// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace draftops {
namespace util {

/**
 * ThreadSafeMap - mutex-guarded unordered_map
 *
 * Every operation takes the lock once; there is no iterator API, so a lock
 * never outlives a call. Read() hands the value to a callback under the lock
 * to avoid copying large values.
 *
 * Usage:
 *   ThreadSafeMap<std::string, PlayerInfo> cache_;
 *   cache_.Insert(id, info);
 *   auto info = cache_.Get(id);
 */
template <typename Key, typename Value>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    // Insert or overwrite; returns true if the key was new
    bool Insert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.insert_or_assign(key, value);
        return inserted;
    }

    std::optional<Value> Get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Calls reader(const Value&) under lock; false if key is absent
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

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.clear();
    }

    // Copy of all entries, safe to walk without the lock
    std::vector<std::pair<Key, Value>> GetAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, Value> map_;
};

/**
 * ThreadSafeSet - mutex-guarded unordered_set
 */
template <typename T>
class ThreadSafeSet {
public:
    ThreadSafeSet() = default;

    ThreadSafeSet(const ThreadSafeSet&) = delete;
    ThreadSafeSet& operator=(const ThreadSafeSet&) = delete;
    ThreadSafeSet(ThreadSafeSet&&) = delete;
    ThreadSafeSet& operator=(ThreadSafeSet&&) = delete;

    // Returns false if already present
    bool Insert(const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return set_.insert(value).second;
    }

    bool Contains(const T& value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return set_.count(value) > 0;
    }

    bool Erase(const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return set_.erase(value) > 0;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return set_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        set_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_set<T> set_;
};

} // namespace util
} // namespace draftops
