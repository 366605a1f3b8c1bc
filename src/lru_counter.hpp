#pragma once
#include <cstdint>
#include <functional>
#include <list>
#include <string>
#include <unordered_map>

// Bounded key -> count map. When a new key would exceed capacity the least
// recently incremented key is dropped with its count.
// Not synchronized; HourBucket guards it.
class LruCounter {
public:
    explicit LruCounter(size_t capacity = 500);

    // Adds `n` to key's count (inserting it at 0 if absent); returns the new count.
    uint64_t increment(const std::string &key, uint64_t n = 1);

    // 0 if absent. Does not touch recency.
    uint64_t get(const std::string &key) const;

    void for_each(const std::function<void(const std::string &, uint64_t)> &fn) const;

    size_t size() const noexcept { return map_.size(); }
    size_t capacity() const noexcept { return capacity_; }
    uint64_t evictions() const noexcept { return evictions_; }
    void clear();

private:
    using LRUList = std::list<std::string>;
    struct Slot {
        uint64_t count;
        LRUList::iterator pos;
    };

    size_t capacity_;
    LRUList lru_;   // front = most recently used
    std::unordered_map<std::string, Slot> map_;
    uint64_t evictions_ = 0;
};
