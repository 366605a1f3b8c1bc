#include "lru_counter.hpp"

LruCounter::LruCounter(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

uint64_t LruCounter::increment(const std::string &key, uint64_t n) {
    auto it = map_.find(key);
    if (it != map_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second.pos);
        it->second.count += n;
        return it->second.count;
    }

    if (map_.size() >= capacity_) {
        map_.erase(lru_.back());
        lru_.pop_back();
        ++evictions_;
    }
    lru_.push_front(key);
    map_.emplace(key, Slot{n, lru_.begin()});
    return n;
}

uint64_t LruCounter::get(const std::string &key) const {
    auto it = map_.find(key);
    return it == map_.end() ? 0 : it->second.count;
}

void LruCounter::for_each(const std::function<void(const std::string &, uint64_t)> &fn) const {
    for (const auto &p : map_) fn(p.first, p.second.count);
}

void LruCounter::clear() {
    map_.clear();
    lru_.clear();
}
