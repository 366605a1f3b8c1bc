#include "recent_cache.hpp"
#include <mutex>

RecentCache::RecentCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void RecentCache::trim_locked() {
    while (entries_.size() > capacity_) entries_.pop_front();
}

void RecentCache::append(const LogEntry &e) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    entries_.push_back(e);
    trim_locked();
}

void RecentCache::load(const std::vector<LogEntry> &entries) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    // only the newest `capacity_` can survive
    size_t skip = entries.size() > capacity_ ? entries.size() - capacity_ : 0;
    for (size_t i = skip; i < entries.size(); ++i) entries_.push_back(entries[i]);
    trim_locked();
}

std::vector<LogEntry> RecentCache::snapshot() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

void RecentCache::clear() {
    std::unique_lock<std::shared_mutex> lk(mu_);
    entries_.clear();
}

size_t RecentCache::size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return entries_.size();
}
