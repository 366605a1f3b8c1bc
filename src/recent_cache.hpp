#pragma once
#include <deque>
#include <shared_mutex>
#include <vector>
#include "entry.hpp"

// Most recent `capacity` entries in arrival order. Thread-safe.
class RecentCache {
public:
    explicit RecentCache(size_t capacity);

    RecentCache(const RecentCache&) = delete;
    RecentCache& operator=(const RecentCache&) = delete;

    void append(const LogEntry &e);

    // Bulk load, oldest first. Same trimming as append.
    void load(const std::vector<LogEntry> &entries);

    // Copy, oldest first.
    std::vector<LogEntry> snapshot() const;

    void clear();
    size_t size() const;
    size_t capacity() const noexcept { return capacity_; }

private:
    void trim_locked();

    size_t capacity_;
    mutable std::shared_mutex mu_;
    std::deque<LogEntry> entries_;
};
