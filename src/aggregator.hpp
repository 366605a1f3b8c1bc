#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "entry.hpp"
#include "lru_counter.hpp"

using CountMap = std::unordered_map<std::string, uint64_t>;

// one year of hourly buckets
constexpr size_t kMaxStatsHours = 24 * 365;

// Merged counters over a window of hours.
struct StatsTop {
    CountMap domains;   // top requested domains
    CountMap blocked;   // top blocked domains
    CountMap clients;   // top DNS clients
};

// Running totals of everything counted since start (or the last clear).
struct StatsCounters {
    uint64_t queries = 0;
    uint64_t blocked = 0;
    uint64_t ignored = 0;
    double avg_elapsed_ms = 0.0;
};

// Counters for one hour of history.
struct HourBucket {
    explicit HourBucket(size_t top_size) : domains(top_size), blocked(top_size), clients(top_size) {}

    mutable std::shared_mutex mu;
    LruCounter domains;
    LruCounter blocked;
    LruCounter clients;
};

// Ring of hourly buckets, newest first. hours_mu_ guards the ring itself and is
// always taken before a bucket's mu.
class TopStatsAggregator {
    size_t limit_;
    size_t top_size_;
    mutable std::shared_mutex hours_mu_;
    std::deque<std::unique_ptr<HourBucket>> hours_;

    std::atomic<uint64_t> queries_{0}, blocked_{0}, ignored_{0}, elapsed_ns_{0};

public:
    explicit TopStatsAggregator(size_t limit_hours = 24, size_t top_size = 500);

    TopStatsAggregator(const TopStatsAggregator&) = delete;
    TopStatsAggregator& operator=(const TopStatsAggregator&) = delete;

    // Counts the entry into bucket floor((now - entry.time) / 1h). Entries that
    // are too old, in the future, or carry no query name are ignored.
    // Returns true if counted.
    bool record_entry(const LogEntry &entry, std::chrono::system_clock::time_point now);

    // New empty bucket in front, oldest dropped.
    void rotate_hour();

    // Grows with empty (oldest) buckets or drops the oldest ones.
    // Throws ValidationError for 0.
    void resize(size_t new_limit);

    // Sums buckets [0, min(hour_offset, limit)).
    StatsTop top_stats(size_t hour_offset) const noexcept;

    StatsCounters counters() const noexcept;
    size_t limit() const;
    size_t bucket_count() const;
    size_t top_size() const noexcept { return top_size_; }

    // Empties every bucket and resets the running totals.
    void clear();

    // Highest K keys of a merged map, descending by count (ties by key).
    static std::vector<std::pair<std::string, uint64_t>> top_k(const CountMap &m, size_t K);
};
