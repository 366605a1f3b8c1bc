#include "aggregator.hpp"
#include "dns_question.hpp"
#include "errors.hpp"
#include "util_log.hpp"

#include <algorithm>
#include <mutex>

// defensive limits
static const size_t MAX_TOPK = 10'000;            // cap top-k responses

TopStatsAggregator::TopStatsAggregator(size_t limit_hours, size_t top_size)
    : limit_(limit_hours ? std::min(limit_hours, kMaxStatsHours) : 24),
      top_size_(top_size ? top_size : 500)
{
    for (size_t i = 0; i < limit_; ++i) hours_.push_back(std::make_unique<HourBucket>(top_size_));

    safe_log("TopStatsAggregator ctor: limit_hours=" + std::to_string(limit_)
             + " top_size=" + std::to_string(top_size_));
}

bool TopStatsAggregator::record_entry(const LogEntry &entry, std::chrono::system_clock::time_point now) {
    auto age = now - entry.time;
    if (age < std::chrono::system_clock::duration::zero()) {
        safe_log_debug("top: entry is in the future, ignoring");
        ignored_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    // floor of elapsed hours
    auto hour = static_cast<uint64_t>(age / std::chrono::hours(1));

    auto name = extract_query_name(entry.question);
    if (!name) {
        ignored_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    std::shared_lock<std::shared_mutex> lk(hours_mu_);
    if (hour >= hours_.size()) {
        safe_log_debug("top: entry is " + std::to_string(hour) + "h old, ignoring");
        ignored_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    HourBucket &b = *hours_[static_cast<size_t>(hour)];
    {
        std::unique_lock<std::shared_mutex> blk(b.mu);
        b.domains.increment(*name);
        if (entry.result.filtered) b.blocked.increment(*name);
        if (!entry.client.empty()) b.clients.increment(entry.client);
    }

    queries_.fetch_add(1, std::memory_order_relaxed);
    if (entry.result.filtered) blocked_.fetch_add(1, std::memory_order_relaxed);
    if (entry.elapsed.count() > 0) {
        elapsed_ns_.fetch_add(static_cast<uint64_t>(entry.elapsed.count()), std::memory_order_relaxed);
    }
    return true;
}

void TopStatsAggregator::rotate_hour() {
    safe_log("Rotating hourly top");
    auto fresh = std::make_unique<HourBucket>(top_size_);
    std::unique_lock<std::shared_mutex> lk(hours_mu_);
    hours_.push_front(std::move(fresh));
    while (hours_.size() > limit_) hours_.pop_back();
}

void TopStatsAggregator::resize(size_t new_limit) {
    if (new_limit == 0 || new_limit > kMaxStatsHours) {
        throw ValidationError("stats retention must be between 1 and " + std::to_string(kMaxStatsHours)
                              + " hours, got " + std::to_string(new_limit));
    }
    std::unique_lock<std::shared_mutex> lk(hours_mu_);
    while (hours_.size() < new_limit) hours_.push_back(std::make_unique<HourBucket>(top_size_));
    while (hours_.size() > new_limit) hours_.pop_back();
    limit_ = new_limit;
    safe_log("top: retention limit set to " + std::to_string(limit_) + "h");
}

StatsTop TopStatsAggregator::top_stats(size_t hour_offset) const noexcept {
    StatsTop s;
    try {
        std::shared_lock<std::shared_mutex> lk(hours_mu_);
        size_t n = std::min(hour_offset, hours_.size());
        for (size_t h = 0; h < n; ++h) {
            const HourBucket &b = *hours_[h];
            std::shared_lock<std::shared_mutex> blk(b.mu);
            b.domains.for_each([&](const std::string &k, uint64_t v) { s.domains[k] += v; });
            b.blocked.for_each([&](const std::string &k, uint64_t v) { s.blocked[k] += v; });
            b.clients.for_each([&](const std::string &k, uint64_t v) { s.clients[k] += v; });
        }
    } catch (const std::exception &e) {
        safe_log_error(std::string("top_stats: exception: ") + e.what());
        return StatsTop{};
    }
    return s;
}

StatsCounters TopStatsAggregator::counters() const noexcept {
    StatsCounters c;
    c.queries = queries_.load();
    c.blocked = blocked_.load();
    c.ignored = ignored_.load();
    if (c.queries > 0) {
        c.avg_elapsed_ms = static_cast<double>(elapsed_ns_.load()) / static_cast<double>(c.queries) / 1e6;
    }
    return c;
}

size_t TopStatsAggregator::limit() const {
    std::shared_lock<std::shared_mutex> lk(hours_mu_);
    return limit_;
}

size_t TopStatsAggregator::bucket_count() const {
    std::shared_lock<std::shared_mutex> lk(hours_mu_);
    return hours_.size();
}

void TopStatsAggregator::clear() {
    {
        std::unique_lock<std::shared_mutex> lk(hours_mu_);
        for (auto &b : hours_) b = std::make_unique<HourBucket>(top_size_);
    }
    queries_.store(0);
    blocked_.store(0);
    ignored_.store(0);
    elapsed_ns_.store(0);
}

std::vector<std::pair<std::string, uint64_t>> TopStatsAggregator::top_k(const CountMap &m, size_t K) {
    if (K == 0) K = 10;
    if (K > MAX_TOPK) K = MAX_TOPK;

    std::vector<std::pair<std::string, uint64_t>> vec(m.begin(), m.end());
    auto cmp = [](const std::pair<std::string, uint64_t> &a, const std::pair<std::string, uint64_t> &b) {
        return a.second != b.second ? a.second > b.second : a.first < b.first;
    };
    if (vec.size() <= K) {
        std::sort(vec.begin(), vec.end(), cmp);
        return vec;
    }
    std::nth_element(vec.begin(), vec.begin() + static_cast<std::ptrdiff_t>(K), vec.end(), cmp);
    vec.resize(K);
    std::sort(vec.begin(), vec.end(), cmp);
    return vec;
}
