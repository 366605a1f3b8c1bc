#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include "aggregator.hpp"
#include "entry.hpp"
#include "log_store.hpp"
#include "periodic_task.hpp"
#include "recent_cache.hpp"
#include "settings.hpp"

enum class QueryLogState { Uninitialized, Running, Stopped };

enum class IngestResult {
    Accepted,
    Disabled,          // logging switched off by the operator
    NotRunning,        // start() not called yet, or already stopped
    MissingQuestion,   // zero-length question payload
    BadQuestion,       // question does not parse to a single query name
};

const char *ingest_result_name(IngestResult r) noexcept;

// Single entry point for completed queries. Feeds the recent cache, the
// pending write buffer and the hourly top stats; owns the background tasks.
class QueryLog {
public:
    // `file` lets several logs share one physical target; by default a
    // private handle for cfg.log_file is created.
    explicit QueryLog(QueryLogConfig cfg, std::shared_ptr<LogFileHandle> file = nullptr);
    ~QueryLog();

    QueryLog(const QueryLog&) = delete;
    QueryLog& operator=(const QueryLog&) = delete;

    // Replays the log files into the cache and the top stats, then Running.
    // Replay failures are logged and leave the history empty.
    void start();

    // Hourly bucket rotation, log rotation every interval and buffer flush.
    void start_background();

    // Stops background tasks, flushes everything pending, then Stopped.
    void stop();

    IngestResult ingest(const LogEntry &e);

    // Writes the pending buffer if it reached buffer_size, or always when
    // `full`. On failure the entries stay buffered and the error is rethrown.
    void flush(bool full);

    void rotate_log();
    void rotate_hour();

    // Throws ValidationError for an unsupported interval (nothing applied)
    // and PersistenceError if the settings file can't be written.
    void configure(bool enabled, uint32_t interval_hours);
    void set_stats_hours(uint32_t hours);

    // Drops the recent cache, the pending buffer and the log files.
    void clear();

    std::vector<LogEntry> get_data() const;
    QueryLogConfig get_config() const;
    StatsTop top_stats(size_t hours) const noexcept;
    StatsCounters counters() const noexcept;
    QueryLogState state() const noexcept { return state_.load(); }
    size_t pending() const;

    const LogStore &store() const noexcept { return store_; }

private:
    std::chrono::system_clock::time_point now() const;
    void fill_from_file();
    void restart_rotation_task();

    mutable std::mutex cfg_mu_;
    QueryLogConfig cfg_;
    std::atomic<bool> enabled_;
    std::atomic<QueryLogState> state_{QueryLogState::Uninitialized};
    Clock clock_;
    const size_t buffer_cap_;

    LogStore store_;
    RecentCache cache_;
    TopStatsAggregator top_;

    mutable std::mutex buffer_mu_;
    std::vector<LogEntry> buffer_;
    bool flush_pending_ = false;

    std::mutex flush_mu_;   // one flush or clear at a time

    std::mutex tasks_mu_;
    bool background_ = false;
    std::unique_ptr<PeriodicTask> hour_task_;
    std::unique_ptr<PeriodicTask> rotate_task_;
    std::unique_ptr<PeriodicTask> flush_task_;
};
