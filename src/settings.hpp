#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct QueryLogConfig {
    bool enabled = true;
    uint32_t interval_hours = 24;   // log rotation period and replay window
    uint32_t stats_hours = 24;      // hourly buckets kept by the top stats
    size_t cache_size = 5000;       // entries kept in memory for the log view
    size_t buffer_size = 5000;      // pending entries that trigger a flush
    size_t top_size = 500;          // keys per hourly counter
    std::chrono::milliseconds flush_interval{5000};
    std::string log_file = "querylog.log";
    Clock clock;                    // empty means system_clock::now
};

// 1, 7, 30 and 90 days.
bool check_interval_hours(uint32_t hours);

// The part of the config an operator can change at runtime. Stored next to
// the log as "<log_file>.conf", one key=value per line.
std::string settings_path(const QueryLogConfig &cfg);

// Applies enabled / interval_hours / stats_hours found in the file. Missing
// file returns false; unknown keys are ignored; bad values throw ValidationError.
bool load_settings(const std::string &path, QueryLogConfig &cfg);

// Write-then-rename. Throws PersistenceError.
void save_settings(const std::string &path, const QueryLogConfig &cfg);
