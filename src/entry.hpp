#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Why a query was (or was not) filtered.
enum class FilterReason : int32_t {
    NotFiltered = 0,
    FilteredBlackList = 1,
    FilteredSafeBrowsing = 2,
    FilteredParental = 3,
    FilteredInvalid = 4,
    FilteredSafeSearch = 5,
    NotFilteredWhiteList = 6,
};

constexpr int32_t kMaxFilterReason = static_cast<int32_t>(FilterReason::NotFilteredWhiteList);

struct FilterResult {
    bool filtered = false;
    FilterReason reason = FilterReason::NotFiltered;
    std::string rule;
    int64_t filter_id = 0;

    bool operator==(const FilterResult &o) const {
        return filtered == o.filtered && reason == o.reason &&
               rule == o.rule && filter_id == o.filter_id;
    }
    bool operator!=(const FilterResult &o) const { return !(*this == o); }
};

// One completed DNS transaction. Immutable once handed to QueryLog::ingest.
struct LogEntry {
    std::chrono::system_clock::time_point time;
    std::vector<uint8_t> question;   // wire-format query
    std::vector<uint8_t> answer;     // wire-format response, may be empty
    std::string client;
    std::string upstream;
    FilterResult result;
    std::chrono::nanoseconds elapsed{0};

    bool operator==(const LogEntry &o) const {
        return time == o.time && question == o.question && answer == o.answer &&
               client == o.client && upstream == o.upstream &&
               result == o.result && elapsed == o.elapsed;
    }
    bool operator!=(const LogEntry &o) const { return !(*this == o); }
};

const char *filter_reason_name(FilterReason r) noexcept;
