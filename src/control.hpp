#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "query_log.hpp"

struct ControlResponse {
    int code = 200;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8";
};

// Control-plane handlers, independent of the transport. HttpServer routes
// every request through handle().
//
//   GET  /control/querylog          log view, newest last
//   GET  /control/querylog_info     {"enabled":..,"interval":<hours>}
//   POST /control/querylog_config   same body; 400 on unsupported interval
//   POST /control/querylog_clear
//   GET  /control/stats_top?hours=N top domains / blocked / clients
class Control {
public:
    explicit Control(QueryLog &ql) : ql_(ql) {}

    ControlResponse handle(const std::string &method, const std::string &path,
                           const std::string &query, const std::string &body);

    ControlResponse query_log();
    ControlResponse query_log_info();
    ControlResponse query_log_config(const std::string &body);
    ControlResponse query_log_clear();
    ControlResponse stats_top(const std::string &query);

private:
    QueryLog &ql_;
};

std::string json_escape(const std::string &s);
// RFC 3339 in UTC with nanoseconds
std::string format_time_utc(std::chrono::system_clock::time_point t);
std::string entry_to_json(const LogEntry &e);
std::string stats_top_to_json(const StatsTop &s, size_t limit = 100);

// {"enabled": bool, "interval": uint}. Both keys required; false with a
// message in `err` otherwise.
bool parse_config_json(const std::string &body, bool &enabled, uint32_t &interval, std::string &err);

std::string get_query_param(const std::string &q, const std::string &key);
std::string url_decode(const std::string &s);
