#include "util_log.hpp"
#include <atomic>
#include <mutex>
#include <fstream>
#include <iostream>

static std::mutex g_log_mu_internal;
static std::string g_log_file = "querypulse.err.log";
static std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};

static void write_line(LogLevel lvl, const std::string &s) {
    if (static_cast<int>(lvl) < g_log_level.load()) return;
    const char *tag = (lvl == LogLevel::Debug) ? "[debug] " : (lvl == LogLevel::Error) ? "[error] " : "[info] ";
    std::lock_guard<std::mutex> lk(g_log_mu_internal);
    // write to stderr so console shows messages too
    std::cerr << tag << s << std::endl;
    if (g_log_file.empty()) return;
    std::ofstream f(g_log_file, std::ios::app);
    if (f) f << tag << s << std::endl;
}

void safe_log(const std::string &s) { write_line(LogLevel::Info, s); }
void safe_log_debug(const std::string &s) { write_line(LogLevel::Debug, s); }
void safe_log_error(const std::string &s) { write_line(LogLevel::Error, s); }

void set_log_level(LogLevel lvl) { g_log_level.store(static_cast<int>(lvl)); }
LogLevel get_log_level() { return static_cast<LogLevel>(g_log_level.load()); }

void set_log_file(const std::string &path) {
    std::lock_guard<std::mutex> lk(g_log_mu_internal);
    g_log_file = path;
}

bool parse_log_level(const std::string &name, LogLevel &out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info") { out = LogLevel::Info; return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}
