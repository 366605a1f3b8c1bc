#include "settings.hpp"
#include "aggregator.hpp"
#include "errors.hpp"
#include "util_log.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

bool check_interval_hours(uint32_t hours) {
    return hours == 24 || hours == 7 * 24 || hours == 30 * 24 || hours == 90 * 24;
}

std::string settings_path(const QueryLogConfig &cfg) {
    return cfg.log_file + ".conf";
}

static uint32_t parse_u32(const std::string &key, const std::string &v) {
    if (v.empty() || v.size() > 9 || v.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError("settings: bad value for " + key + ": '" + v + "'");
    }
    return static_cast<uint32_t>(std::stoul(v));
}

bool load_settings(const std::string &path, QueryLogConfig &cfg) {
    std::ifstream in(path);
    if (!in) return false;

    QueryLogConfig next = cfg;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) throw ValidationError("settings: bad line '" + line + "'");
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        if (k == "enabled") {
            if (v == "true") next.enabled = true;
            else if (v == "false") next.enabled = false;
            else throw ValidationError("settings: bad value for enabled: '" + v + "'");
        } else if (k == "interval_hours") {
            next.interval_hours = parse_u32(k, v);
            if (!check_interval_hours(next.interval_hours)) {
                throw ValidationError("settings: unsupported interval " + v);
            }
        } else if (k == "stats_hours") {
            next.stats_hours = parse_u32(k, v);
            if (next.stats_hours == 0) throw ValidationError("settings: stats_hours must be positive");
            if (next.stats_hours > kMaxStatsHours) {
                throw ValidationError("settings: stats_hours must not exceed " + std::to_string(kMaxStatsHours));
            }
        }
    }
    cfg = next;
    return true;
}

void save_settings(const std::string &path, const QueryLogConfig &cfg) {
    std::string tmp = path + ".tmp";
    {
        std::ofstream o(tmp, std::ios::trunc);
        if (!o) throw PersistenceError("failed to create \"" + tmp + "\"");
        o << "enabled=" << (cfg.enabled ? "true" : "false") << "\n"
          << "interval_hours=" << cfg.interval_hours << "\n"
          << "stats_hours=" << cfg.stats_hours << "\n";
        o.flush();
        if (!o) throw PersistenceError("couldn't write \"" + tmp + "\"");
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::string why = ec.message();
        std::filesystem::remove(tmp, ec);
        throw PersistenceError("failed to replace \"" + path + "\": " + why);
    }
    safe_log_debug("settings written to " + path);
}
