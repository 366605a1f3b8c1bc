#include "control.hpp"
#include "base64.hpp"
#include "dns_question.hpp"
#include "errors.hpp"
#include "util_log.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <sstream>

std::string url_decode(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i=0;i<s.size();++i) {
        char c = s[i];
        if (c == '+') out.push_back(' ');
        else if (c == '%' && i+2 < s.size()) {
            std::string hex2 = s.substr(i+1,2);
            char dec = static_cast<char>(std::strtol(hex2.c_str(), nullptr, 16));
            out.push_back(dec);
            i += 2;
        } else out.push_back(c);
    }
    return out;
}

std::string get_query_param(const std::string &q, const std::string &key) {
    if (q.empty()) return {};
    size_t pos = 0;
    while (pos < q.size()) {
        size_t amp = q.find('&', pos);
        std::string pair = q.substr(pos, (amp==std::string::npos ? std::string::npos : amp-pos));
        size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            std::string k = url_decode(pair.substr(0, eq));
            std::string v = url_decode(pair.substr(eq+1));
            if (k == key) return v;
        }
        if (amp==std::string::npos) break;
        pos = amp + 1;
    }
    return {};
}

std::string json_escape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

std::string format_time_utc(std::chrono::system_clock::time_point t) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    int64_t secs = ns / 1000000000;
    int64_t frac = ns % 1000000000;
    if (frac < 0) { frac += 1000000000; --secs; }
    std::time_t tt = static_cast<std::time_t>(secs);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%09lldZ", date, static_cast<long long>(frac));
    return out;
}

std::string entry_to_json(const LogEntry &e) {
    std::ostringstream out;
    double elapsed_ms = static_cast<double>(e.elapsed.count()) / 1e6;
    out << "{\"time\":\"" << format_time_utc(e.time) << "\"";
    auto q = parse_question(e.question);
    if (q) {
        out << ",\"question\":{\"host\":\"" << json_escape(q->name) << "\",\"type\":\""
            << qtype_to_string(q->qtype) << "\",\"class\":\"" << (q->qclass == 1 ? "IN" : std::to_string(q->qclass)) << "\"}";
    }
    if (!e.answer.empty()) {
        out << ",\"answer\":\"" << base64_encode(e.answer.data(), e.answer.size()) << "\"";
    }
    out << ",\"client\":\"" << json_escape(e.client) << "\""
        << ",\"upstream\":\"" << json_escape(e.upstream) << "\""
        << ",\"elapsedMs\":\"" << elapsed_ms << "\""
        << ",\"reason\":\"" << filter_reason_name(e.result.reason) << "\"";
    if (e.result.filtered || !e.result.rule.empty()) {
        out << ",\"rule\":\"" << json_escape(e.result.rule) << "\""
            << ",\"filterId\":" << e.result.filter_id;
    }
    out << "}";
    return out.str();
}

static void write_top(std::ostringstream &out, const char *name, const CountMap &m, size_t limit) {
    out << "\"" << name << "\":{";
    auto top = TopStatsAggregator::top_k(m, limit);
    for (size_t i = 0; i < top.size(); ++i) {
        if (i) out << ",";
        out << "\"" << json_escape(top[i].first) << "\":" << top[i].second;
    }
    out << "}";
}

std::string stats_top_to_json(const StatsTop &s, size_t limit) {
    std::ostringstream out;
    out << "{";
    write_top(out, "top_queried_domains", s.domains, limit);
    out << ",";
    write_top(out, "top_blocked_domains", s.blocked, limit);
    out << ",";
    write_top(out, "top_clients", s.clients, limit);
    out << "}";
    return out.str();
}

// Flat JSON object scanner: string keys, scalar values only.
namespace {
struct JsonScanner {
    const std::string &s;
    size_t i = 0;

    void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
    bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

    bool str(std::string &out) {
        ws();
        if (i >= s.size() || s[i] != '"') return false;
        ++i;
        while (i < s.size() && s[i] != '"') {
            if (s[i] == '\\') {
                if (i + 1 >= s.size()) return false;
                out.push_back(s[i + 1]);
                i += 2;
                continue;
            }
            out.push_back(s[i++]);
        }
        if (i >= s.size()) return false;
        ++i;
        return true;
    }

    // raw token of a scalar value: true/false/null/number, or a string
    bool scalar(std::string &tok, bool &quoted) {
        ws();
        if (i < s.size() && s[i] == '"') { quoted = true; return str(tok); }
        quoted = false;
        while (i < s.size() && (std::isalnum(static_cast<unsigned char>(s[i])) || s[i] == '-' || s[i] == '.' || s[i] == '+')) {
            tok.push_back(s[i++]);
        }
        return !tok.empty();
    }
};
}

bool parse_config_json(const std::string &body, bool &enabled, uint32_t &interval, std::string &err) {
    JsonScanner js{body};
    if (!js.eat('{')) { err = "json decode: expected object"; return false; }

    bool have_enabled = false, have_interval = false;
    bool en = false;
    uint32_t iv = 0;
    if (!js.eat('}')) {
        while (true) {
            std::string key, tok;
            bool quoted = false;
            if (!js.str(key)) { err = "json decode: expected key"; return false; }
            if (!js.eat(':')) { err = "json decode: expected ':'"; return false; }
            if (!js.scalar(tok, quoted)) { err = "json decode: bad value for " + key; return false; }

            if (key == "enabled") {
                if (quoted || (tok != "true" && tok != "false")) { err = "json decode: enabled must be a bool"; return false; }
                en = (tok == "true");
                have_enabled = true;
            } else if (key == "interval") {
                if (quoted || tok.empty() || tok.size() > 9 || tok.find_first_not_of("0123456789") != std::string::npos) {
                    err = "json decode: interval must be a non-negative integer";
                    return false;
                }
                iv = static_cast<uint32_t>(std::stoul(tok));
                have_interval = true;
            }
            if (js.eat(',')) continue;
            if (js.eat('}')) break;
            err = "json decode: expected ',' or '}'";
            return false;
        }
    }
    js.ws();
    if (js.i != body.size()) { err = "json decode: trailing data"; return false; }
    if (!have_enabled || !have_interval) { err = "json decode: enabled and interval are required"; return false; }

    enabled = en;
    interval = iv;
    return true;
}

ControlResponse Control::query_log() {
    auto data = ql_.get_data();
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < data.size(); ++i) {
        if (i) out << ",";
        out << entry_to_json(data[i]);
    }
    out << "]";
    return ControlResponse{200, out.str(), "application/json"};
}

ControlResponse Control::query_log_info() {
    auto cfg = ql_.get_config();
    std::ostringstream out;
    out << "{\"enabled\":" << (cfg.enabled ? "true" : "false")
        << ",\"interval\":" << cfg.interval_hours << "}";
    return ControlResponse{200, out.str(), "application/json"};
}

ControlResponse Control::query_log_config(const std::string &body) {
    bool enabled = false;
    uint32_t interval = 0;
    std::string err;
    if (!parse_config_json(body, enabled, interval, err)) {
        return ControlResponse{400, err + "\n"};
    }
    if (!check_interval_hours(interval)) {
        return ControlResponse{400, "Unsupported interval\n"};
    }
    try {
        ql_.configure(enabled, interval);
    } catch (const ValidationError &e) {
        return ControlResponse{400, std::string(e.what()) + "\n"};
    } catch (const QueryLogError &e) {
        safe_log_error(std::string("control: configure failed: ") + e.what());
        return ControlResponse{500, std::string(e.what()) + "\n"};
    }
    return ControlResponse{200, "OK\n"};
}

ControlResponse Control::query_log_clear() {
    try {
        ql_.clear();
    } catch (const QueryLogError &e) {
        safe_log_error(std::string("control: clear failed: ") + e.what());
        return ControlResponse{500, std::string(e.what()) + "\n"};
    }
    return ControlResponse{200, "OK\n"};
}

ControlResponse Control::stats_top(const std::string &query) {
    size_t hours = 24;
    std::string s_hours = get_query_param(query, "hours");
    if (!s_hours.empty()) {
        if (s_hours.size() > 6 || s_hours.find_first_not_of("0123456789") != std::string::npos) {
            return ControlResponse{400, "hours must be a positive integer\n"};
        }
        hours = static_cast<size_t>(std::stoul(s_hours));
        if (hours == 0) return ControlResponse{400, "hours must be a positive integer\n"};
    }
    return ControlResponse{200, stats_top_to_json(ql_.top_stats(hours)), "application/json"};
}

ControlResponse Control::handle(const std::string &method, const std::string &path,
                                const std::string &query, const std::string &body) {
    if (method == "GET" && path == "/control/querylog") return query_log();
    if (method == "GET" && path == "/control/querylog_info") return query_log_info();
    if (method == "POST" && path == "/control/querylog_config") return query_log_config(body);
    if (method == "POST" && path == "/control/querylog_clear") return query_log_clear();
    if (method == "GET" && path == "/control/stats_top") return stats_top(query);

    if (path == "/control/querylog" || path == "/control/querylog_info" || path == "/control/querylog_config"
        || path == "/control/querylog_clear" || path == "/control/stats_top") {
        return ControlResponse{405, "method not allowed\n"};
    }
    return ControlResponse{404, "not found\n"};
}
