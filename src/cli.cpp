#include "cli.hpp"
#include "control.hpp"
#include "dns_question.hpp"
#include "errors.hpp"
#include <sstream>
#include <iomanip>
#include <string>

static void print_top(std::ostream &out, const std::string &title, const CountMap &m, size_t K) {
    auto t = TopStatsAggregator::top_k(m, K);
    out << "TOP " << K << " " << title << ":\n";
    for (auto &p : t) out << p.first << " " << p.second << "\n";
}

void run_cli(QueryLog &ql, std::atomic<bool> &terminate_flag, std::istream &in, std::ostream &out) {
    std::string cmd;
    out << "QueryPulse CLI ready. Commands: STATS | INFO | TOP domains|blocked|clients K [hours] | LOG N | "
           "CONFIG on|off HOURS | STATS_HOURS N | FLUSH | ROTATE | CLEAR | QUIT\n> " << std::flush;

    while (!terminate_flag.load() && std::getline(in, cmd)) {
        if (cmd.empty()) {
            out << "> " << std::flush;
            continue;
        }

        std::stringstream ss(cmd);
        std::string tok;
        ss >> tok;

        try {
            if (tok == "STATS") {
                auto c = ql.counters();
                out << "queries: " << c.queries
                    << "  blocked: " << c.blocked
                    << "  ignored: " << c.ignored
                    << std::fixed << std::setprecision(3)
                    << "  avg_elapsed_ms: " << c.avg_elapsed_ms
                    << "  pending: " << ql.pending() << "\n";
            }
            else if (tok == "INFO") {
                auto cfg = ql.get_config();
                out << "enabled: " << (cfg.enabled ? "true" : "false")
                    << "  interval_hours: " << cfg.interval_hours
                    << "  stats_hours: " << cfg.stats_hours
                    << "  log_file: " << cfg.log_file << "\n";
            }
            else if (tok == "TOP") {
                std::string what;
                size_t K = 10;
                size_t hours = 24;
                ss >> what;
                if (!(ss >> K)) K = 10;
                if (!(ss >> hours) || hours == 0) hours = 24;
                auto top = ql.top_stats(hours);
                if (what == "domains") print_top(out, "domains", top.domains, K);
                else if (what == "blocked") print_top(out, "blocked domains", top.blocked, K);
                else if (what == "clients") print_top(out, "clients", top.clients, K);
                else out << "Unknown TOP target. Supported: domains, blocked, clients\n";
            }
            else if (tok == "LOG") {
                size_t N = 10;
                if (!(ss >> N)) N = 10;
                auto data = ql.get_data();
                size_t from = data.size() > N ? data.size() - N : 0;
                for (size_t i = from; i < data.size(); ++i) {
                    const auto &e = data[i];
                    auto q = parse_question(e.question);
                    out << format_time_utc(e.time) << " " << e.client << " "
                        << (q ? q->name : std::string("?")) << " "
                        << (q ? qtype_to_string(q->qtype) : std::string("?")) << " "
                        << filter_reason_name(e.result.reason);
                    if (!e.result.rule.empty()) out << " " << e.result.rule;
                    out << "\n";
                }
            }
            else if (tok == "CONFIG") {
                std::string onoff;
                uint32_t hours = 0;
                if (!(ss >> onoff >> hours) || (onoff != "on" && onoff != "off")) {
                    out << "Usage: CONFIG on|off HOURS\n";
                } else {
                    ql.configure(onoff == "on", hours);
                    out << "OK\n";
                }
            }
            else if (tok == "STATS_HOURS") {
                uint32_t hours = 0;
                if (!(ss >> hours)) {
                    out << "Usage: STATS_HOURS N\n";
                } else {
                    ql.set_stats_hours(hours);
                    out << "OK\n";
                }
            }
            else if (tok == "FLUSH") {
                ql.flush(true);
                out << "OK\n";
            }
            else if (tok == "ROTATE") {
                ql.rotate_log();
                out << "OK\n";
            }
            else if (tok == "CLEAR") {
                ql.clear();
                out << "OK\n";
            }
            else if (tok == "QUIT" || tok == "EXIT") {
                terminate_flag.store(true);
                break;
            }
            else {
                out << "Unknown command\n";
            }
        } catch (const QueryLogError &e) {
            out << "ERROR: " << e.what() << "\n";
        }

        out << "> " << std::flush;
    }

    terminate_flag.store(true);
}
