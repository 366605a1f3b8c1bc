// src/main.cpp
// QueryPulse startup: flags, settings file, query log replay, event feed
// (stdin or file) through the worker pool, optional HTTP control API and CLI.

#include "base64.hpp"
#include "bounded_queue.hpp"
#include "cli.hpp"
#include "control.hpp"
#include "errors.hpp"
#include "feed.hpp"
#include "http_server.hpp"
#include "query_log.hpp"
#include "settings.hpp"
#include "util_log.hpp"
#include "worker_pool.hpp"

#include <cstdio>
#include <iostream>
#include <thread>
#include <csignal>
#include <chrono>
#include <exception>
#include <memory>
#include <sstream>
#include <stdexcept>

static std::atomic<bool> g_terminate{false};

// SIGINT handler
static void handle_sigint(int) {
    g_terminate.store(true);
}

static void usage() {
    std::cerr <<
        "usage: querypulse [options]\n"
        "  --log-file PATH        query log file (default querylog.log)\n"
        "  --interval-hours N     rotation / retention: 24, 168, 720 or 2160\n"
        "  --stats-hours N        hours kept by the top stats (default 24)\n"
        "  --cache-size N         entries kept for the log view (default 5000)\n"
        "  --buffer-size N        pending entries before a flush (default 5000)\n"
        "  --top-size N           keys per hourly counter (default 500)\n"
        "  --disable              start with query logging off\n"
        "  --file PATH            read events from PATH instead of stdin, then run the CLI\n"
        "  --workers N            parser threads\n"
        "  --qcap N               event queue capacity\n"
        "  --http-enable          serve the control API\n"
        "  --http-port N          (default 8080)\n"
        "  --http-user U --http-pass P   Basic Auth for the control API\n"
        "  --log-level debug|info|error\n"
        "  --err-log PATH         diagnostic log file, empty to disable\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);

    QueryLogConfig cfg;
    bool disable = false;
    std::string file;
    size_t workers = std::thread::hardware_concurrency();
    if (workers == 0) workers = 4;
    size_t qcap = 1<<16;

    bool http_enable = false;
    int http_port = 8080;
    std::string http_user, http_pass;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--log-file" && i+1 < argc) cfg.log_file = argv[++i];
            else if (a == "--interval-hours" && i+1 < argc) cfg.interval_hours = static_cast<uint32_t>(std::stoul(argv[++i]));
            else if (a == "--stats-hours" && i+1 < argc) cfg.stats_hours = static_cast<uint32_t>(std::stoul(argv[++i]));
            else if (a == "--cache-size" && i+1 < argc) cfg.cache_size = std::stoul(argv[++i]);
            else if (a == "--buffer-size" && i+1 < argc) cfg.buffer_size = std::stoul(argv[++i]);
            else if (a == "--top-size" && i+1 < argc) cfg.top_size = std::stoul(argv[++i]);
            else if (a == "--disable") disable = true;
            else if (a == "--file" && i+1 < argc) file = argv[++i];
            else if (a == "--workers" && i+1 < argc) workers = std::stoul(argv[++i]);
            else if (a == "--qcap" && i+1 < argc) qcap = std::stoul(argv[++i]);
            else if (a == "--http-enable") http_enable = true;
            else if (a == "--http-port" && i+1 < argc) http_port = std::stoi(argv[++i]);
            else if (a == "--http-user" && i+1 < argc) http_user = argv[++i];
            else if (a == "--http-pass" && i+1 < argc) http_pass = argv[++i];
            else if (a == "--log-level" && i+1 < argc) {
                LogLevel lvl;
                if (!parse_log_level(argv[++i], lvl)) {
                    std::cerr << "bad --log-level: " << argv[i] << "\n";
                    return 2;
                }
                set_log_level(lvl);
            }
            else if (a == "--err-log" && i+1 < argc) set_log_file(argv[++i]);
            else if (a == "--help" || a == "-h") { usage(); return 0; }
            else {
                std::cerr << "unknown option: " << a << "\n";
                usage();
                return 2;
            }
        }
    } catch (const std::logic_error &e) {
        std::cerr << "bad numeric option: " << e.what() << "\n";
        return 2;
    }
    if (http_port <= 0 || http_port > 65535) {
        std::cerr << "bad --http-port: " << http_port << "\n";
        return 2;
    }

    try {
        if (load_settings(settings_path(cfg), cfg)) {
            safe_log("Loaded settings from " + settings_path(cfg));
        }
    } catch (const QueryLogError &e) {
        safe_log_error(std::string("Ignoring settings file: ") + e.what());
    }
    if (disable) cfg.enabled = false;
    if (!check_interval_hours(cfg.interval_hours)) {
        std::cerr << "unsupported --interval-hours " << cfg.interval_hours << " (24, 168, 720 or 2160)\n";
        return 2;
    }

    {
        std::ostringstream os;
        os << "Starting QueryPulse; log_file=" << cfg.log_file
           << " enabled=" << (cfg.enabled ? "true" : "false")
           << " interval_hours=" << cfg.interval_hours
           << " stats_hours=" << cfg.stats_hours
           << " feed=" << (file.empty() ? "<stdin>" : file)
           << " workers=" << workers
           << " qcap=" << qcap
           << " http_enable=" << (http_enable ? "true" : "false")
           << " http_port=" << http_port;
        safe_log(os.str());
    }

    std::unique_ptr<QueryLog> ql_ptr;
    try {
        ql_ptr = std::make_unique<QueryLog>(cfg);
    } catch (const std::exception &e) {
        safe_log_error(std::string("QueryLog construction failed: ") + e.what());
        return 1;
    }
    QueryLog &ql = *ql_ptr;
    ql.start();
    ql.start_background();
    Control control(ql);

    BoundedQueue<std::string> bq(qcap);
    std::atomic<bool> producer_done{false};
    std::thread prod;
    if (file.empty()) {
        prod = std::thread([&]{
            read_feed_fd(fileno(stdin), bq, g_terminate);
            producer_done.store(true);
        });
    } else {
        prod = std::thread([&]{
            read_feed_file(file, bq, g_terminate);
            producer_done.store(true);
        });
    }

    WorkerPool pool(workers, bq, ql);

    std::unique_ptr<HttpServer> http_srv;
    if (http_enable) {
        std::string auth_expected;
        if (!http_user.empty() || !http_pass.empty()) {
            auth_expected = std::string("Basic ") + base64_encode(http_user + ":" + http_pass);
        }
        http_srv = std::make_unique<HttpServer>("", static_cast<uint16_t>(http_port), control, auth_expected);
        if (!http_srv->start()) {
            safe_log_error("HttpServer failed to start");
            http_srv.reset();
        }
    }

    if (!file.empty()) {
        run_cli(ql, g_terminate);
    } else {
        // the stdin feed ends the run unless the control API keeps it alive
        while (!g_terminate.load()) {
            if (producer_done.load() && !http_srv) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    safe_log("Shutdown: stopping feed");
    g_terminate.store(true);
    bq.close();

    if (http_srv) {
        http_srv->stop();
        http_srv.reset();
    }

    // the stdin reader waits in short slices and sees g_terminate
    prod.join();

    pool.join();
    safe_log("Feed done: accepted=" + std::to_string(pool.accepted())
             + " rejected=" + std::to_string(pool.rejected())
             + " parse_errors=" + std::to_string(pool.parse_errors()));

    ql.stop();
    safe_log("QueryPulse shutting down normally.");
    return 0;
}
