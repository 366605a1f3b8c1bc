// tests/test_query_log.cpp
// End-to-end through QueryLog with a fixed clock and no background tasks.
#include <atomic>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "../src/dns_question.hpp"
#include "../src/errors.hpp"
#include "../src/query_log.hpp"
#include "../src/util_log.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static const auto T0 = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

static int seq = 0;

// Distinct, increasing times inside the current hour.
static LogEntry mk(const std::string &host, const std::string &client, bool filtered = false) {
    LogEntry e;
    e.time = T0 - 1h + std::chrono::seconds(++seq);
    e.question = build_query(host);
    e.client = client;
    e.upstream = "8.8.8.8:53";
    e.elapsed = 1500us;
    if (filtered) {
        e.result.filtered = true;
        e.result.reason = FilterReason::FilteredBlackList;
        e.result.rule = "||" + host + "^";
        e.result.filter_id = 1;
    }
    return e;
}

static void remove_files(const std::string &p) {
    std::error_code ec;
    fs::remove(p, ec);
    fs::remove(p + ".1", ec);
    fs::remove(p + ".conf", ec);
    fs::remove(p + ".conf.tmp", ec);
}

static QueryLogConfig test_config(const std::string &path) {
    QueryLogConfig cfg;
    cfg.log_file = path;
    cfg.cache_size = 5;
    cfg.buffer_size = 100;
    cfg.clock = []{ return T0; };
    return cfg;
}

int main() {
    set_log_file("");
    set_log_level(LogLevel::Error);

    const std::string path = "test_query_log.log";
    remove_files(path);

    std::vector<LogEntry> before_stop;
    {
        QueryLog ql(test_config(path));
        if (ql.ingest(mk("early.example", "10.0.0.1")) != IngestResult::NotRunning) {
            std::cerr << "ingest accepted before start\n";
            return 1;
        }
        ql.start();
        if (ql.state() != QueryLogState::Running || !ql.get_data().empty()) {
            std::cerr << "fresh start should be running and empty\n";
            return 2;
        }

        // outside the replay window on the next start
        LogEntry stale = mk("stale.example", "10.0.0.1");
        stale.time = T0 - 30h;
        ql.ingest(stale);

        // three plain queries in the current hour
        for (int i = 0; i < 3; ++i) ql.ingest(mk("example.com", "10.0.0.1"));
        auto s = ql.top_stats(1);
        if (s.domains["example.com"] != 3 || s.blocked.count("example.com")) {
            std::cerr << "example.com: expected 3 queries and no block\n";
            return 3;
        }

        // one blocked query
        ql.ingest(mk("ads.example", "10.0.0.2", true));
        s = ql.top_stats(1);
        if (s.domains["ads.example"] != 1 || s.blocked["ads.example"] != 1) {
            std::cerr << "ads.example: expected 1 query and 1 block\n";
            return 4;
        }

        // unusable questions
        LogEntry none = mk("x.example", "10.0.0.3");
        none.question.clear();
        LogEntry junk = mk("x.example", "10.0.0.3");
        junk.question = {1, 2, 3};
        if (ql.ingest(none) != IngestResult::MissingQuestion || ql.ingest(junk) != IngestResult::BadQuestion) {
            std::cerr << "unusable question accepted\n";
            return 5;
        }

        // recent cache never exceeds its capacity
        for (int i = 0; i < 20; ++i) ql.ingest(mk("bulk" + std::to_string(i) + ".example", "10.0.0.4"));
        auto data = ql.get_data();
        if (data.size() != 5 || extract_query_name(data.back().question).value_or("") != "bulk19.example") {
            std::cerr << "recent cache: expected the newest 5 entries\n";
            return 6;
        }

        // below the threshold a partial flush writes nothing, a full one writes all
        if (ql.pending() != 25) {
            std::cerr << "expected 25 pending got " << ql.pending() << "\n";
            return 7;
        }
        ql.flush(false);
        if (fs::exists(path) || ql.pending() != 25) {
            std::cerr << "partial flush below threshold wrote the buffer\n";
            return 8;
        }
        ql.flush(true);
        if (!fs::exists(path) || ql.pending() != 0) {
            std::cerr << "full flush did not write the buffer\n";
            return 9;
        }

        // unsupported interval: rejected, nothing applied
        try {
            ql.configure(false, 25);
            std::cerr << "interval 25h accepted\n";
            return 10;
        } catch (const ValidationError &) {}
        if (!ql.get_config().enabled || ql.get_config().interval_hours != 24 || fs::exists(path + ".conf")) {
            std::cerr << "rejected configure had side effects\n";
            return 11;
        }

        ql.configure(false, 168);
        if (ql.get_config().enabled || ql.get_config().interval_hours != 168 || !fs::exists(path + ".conf")) {
            std::cerr << "configure not applied or not persisted\n";
            return 12;
        }
        if (ql.ingest(mk("off.example", "10.0.0.5")) != IngestResult::Disabled) {
            std::cerr << "ingest accepted while disabled\n";
            return 13;
        }
        QueryLogConfig saved;
        saved.log_file = path;
        if (!load_settings(settings_path(saved), saved) || saved.enabled || saved.interval_hours != 168) {
            std::cerr << "settings file does not hold the new config\n";
            return 14;
        }
        ql.configure(true, 24);

        // two hours of retention across three hour rotations
        ql.set_stats_hours(2);
        ql.ingest(mk("h0.example", "10.0.0.6"));
        ql.rotate_hour();
        ql.ingest(mk("h1.example", "10.0.0.6"));
        ql.rotate_hour();
        ql.ingest(mk("h2.example", "10.0.0.6"));
        s = ql.top_stats(3);
        if (s.domains.count("h0.example") || s.domains["h1.example"] != 1 || s.domains["h2.example"] != 1) {
            std::cerr << "oldest hour still counted with 2h retention\n";
            return 15;
        }
        try {
            ql.set_stats_hours(0);
            std::cerr << "stats retention 0 accepted\n";
            return 16;
        } catch (const ValidationError &) {}

        before_stop = ql.get_data();
        ql.stop();
        if (ql.state() != QueryLogState::Stopped || ql.pending() != 0) {
            std::cerr << "stop did not flush\n";
            return 17;
        }
        if (ql.ingest(mk("late.example", "10.0.0.7")) != IngestResult::NotRunning) {
            std::cerr << "ingest accepted after stop\n";
            return 18;
        }
    }

    // restart: cache and top stats rebuilt from the file
    {
        QueryLog ql(test_config(path));
        ql.start();
        if (ql.get_data() != before_stop) {
            std::cerr << "restart did not restore the recent entries\n";
            return 19;
        }
        auto s = ql.top_stats(24);
        if (s.domains["example.com"] != 3 || s.blocked["ads.example"] != 1 || s.domains.count("stale.example")) {
            std::cerr << "restart did not rebuild top stats\n";
            return 20;
        }

        ql.clear();
        if (!ql.get_data().empty() || fs::exists(path) || fs::exists(path + ".1")) {
            std::cerr << "clear left entries or files\n";
            return 21;
        }
        // rolling counters are not part of the log
        if (ql.top_stats(24).domains["example.com"] != 3) {
            std::cerr << "clear dropped top stats\n";
            return 22;
        }
    }

    // a failed flush keeps every entry for the next attempt
    {
        QueryLogConfig cfg = test_config("no_such_dir_for_querypulse/q.log");
        QueryLog ql(cfg);
        ql.start();
        for (int i = 0; i < 3; ++i) ql.ingest(mk("kept.example", "10.0.0.8"));
        try {
            ql.flush(true);
            std::cerr << "flush into a missing directory succeeded\n";
            return 23;
        } catch (const PersistenceError &) {}
        ql.ingest(mk("kept.example", "10.0.0.8"));
        if (ql.pending() != 4) {
            std::cerr << "failed flush lost entries: pending=" << ql.pending() << "\n";
            return 24;
        }
        ql.stop();
        if (ql.state() != QueryLogState::Stopped) {
            std::cerr << "stop after failed flush did not complete\n";
            return 25;
        }
    }

    // a settings file cannot ask for more stats retention than the aggregator keeps
    {
        const std::string conf = "test_query_log_hours.conf";
        {
            std::ofstream f(conf);
            f << "enabled=true\ninterval_hours=24\nstats_hours=8760\n";
        }
        QueryLogConfig cfg;
        if (!load_settings(conf, cfg) || cfg.stats_hours != 8760) {
            std::cerr << "a year of stats retention was not loaded\n";
            return 28;
        }
        {
            std::ofstream f(conf, std::ios::trunc);
            f << "enabled=true\ninterval_hours=24\nstats_hours=9000\n";
        }
        bool rejected = false;
        try {
            load_settings(conf, cfg);
        } catch (const ValidationError &) {
            rejected = true;
        }
        std::error_code ec;
        fs::remove(conf, ec);
        if (!rejected) {
            std::cerr << "stats_hours=9000 accepted from settings file\n";
            return 29;
        }
    }

    // every entry reported Accepted while stop() races the writers is on disk
    for (int run = 0; run < 20; ++run) {
        const std::string race_path = "test_query_log_race.log";
        remove_files(race_path);
        QueryLogConfig cfg = test_config(race_path);
        cfg.buffer_size = 1000000;
        QueryLog ql(cfg);
        ql.start();

        const int writers = 4;
        const int per_writer = 2000;
        std::vector<std::vector<LogEntry>> work(writers);
        for (int w = 0; w < writers; ++w) {
            for (int i = 0; i < per_writer; ++i) {
                LogEntry e = mk("race.example", "10.0.1." + std::to_string(w));
                e.time = T0 - 10min;
                work[w].push_back(e);
            }
        }

        std::atomic<size_t> accepted{0};
        std::atomic<int> started{0};
        std::vector<std::thread> threads;
        for (int w = 0; w < writers; ++w) {
            threads.emplace_back([&, w]{
                started.fetch_add(1);
                for (const auto &e : work[w]) {
                    if (ql.ingest(e) == IngestResult::Accepted) accepted.fetch_add(1);
                }
            });
        }
        while (started.load() < writers) std::this_thread::yield();
        ql.stop();
        for (auto &t : threads) t.join();

        if (ql.pending() != 0) {
            std::cerr << "entries buffered after stop: " << ql.pending() << "\n";
            return 26;
        }
        size_t on_disk = ql.store().replay(std::chrono::hours(1000),
                                           [](const LogEntry &) {},
                                           []{ return true; }, T0);
        if (on_disk != accepted.load()) {
            std::cerr << "stop lost accepted entries: accepted=" << accepted.load()
                      << " on disk=" << on_disk << "\n";
            return 27;
        }
        remove_files(race_path);
    }

    remove_files(path);
    std::cout << "test_query_log: OK\n";
    return 0;
}
