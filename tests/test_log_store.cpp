// tests/test_log_store.cpp
#include <iostream>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "../src/dns_question.hpp"
#include "../src/errors.hpp"
#include "../src/log_store.hpp"
#include "../src/util_log.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static const auto T0 = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

static LogEntry mk(const std::string &host, const std::string &client, std::chrono::seconds age) {
    LogEntry e;
    e.time = T0 - age;
    e.question = build_query(host);
    e.client = client;
    return e;
}

static std::vector<LogEntry> read_all(const LogStore &s, std::chrono::nanoseconds window = 24h) {
    std::vector<LogEntry> out;
    s.replay(window, [&](const LogEntry &e){ out.push_back(e); }, []{ return true; }, T0);
    return out;
}

static void remove_files(const std::string &p) {
    std::error_code ec;
    fs::remove(p, ec);
    fs::remove(p + ".1", ec);
}

int main() {
    set_log_file("");
    const std::string path = "test_log_store.log";
    remove_files(path);

    auto handle = std::make_shared<LogFileHandle>(path);
    LogStore store(handle);

    // empty batch is a no-op, missing files replay as empty
    store.append({});
    if (fs::exists(path) || !read_all(store).empty()) {
        std::cerr << "empty append touched the log\n";
        return 1;
    }

    std::vector<LogEntry> first = {mk("a.example", "10.0.0.1", 300s), mk("b.example", "10.0.0.2", 200s),
                                   mk("c.example", "10.0.0.1", 100s)};
    store.append(first);

    // durability: a fresh store over the same path sees the same records
    {
        LogStore reopened(std::make_shared<LogFileHandle>(path));
        if (read_all(reopened) != first) {
            std::cerr << "replay after reopen differs from what was written\n";
            return 2;
        }
    }

    // a corrupt line in the middle is skipped, the rest survives
    {
        std::ofstream f(path, std::ios::app);
        f << "v=1&t=oops&q=\n";
    }
    store.append({mk("d.example", "10.0.0.3", 50s)});
    auto all = read_all(store);
    if (all.size() != 4 || all[3].client != "10.0.0.3") {
        std::cerr << "corrupt line handling: expected 4 entries got " << all.size() << "\n";
        return 3;
    }

    // window: an entry 30h old is not replayed with a 24h window
    store.append({mk("old.example", "10.0.0.9", 30h)});
    if (read_all(store).size() != 4 || read_all(store, 48h).size() != 5) {
        std::cerr << "replay window not honoured\n";
        return 4;
    }

    // should_continue stops the scan
    size_t n = store.replay(24h, [](const LogEntry &){}, []{ return false; }, T0);
    if (n != 0) {
        std::cerr << "replay ignored should_continue\n";
        return 5;
    }

    // rotation: active moves to backup, new writes land in a fresh active file
    store.rotate();
    if (fs::exists(path) || !fs::exists(store.backup_path())) {
        std::cerr << "rotate did not move the active file\n";
        return 6;
    }
    store.append({mk("e.example", "10.0.0.4", 10s)});
    all = read_all(store);
    if (all.size() != 5 || all[0].client != "10.0.0.4" || all[1].client != "10.0.0.1") {
        std::cerr << "replay after rotate: expected active then backup\n";
        return 7;
    }

    // rotating again replaces the old backup
    store.rotate();
    all = read_all(store);
    if (all.size() != 1 || all[0].client != "10.0.0.4") {
        std::cerr << "second rotate should keep only the newest backup, got " << all.size() << "\n";
        return 8;
    }

    // clear removes both files; rotate with no active file is a no-op
    store.clear();
    store.rotate();
    if (fs::exists(path) || fs::exists(store.backup_path()) || !read_all(store).empty()) {
        std::cerr << "clear left files behind\n";
        return 9;
    }

    // stores sharing one handle never interleave partial batches
    {
        LogStore other(handle);
        std::vector<std::thread> th;
        for (int t = 0; t < 4; ++t) {
            th.emplace_back([&, t]{
                LogStore &s = (t % 2) ? other : store;
                for (int i = 0; i < 50; ++i) {
                    s.append({mk("x" + std::to_string(t) + ".example", "c" + std::to_string(i), 5s),
                              mk("y.example", "c" + std::to_string(i), 5s)});
                }
            });
        }
        for (auto &x : th) x.join();
        if (read_all(store).size() != 400) {
            std::cerr << "concurrent appends: expected 400 entries\n";
            return 10;
        }
    }
    remove_files(path);

    // unwritable target
    LogStore broken(std::make_shared<LogFileHandle>("no_such_dir_for_querypulse/q.log"));
    try {
        broken.append({mk("a.example", "10.0.0.1", 1s)});
        std::cerr << "append into a missing directory succeeded\n";
        return 11;
    } catch (const PersistenceError &) {}

    std::cout << "test_log_store: OK\n";
    return 0;
}
