#include "log_store.hpp"
#include "entry_codec.hpp"
#include "errors.hpp"
#include "util_log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

LogStore::LogStore(std::shared_ptr<LogFileHandle> handle) : handle_(std::move(handle)) {
    if (!handle_) throw std::invalid_argument("LogStore: null file handle");
}

void LogStore::append(const std::vector<LogEntry> &entries) {
    if (entries.empty()) {
        safe_log_debug("querylog: there's nothing to write to a file");
        return;
    }
    auto start = std::chrono::steady_clock::now();

    std::string buf = encode_batch(entries);
    verify_encoded(entries, buf);
    safe_log_debug("querylog: check ok: " + std::to_string(entries.size()) + " entries");

    auto took = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    {
        std::ostringstream os;
        os << "querylog: " << entries.size() << " entries serialized in " << took.count()
           << "us: " << (buf.size() / 1024) << " kB";
        safe_log_debug(os.str());
    }

    std::lock_guard<std::mutex> lk(handle_->write_mu);
    std::ofstream f(handle_->path, std::ios::binary | std::ios::app);
    if (!f) throw PersistenceError("failed to open \"" + handle_->path + "\" for append");
    f.write(buf.data(), static_cast<std::streamsize>(buf.size()));
    f.flush();
    if (!f) throw PersistenceError("couldn't write to \"" + handle_->path + "\"");
    f.close();
    if (f.fail()) throw PersistenceError("couldn't close \"" + handle_->path + "\"");

    safe_log_debug("querylog: ok \"" + handle_->path + "\": " + std::to_string(buf.size()) + " bytes written");
}

void LogStore::rotate() {
    std::lock_guard<std::mutex> lk(handle_->write_mu);
    const std::string from = handle_->path;
    const std::string to = backup_path();

    std::error_code ec;
    if (!fs::exists(from, ec)) {
        if (ec) throw PersistenceError("stat \"" + from + "\": " + ec.message());
        return;
    }
    fs::rename(from, to, ec);
    if (ec) throw PersistenceError("failed to rename \"" + from + "\" to \"" + to + "\": " + ec.message());

    safe_log_debug("querylog: rotated from " + from + " to " + to + " successfully");
}

void LogStore::clear() {
    std::lock_guard<std::mutex> lk(handle_->write_mu);
    for (const std::string &p : {handle_->path, backup_path()}) {
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) throw PersistenceError("failed to remove \"" + p + "\": " + ec.message());
    }
    safe_log_debug("querylog: removed log files for " + handle_->path);
}

size_t LogStore::replay(std::chrono::nanoseconds window,
                        const std::function<void(const LogEntry &)> &on_entry,
                        const std::function<bool()> &should_continue,
                        std::chrono::system_clock::time_point now) const {
    size_t delivered = 0;
    const std::string files[] = {handle_->path, backup_path()};

    for (const auto &file : files) {
        if (!should_continue()) break;

        std::error_code ec;
        if (!fs::exists(file, ec)) continue;

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            // try next file
            safe_log_error("querylog: failed to open file \"" + file + "\"");
            continue;
        }

        auto start = std::chrono::steady_clock::now();
        size_t n = 0, skipped = 0;
        std::string line;
        while (std::getline(in, line)) {
            if (!should_continue()) break;
            if (line.empty()) continue;

            LogEntry e;
            try {
                e = decode_entry(line);
            } catch (const DecodeError &de) {
                // next record can be fine
                safe_log_debug(std::string("querylog: ") + de.what());
                ++skipped;
                continue;
            }
            if (now - e.time > window) continue;

            on_entry(e);
            ++n;
        }
        delivered += n;

        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        std::ostringstream os;
        os << "querylog: file \"" << file << "\": read " << n << " entries in " << took.count()
           << "ms, " << skipped << " undecodable";
        safe_log_debug(os.str());
    }
    return delivered;
}
