#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "entry.hpp"

// The physical log file target. Stores that share a handle serialize their
// writes on its mutex; that mutex is never taken while an in-memory lock is held.
struct LogFileHandle {
    explicit LogFileHandle(std::string p) : path(std::move(p)) {}
    LogFileHandle(const LogFileHandle&) = delete;
    LogFileHandle& operator=(const LogFileHandle&) = delete;

    const std::string path;
    std::mutex write_mu;
};

// Append-only log: one active file plus a single rotated backup "<path>.1".
class LogStore {
public:
    explicit LogStore(std::shared_ptr<LogFileHandle> handle);

    // Encodes, self-checks and writes the batch with a single write call.
    // Throws EncodeError, ConsistencyError or PersistenceError; on any of them
    // nothing is considered written and the caller keeps the batch.
    void append(const std::vector<LogEntry> &entries);

    // Renames the active file over the backup. Missing active file is a no-op.
    // Throws PersistenceError.
    void rotate();

    // Removes the active and backup files. Throws PersistenceError.
    void clear();

    // Reads the active file, then the backup, each oldest to newest. Entries
    // older than `window` (relative to `now`) are skipped, as are records that
    // fail to decode. Stops once should_continue() returns false.
    // Returns the number of entries passed to on_entry.
    size_t replay(std::chrono::nanoseconds window,
                  const std::function<void(const LogEntry &)> &on_entry,
                  const std::function<bool()> &should_continue,
                  std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    const std::string &path() const noexcept { return handle_->path; }
    std::string backup_path() const { return handle_->path + ".1"; }

private:
    std::shared_ptr<LogFileHandle> handle_;
};
