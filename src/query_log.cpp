#include "query_log.hpp"
#include "dns_question.hpp"
#include "errors.hpp"
#include "util_log.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

const char *ingest_result_name(IngestResult r) noexcept {
    switch (r) {
        case IngestResult::Accepted: return "accepted";
        case IngestResult::Disabled: return "disabled";
        case IngestResult::NotRunning: return "not running";
        case IngestResult::MissingQuestion: return "question is absent";
        case IngestResult::BadQuestion: return "malformed question";
    }
    return "unknown";
}

static std::shared_ptr<LogFileHandle> handle_for(const QueryLogConfig &cfg, std::shared_ptr<LogFileHandle> file) {
    if (file) return file;
    return std::make_shared<LogFileHandle>(cfg.log_file);
}

QueryLog::QueryLog(QueryLogConfig cfg, std::shared_ptr<LogFileHandle> file)
    : cfg_(cfg),
      enabled_(cfg.enabled),
      clock_(cfg.clock),
      buffer_cap_(cfg.buffer_size ? cfg.buffer_size : 1),
      store_(handle_for(cfg, std::move(file))),
      cache_(cfg.cache_size),
      top_(cfg.stats_hours, cfg.top_size)
{
    std::ostringstream os;
    os << "QueryLog: file=" << store_.path()
       << " enabled=" << (cfg.enabled ? "true" : "false")
       << " interval_hours=" << cfg.interval_hours
       << " stats_hours=" << cfg.stats_hours
       << " cache_size=" << cache_.capacity()
       << " buffer_size=" << buffer_cap_;
    safe_log(os.str());
}

QueryLog::~QueryLog() {
    try {
        stop();
    } catch (const std::exception &e) {
        safe_log_error(std::string("QueryLog: stop during destruction failed: ") + e.what());
    }
}

std::chrono::system_clock::time_point QueryLog::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

void QueryLog::fill_from_file() {
    uint32_t interval_hours, stats_hours;
    {
        std::lock_guard<std::mutex> lk(cfg_mu_);
        interval_hours = cfg_.interval_hours;
        stats_hours = cfg_.stats_hours;
    }
    const auto cache_window = std::chrono::hours(interval_hours);
    const auto window = std::chrono::hours(std::max(interval_hours, stats_hours));
    const auto t = now();
    const size_t keep = cache_.capacity();

    std::vector<LogEntry> recent;
    auto by_time = [](const LogEntry &a, const LogEntry &b) { return a.time < b.time; };

    auto on_entry = [&](const LogEntry &e) {
        if (e.question.empty()) {
            safe_log_debug("querylog: entry question is absent, skipping");
            return;
        }
        if (e.time > t) {
            safe_log_debug("querylog: entry is in the future, ignoring");
            return;
        }
        if (!extract_query_name(e.question)) {
            safe_log_debug("querylog: malformed dns message question, skipping");
            return;
        }
        top_.record_entry(e, t);
        if (t - e.time > cache_window) return;

        recent.push_back(e);
        // keep memory bounded on long histories: only the newest `keep` survive
        if (recent.size() >= keep * 4) {
            std::stable_sort(recent.begin(), recent.end(), by_time);
            recent.erase(recent.begin(), recent.end() - static_cast<std::ptrdiff_t>(keep));
        }
    };

    try {
        size_t n = store_.replay(window, on_entry, []{ return true; }, t);
        safe_log("querylog: replayed " + std::to_string(n) + " entries from " + store_.path());
    } catch (const std::exception &e) {
        safe_log_error(std::string("querylog: failed to load entries, starting with empty history: ") + e.what());
        recent.clear();
        top_.clear();
        return;
    }

    // files are read newest file first; the cache wants oldest first
    std::stable_sort(recent.begin(), recent.end(), by_time);
    cache_.load(recent);
}

void QueryLog::start() {
    QueryLogState expected = QueryLogState::Uninitialized;
    if (state_.load() != expected) {
        safe_log("QueryLog: start ignored, already started");
        return;
    }
    fill_from_file();
    state_.store(QueryLogState::Running);
    safe_log("QueryLog: running, " + std::to_string(cache_.size()) + " entries in memory");
}

void QueryLog::start_background() {
    std::chrono::milliseconds flush_every;
    {
        std::lock_guard<std::mutex> lk(cfg_mu_);
        flush_every = cfg_.flush_interval;
    }
    {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        if (background_) return;
        background_ = true;

        hour_task_ = std::make_unique<PeriodicTask>("hourly-top", std::chrono::hours(1), [this]{ rotate_hour(); });
        flush_task_ = std::make_unique<PeriodicTask>("flush", flush_every, [this]{ flush(true); });
        hour_task_->start();
        flush_task_->start();
    }
    restart_rotation_task();
}

void QueryLog::restart_rotation_task() {
    std::chrono::hours every;
    {
        std::lock_guard<std::mutex> lk(cfg_mu_);
        every = std::chrono::hours(cfg_.interval_hours);
    }
    std::unique_ptr<PeriodicTask> old;
    {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        if (!background_) return;
        old = std::move(rotate_task_);
        rotate_task_ = std::make_unique<PeriodicTask>("log-rotate", every, [this]{ rotate_log(); });
        rotate_task_->start();
    }
    // joined outside tasks_mu_
    if (old) old->stop();
}

void QueryLog::stop() {
    std::unique_ptr<PeriodicTask> hour, rotate, fl;
    {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        background_ = false;
        hour = std::move(hour_task_);
        rotate = std::move(rotate_task_);
        fl = std::move(flush_task_);
    }
    if (hour) hour->stop();
    if (rotate) rotate->stop();
    if (fl) fl->stop();

    {
        // ingest checks the state under the same lock, so nothing lands in
        // the buffer after this point
        std::lock_guard<std::mutex> lk(buffer_mu_);
        if (state_.load() != QueryLogState::Running) return;
        state_.store(QueryLogState::Stopped);
    }
    try {
        flush(true);
    } catch (const std::exception &e) {
        safe_log_error(std::string("querylog: final flush failed, ") + std::to_string(pending())
                       + " entries not saved: " + e.what());
    }
    safe_log("QueryLog: stopped");
}

IngestResult QueryLog::ingest(const LogEntry &e) {
    if (state_.load() != QueryLogState::Running) return IngestResult::NotRunning;
    if (!enabled_.load()) return IngestResult::Disabled;

    if (e.question.empty()) {
        safe_log_debug("querylog: entry question is absent, skipping");
        return IngestResult::MissingQuestion;
    }
    if (!extract_query_name(e.question)) {
        safe_log_debug("querylog: malformed dns message from " + e.client + ", skipping");
        return IngestResult::BadQuestion;
    }

    bool wake = false;
    {
        std::lock_guard<std::mutex> lk(buffer_mu_);
        if (state_.load() != QueryLogState::Running) return IngestResult::NotRunning;
        cache_.append(e);
        buffer_.push_back(e);
        if (buffer_.size() >= buffer_cap_ && !flush_pending_) {
            flush_pending_ = true;
            wake = true;
        }
    }
    if (wake) {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        if (flush_task_) flush_task_->trigger();
    }

    top_.record_entry(e, now());
    return IngestResult::Accepted;
}

void QueryLog::flush(bool full) {
    std::lock_guard<std::mutex> flk(flush_mu_);

    std::vector<LogEntry> batch;
    {
        std::lock_guard<std::mutex> lk(buffer_mu_);
        bool need = buffer_.size() >= buffer_cap_;
        if (!need && !full) return;
        batch.swap(buffer_);
        flush_pending_ = false;
    }
    if (batch.empty()) return;

    try {
        store_.append(batch);
    } catch (const std::exception &) {
        // keep for retry, ahead of anything that arrived meanwhile
        std::lock_guard<std::mutex> lk(buffer_mu_);
        batch.insert(batch.end(), std::make_move_iterator(buffer_.begin()), std::make_move_iterator(buffer_.end()));
        buffer_.swap(batch);
        throw;
    }
}

void QueryLog::rotate_log() {
    store_.rotate();
}

void QueryLog::rotate_hour() {
    top_.rotate_hour();
}

void QueryLog::configure(bool enabled, uint32_t interval_hours) {
    if (!check_interval_hours(interval_hours)) {
        throw ValidationError("unsupported interval " + std::to_string(interval_hours) + "h");
    }

    try {
        flush(true);
    } catch (const std::exception &e) {
        safe_log_error(std::string("querylog: flush before reconfigure failed: ") + e.what());
    }

    uint32_t old_interval;
    {
        std::lock_guard<std::mutex> lk(cfg_mu_);
        QueryLogConfig next = cfg_;
        next.enabled = enabled;
        next.interval_hours = interval_hours;
        save_settings(settings_path(next), next);
        old_interval = cfg_.interval_hours;
        cfg_ = next;
    }
    enabled_.store(enabled);
    safe_log("querylog: configured enabled=" + std::string(enabled ? "true" : "false")
             + " interval=" + std::to_string(interval_hours) + "h");

    if (old_interval != interval_hours) restart_rotation_task();
}

void QueryLog::set_stats_hours(uint32_t hours) {
    if (hours == 0 || hours > kMaxStatsHours) {
        throw ValidationError("stats retention must be between 1 and " + std::to_string(kMaxStatsHours)
                              + " hours, got " + std::to_string(hours));
    }
    std::lock_guard<std::mutex> lk(cfg_mu_);
    QueryLogConfig next = cfg_;
    next.stats_hours = hours;
    save_settings(settings_path(next), next);
    top_.resize(hours);
    cfg_ = next;
}

void QueryLog::clear() {
    std::lock_guard<std::mutex> flk(flush_mu_);
    {
        std::lock_guard<std::mutex> lk(buffer_mu_);
        buffer_.clear();
        flush_pending_ = false;
    }
    cache_.clear();
    store_.clear();
    safe_log("Query log was cleared");
}

std::vector<LogEntry> QueryLog::get_data() const {
    return cache_.snapshot();
}

QueryLogConfig QueryLog::get_config() const {
    std::lock_guard<std::mutex> lk(cfg_mu_);
    QueryLogConfig c = cfg_;
    c.enabled = enabled_.load();
    return c;
}

StatsTop QueryLog::top_stats(size_t hours) const noexcept {
    return top_.top_stats(hours);
}

StatsCounters QueryLog::counters() const noexcept {
    return top_.counters();
}

size_t QueryLog::pending() const {
    std::lock_guard<std::mutex> lk(buffer_mu_);
    return buffer_.size();
}
