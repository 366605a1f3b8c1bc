#include "periodic_task.hpp"
#include "util_log.hpp"

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {
    if (interval_.count() <= 0) interval_ = std::chrono::milliseconds(1);
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_.load()) return;
    stop_requested_ = false;
    triggered_ = false;
    running_.store(true);
    thread_ = std::thread([this]{ this->loop(); });
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_.load()) return;
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    running_.store(false);
}

void PeriodicTask::trigger() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        triggered_ = true;
    }
    cv_.notify_all();
}

void PeriodicTask::loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait_for(lk, interval_, [this]{ return stop_requested_ || triggered_; });
            if (stop_requested_) break;
            triggered_ = false;
        }
        try {
            fn_();
            runs_.fetch_add(1);
        } catch (const std::exception &e) {
            failures_.fetch_add(1);
            safe_log_error("task " + name_ + ": " + e.what() + "; retrying on next tick");
        }
    }
    safe_log_debug("task " + name_ + " stopped");
}
