#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Runs `fn` every `interval` on its own thread until stop(). trigger() runs it
// early. An exception from `fn` is logged and the loop goes on with the next tick.
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    // Joins the thread; the callback is not running when this returns.
    void stop();
    void trigger();

    bool running() const noexcept { return running_.load(); }
    uint64_t runs() const noexcept { return runs_.load(); }
    uint64_t failures() const noexcept { return failures_.load(); }

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> fn_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool triggered_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0}, failures_{0};
    std::thread thread_;
};
