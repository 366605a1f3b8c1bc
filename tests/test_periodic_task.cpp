// tests/test_periodic_task.cpp
#include <iostream>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "../src/periodic_task.hpp"
#include "../src/util_log.hpp"

using namespace std::chrono_literals;

template<typename Pred>
static bool wait_until(Pred p, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (p()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return p();
}

int main() {
    set_log_file("");
    set_log_level(LogLevel::Error);

    // an hour-long interval only runs when triggered
    std::atomic<int> calls{0};
    PeriodicTask hourly("hourly", std::chrono::hours(1), [&]{ calls.fetch_add(1); });
    hourly.start();
    std::this_thread::sleep_for(50ms);
    if (calls.load() != 0) {
        std::cerr << "periodic_task: ran before its interval\n";
        return 1;
    }
    hourly.trigger();
    if (!wait_until([&]{ return calls.load() == 1; })) {
        std::cerr << "periodic_task: trigger did not run the task\n";
        return 2;
    }

    // stop returns promptly and joins
    auto t0 = std::chrono::steady_clock::now();
    hourly.stop();
    if (hourly.running() || std::chrono::steady_clock::now() - t0 > 1s) {
        std::cerr << "periodic_task: stop did not return promptly\n";
        return 3;
    }
    hourly.trigger();
    std::this_thread::sleep_for(20ms);
    if (calls.load() != 1) {
        std::cerr << "periodic_task: ran after stop\n";
        return 4;
    }

    // short interval ticks on its own; failures don't end the loop
    std::atomic<int> ticks{0};
    PeriodicTask flaky("flaky", 5ms, [&]{
        if (ticks.fetch_add(1) % 2 == 0) throw std::runtime_error("disk full");
    });
    flaky.start();
    if (!wait_until([&]{ return flaky.runs() >= 2 && flaky.failures() >= 2; })) {
        std::cerr << "periodic_task: loop stopped after a failure\n";
        return 5;
    }
    flaky.stop();

    std::cout << "test_periodic_task: OK\n";
    return 0;
}
