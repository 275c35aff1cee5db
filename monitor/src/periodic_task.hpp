#pragma once

#include <string>
#include <functional>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

// Runs a function on a fixed period on its own thread. A tick that throws is
// logged and the schedule continues.
class PeriodicTask {
public:
    PeriodicTask(const std::string& name,
                 std::chrono::milliseconds period,
                 std::function<void()> fn);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Runs one tick on the calling thread.
    bool run_once();

    int tick_count() const { return ticks_; }
    int error_count() const { return errors_; }

private:
    std::string name_;
    std::chrono::milliseconds period_;
    std::function<void()> fn_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::atomic<int> ticks_{0};
    std::atomic<int> errors_{0};

    void loop();
};
