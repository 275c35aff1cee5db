#include "periodic_task.hpp"
#include <spdlog/spdlog.h>

PeriodicTask::PeriodicTask(const std::string& name,
                           std::chrono::milliseconds period,
                           std::function<void()> fn)
    : name_(name)
    , period_(period)
    , fn_(std::move(fn))
{}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_) {
        spdlog::warn("Task {} already running", name_);
        return;
    }

    running_ = true;
    thread_ = std::thread(&PeriodicTask::loop, this);
    spdlog::info("Task {} started (every {} ms)", name_, period_.count());
}

void PeriodicTask::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("Task {} stopped", name_);
}

bool PeriodicTask::run_once() {
    ticks_++;
    try {
        fn_();
        return true;
    } catch (const std::exception& e) {
        errors_++;
        spdlog::error("Task {} tick failed: {}", name_, e.what());
        return false;
    }
}

void PeriodicTask::loop() {
    while (running_) {
        auto tick_start = std::chrono::steady_clock::now();

        run_once();

        auto deadline = tick_start + period_;
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return !running_; });
    }
}
