#pragma once

#include <chrono>
#include <thread>

// Source of wall-clock instants for trigger bookkeeping and pacing.
class Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};
