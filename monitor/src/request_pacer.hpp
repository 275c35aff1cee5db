#pragma once

#include "clock.hpp"
#include <memory>
#include <mutex>
#include <chrono>
#include <optional>

// Enforces a minimum gap between outbound calls shared by every caller.
// Blocks the caller until the gap has elapsed.
class RequestPacer {
public:
    RequestPacer(std::shared_ptr<Clock> clock, std::chrono::milliseconds min_spacing);

    void wait();

private:
    std::shared_ptr<Clock> clock_;
    std::chrono::milliseconds min_spacing_;

    std::mutex mutex_;
    std::optional<Clock::TimePoint> last_call_;
};
