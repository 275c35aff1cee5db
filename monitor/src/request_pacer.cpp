#include "request_pacer.hpp"
#include <spdlog/spdlog.h>

RequestPacer::RequestPacer(std::shared_ptr<Clock> clock, std::chrono::milliseconds min_spacing)
    : clock_(std::move(clock))
    , min_spacing_(min_spacing)
{}

void RequestPacer::wait() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (last_call_) {
        auto since = std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - *last_call_);
        if (since < min_spacing_) {
            auto remaining = min_spacing_ - since;
            spdlog::debug("Pacing outbound request for {} ms", remaining.count());
            clock_->sleep_for(remaining);
        }
    }
    last_call_ = clock_->now();
}
