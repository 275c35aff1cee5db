#include "threshold_engine.hpp"
#include <spdlog/spdlog.h>

ThresholdEngine::ThresholdEngine(StateStore& store,
                                 std::shared_ptr<Clock> clock,
                                 std::shared_ptr<AlertSink> alerts,
                                 AlertFormatter formatter)
    : store_(store)
    , clock_(std::move(clock))
    , alerts_(std::move(alerts))
    , formatter_(std::move(formatter))
{}

bool ThresholdEngine::condition_met(const PriceThreshold& threshold, const PriceSample& sample) {
    if (threshold.key.side == Side::Buy) {
        return sample.buy_price <= threshold.value();
    }
    return sample.sell_price >= threshold.value();
}

bool ThresholdEngine::should_fire(const PriceThreshold& threshold, int reset_minutes, TimePoint now) {
    if (!threshold.last_triggered) {
        return true;
    }
    if (reset_minutes <= 0) {
        return false;
    }
    return now - *threshold.last_triggered >= std::chrono::minutes(reset_minutes);
}

std::vector<PriceThreshold> ThresholdEngine::evaluate(const PriceSample& sample) {
    auto now = clock_->now();

    auto fired = store_.evaluate_thresholds([&](PriceThreshold& threshold, int reset_minutes) {
        if (!condition_met(threshold, sample)) {
            return false;
        }
        if (!should_fire(threshold, reset_minutes, now)) {
            spdlog::debug("{} threshold {} still cooling down",
                          side_string(threshold.key.side), threshold.key.value_string());
            return false;
        }
        threshold.last_triggered = now;
        return true;
    });

    for (const auto& threshold : fired) {
        spdlog::info("{} threshold {} triggered (buy={:.8f} sell={:.8f})",
                     side_string(threshold.key.side), threshold.key.value_string(),
                     sample.buy_price, sample.sell_price);
        if (alerts_) {
            alerts_->enqueue(formatter_.price_alert(threshold, sample));
        }
    }
    return fired;
}
