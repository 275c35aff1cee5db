#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "formatter.hpp"
#include "notifier.hpp"
#include "state_store.hpp"
#include <memory>
#include <vector>

// Fires buy/sell price alerts with the global reset cooldown.
class ThresholdEngine {
public:
    ThresholdEngine(StateStore& store,
                    std::shared_ptr<Clock> clock,
                    std::shared_ptr<AlertSink> alerts,
                    AlertFormatter formatter);

    // Evaluates every threshold against the sample and returns those that fired.
    std::vector<PriceThreshold> evaluate(const PriceSample& sample);

    // Buy: price at or below the level. Sell: price at or above.
    static bool condition_met(const PriceThreshold& threshold, const PriceSample& sample);

    // An untriggered threshold is always armed. A triggered one re-arms only
    // when reset_minutes > 0 and that many minutes have passed.
    static bool should_fire(const PriceThreshold& threshold, int reset_minutes, TimePoint now);

private:
    StateStore& store_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<AlertSink> alerts_;
    AlertFormatter formatter_;
};
