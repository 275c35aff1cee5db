#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "jupiter_client.hpp"
#include "state_store.hpp"
#include "threshold_engine.hpp"
#include <memory>
#include <optional>
#include <atomic>
#include <string>

struct QuoteAsset {
    std::string mint;
    int decimals = 6;
};

// Prices the tracked token with a forward and a reverse swap quote so that
// both prices include live price impact.
class PriceSampler {
public:
    PriceSampler(StateStore& store,
                 std::shared_ptr<QuoteSource> quotes,
                 std::shared_ptr<Clock> clock,
                 ThresholdEngine& thresholds,
                 QuoteAsset input,
                 int output_decimals);

    // Quotes both legs. Empty when either leg fails.
    std::optional<PriceSample> sample_once();

    // One scheduler tick: sample, record, evaluate. Returns false when skipped.
    bool tick();

    int skipped_count() const { return skipped_; }

    static uint64_t to_atomic(double amount, int decimals);
    static double from_atomic(uint64_t amount, int decimals);

private:
    StateStore& store_;
    std::shared_ptr<QuoteSource> quotes_;
    std::shared_ptr<Clock> clock_;
    ThresholdEngine& thresholds_;
    QuoteAsset input_;
    int output_decimals_;

    std::atomic<int> skipped_{0};
};
