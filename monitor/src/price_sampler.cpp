#include "price_sampler.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

PriceSampler::PriceSampler(StateStore& store,
                           std::shared_ptr<QuoteSource> quotes,
                           std::shared_ptr<Clock> clock,
                           ThresholdEngine& thresholds,
                           QuoteAsset input,
                           int output_decimals)
    : store_(store)
    , quotes_(std::move(quotes))
    , clock_(std::move(clock))
    , thresholds_(thresholds)
    , input_(std::move(input))
    , output_decimals_(output_decimals)
{}

uint64_t PriceSampler::to_atomic(double amount, int decimals) {
    if (!std::isfinite(amount) || amount <= 0.0) return 0;
    return static_cast<uint64_t>(std::llround(amount * std::pow(10.0, decimals)));
}

double PriceSampler::from_atomic(uint64_t amount, int decimals) {
    return static_cast<double>(amount) / std::pow(10.0, decimals);
}

std::optional<PriceSample> PriceSampler::sample_once() {
    std::string token = store_.tracked_token();
    double usd_amount = store_.usd_amount();

    uint64_t usd_atomic = to_atomic(usd_amount, input_.decimals);
    if (usd_atomic == 0) {
        spdlog::warn("Notional ${} is too small to quote", usd_amount);
        return std::nullopt;
    }

    auto forward = quotes_->quote(input_.mint, token, usd_atomic);
    if (!forward) {
        spdlog::warn("Could not fetch {} -> {} quote",
                     util::short_address(input_.mint), util::short_address(token));
        return std::nullopt;
    }

    auto reverse = quotes_->quote(token, input_.mint, forward->out_amount);
    if (!reverse) {
        spdlog::warn("Could not fetch {} -> {} quote",
                     util::short_address(token), util::short_address(input_.mint));
        return std::nullopt;
    }

    double tokens_received = from_atomic(forward->out_amount, output_decimals_);
    double usd_returned = from_atomic(reverse->out_amount, input_.decimals);
    if (tokens_received <= 0.0) {
        return std::nullopt;
    }

    PriceSample sample;
    sample.timestamp = clock_->now();
    sample.buy_price = usd_amount / tokens_received;
    sample.sell_price = usd_returned / tokens_received;

    spdlog::info("Price check: buy ${:.8f} sell ${:.8f} ({:.8f} tokens for ${}, impact {:.4f}%)",
                 sample.buy_price, sample.sell_price, tokens_received, usd_amount,
                 forward->price_impact_pct);
    return sample;
}

bool PriceSampler::tick() {
    auto sample = sample_once();
    if (!sample) {
        skipped_++;
        return false;
    }

    store_.append_price(*sample);
    thresholds_.evaluate(*sample);
    return true;
}
