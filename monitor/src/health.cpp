#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(const std::string& service_name,
                         std::shared_ptr<RedisBus> redis,
                         const StateStore& store,
                         const RsiEngine& rsi,
                         const PnlAggregator& pnl,
                         const AlertDispatcher& dispatcher)
    : service_name_(service_name)
    , redis_(redis)
    , store_(store)
    , rsi_(rsi)
    , pnl_(pnl)
    , dispatcher_(dispatcher)
{}

bool HealthCheck::redis_ok() const {
    return redis_ && redis_->ping();
}

nlohmann::json HealthCheck::get_status() const {
    bool redis_up = redis_ok();

    auto reading = rsi_.reading();
    auto history = store_.price_history();

    // Only a current reading carries a value
    bool current = reading.status == RsiStatus::Available && reading.value;
    nlohmann::json rsi = {
        {"status", status_string(reading.status)},
        {"value", current ? nlohmann::json(*reading.value) : nlohmann::json(nullptr)},
        {"interval", interval_string(reading.interval)}
    };

    nlohmann::json pnl = {
        {"status", pnl_.enabled() ? "enabled" : "disabled"},
        {"running", pnl_.running()},
        {"last_run", time_to_json(pnl_.last_run())}
    };

    nlohmann::json price = {
        {"samples", history.size()},
        {"last_sample_ts", history.empty() ? nlohmann::json(nullptr)
                                           : nlohmann::json(util::format_iso8601(history.back().timestamp))}
    };

    nlohmann::json status = {
        {"service", service_name_},
        {"ok", redis_up},
        {"redis", redis_up},
        {"rsi", rsi},
        {"pnl", pnl},
        {"price", price},
        {"notifications", {
            {"delivered", dispatcher_.delivered_count()},
            {"failed", dispatcher_.failed_count()}
        }}
    };

    return status;
}

bool HealthCheck::is_healthy() const {
    return redis_ok();
}
