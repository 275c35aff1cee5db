#include "rsi_engine.hpp"
#include "rsi.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string status_string(RsiStatus status) {
    switch (status) {
        case RsiStatus::Disabled: return "disabled";
        case RsiStatus::Rebuilding: return "rebuilding";
        case RsiStatus::Unavailable: return "unavailable";
        case RsiStatus::Available: return "available";
        default: return "unknown";
    }
}

RsiEngine::RsiEngine(StateStore& store,
                     std::shared_ptr<ChartSource> chart,
                     std::shared_ptr<Clock> clock,
                     std::shared_ptr<AlertSink> alerts,
                     AlertFormatter formatter,
                     int period)
    : store_(store)
    , chart_(std::move(chart))
    , clock_(std::move(clock))
    , alerts_(std::move(alerts))
    , formatter_(std::move(formatter))
    , period_(period)
    , series_(store.rsi_config().interval)
{
    reading_.interval = series_.interval();
    reading_.status = enabled() ? RsiStatus::Rebuilding : RsiStatus::Disabled;
    if (!enabled()) {
        spdlog::warn("No SolanaTracker API key, RSI disabled");
    }
}

void RsiEngine::reset_locked(RsiInterval interval) {
    series_.reset(interval);
    reading_.interval = interval;
    reading_.value.reset();
    reading_.candle_time.reset();
    reading_.status = enabled() ? RsiStatus::Rebuilding : RsiStatus::Disabled;
}

bool RsiEngine::set_interval(RsiInterval interval) {
    bool changed = store_.set_rsi_interval(interval);

    std::lock_guard<std::mutex> lock(mutex_);
    if (series_.interval() != interval) {
        reset_locked(interval);
        spdlog::info("RSI interval now {}, rebuilding series", interval_string(interval));
    }
    return changed;
}

RsiReading RsiEngine::reading() const {
    auto interval = store_.rsi_config().interval;

    std::lock_guard<std::mutex> lock(mutex_);
    if (reading_.interval == interval) {
        return reading_;
    }

    // Interval changed in the store; the series is rebuilt on the next refresh
    RsiReading pending;
    pending.status = enabled() ? RsiStatus::Rebuilding : RsiStatus::Disabled;
    pending.interval = interval;
    pending.updated_at = reading_.updated_at;
    return pending;
}

bool RsiEngine::condition_met(const RsiAlertKey& key, double rsi) {
    if (key.direction == RsiDirection::Above) {
        return rsi >= key.threshold();
    }
    return rsi <= key.threshold();
}

bool RsiEngine::refresh() {
    if (!enabled()) {
        return false;
    }

    auto interval = store_.rsi_config().interval;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (series_.interval() != interval) {
            reset_locked(interval);
            spdlog::info("RSI interval changed to {}, rebuilding series", interval_string(interval));
        }
    }

    auto candles = chart_->chart(store_.tracked_token(), interval);
    auto now = clock_->now();

    std::optional<double> value;
    std::optional<RsiCandle> latest;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (series_.interval() != interval) {
            // interval switched while fetching; this result belongs to the old series
            return false;
        }
        if (!candles) {
            reading_.status = RsiStatus::Unavailable;
            reading_.value.reset();
            reading_.candle_time.reset();
            spdlog::warn("RSI refresh skipped, chart unavailable");
            return false;
        }

        series_.merge(*candles, now);
        value = rsi::compute_latest(series_.closes(), period_);
        latest = series_.latest();

        if (!value || !latest) {
            reading_.status = RsiStatus::Rebuilding;
            reading_.value.reset();
            reading_.candle_time.reset();
            spdlog::info("RSI waiting for candles ({} of {} closed {} candles)",
                         series_.size(), period_ + 1, interval_string(interval));
            return false;
        }

        reading_.status = RsiStatus::Available;
        reading_.value = value;
        reading_.candle_time = latest->open_time;
        reading_.updated_at = now;
    }

    spdlog::info("RSI({}) {} = {:.2f} at {}", period_, interval_string(interval), *value,
                 util::format_iso8601(latest->open_time));

    apply(*value, latest->open_time);
    return true;
}

std::vector<RsiAlert> RsiEngine::apply(double rsi, TimePoint candle_time) {
    auto now = clock_->now();
    std::vector<RsiAlert> fired;
    RsiInterval interval = RsiInterval::FiveMinutes;

    store_.evaluate_rsi_alerts([&](RsiAlert& alert, const RsiConfig& config) {
        interval = config.interval;
        bool hit = condition_met(alert.key, rsi);
        if (!alert.triggered && hit) {
            alert.triggered = true;
            alert.last_triggered = now;
            fired.push_back(alert);
            return true;
        }
        if (alert.triggered && !hit && config.reset_enabled) {
            alert.triggered = false;
            spdlog::info("RSI alert {} re-armed at {:.2f}", alert.key.to_string(), rsi);
            return true;
        }
        return false;
    });

    for (const auto& alert : fired) {
        spdlog::info("RSI alert {} triggered at {:.2f}", alert.key.to_string(), rsi);
        if (alerts_) {
            alerts_->enqueue(formatter_.rsi_alert(alert, rsi, interval, candle_time));
        }
    }
    return fired;
}
