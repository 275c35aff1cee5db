#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "candle_series.hpp"
#include "formatter.hpp"
#include "notifier.hpp"
#include "solana_tracker_client.hpp"
#include "state_store.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class RsiStatus {
    Disabled,     // no chart API key
    Rebuilding,   // not enough closed candles for the current interval yet
    Unavailable,  // last refresh failed
    Available
};

std::string status_string(RsiStatus status);

struct RsiReading {
    RsiStatus status;
    RsiInterval interval;
    std::optional<double> value;
    std::optional<TimePoint> candle_time;
    std::optional<TimePoint> updated_at;
};

class RsiEngine {
public:
    // chart may be null, in which case the engine stays disabled.
    RsiEngine(StateStore& store,
              std::shared_ptr<ChartSource> chart,
              std::shared_ptr<Clock> clock,
              std::shared_ptr<AlertSink> alerts,
              AlertFormatter formatter,
              int period = 14);

    bool enabled() const { return chart_ != nullptr; }

    // One refresh cycle. Returns true when a new value was published.
    bool refresh();

    // Changes the interval and drops the series built for the old one.
    bool set_interval(RsiInterval interval);

    RsiReading reading() const;

    // Applies one RSI value to every alert and returns the alerts that fired.
    std::vector<RsiAlert> apply(double rsi, TimePoint candle_time);

    static bool condition_met(const RsiAlertKey& key, double rsi);

private:
    StateStore& store_;
    std::shared_ptr<ChartSource> chart_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<AlertSink> alerts_;
    AlertFormatter formatter_;
    int period_;

    mutable std::mutex mutex_;
    CandleSeries series_;
    RsiReading reading_;

    void reset_locked(RsiInterval interval);
};
