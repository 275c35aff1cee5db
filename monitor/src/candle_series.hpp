#pragma once

#include "types.hpp"
#include <vector>
#include <map>

// Closed candles for one interval, ordered by open time.
class CandleSeries {
public:
    explicit CandleSeries(RsiInterval interval, size_t max_candles = 2000);

    RsiInterval interval() const { return interval_; }

    // Discards everything and switches to a new interval.
    void reset(RsiInterval interval);

    // Merges fetched candles, keeping only those closed at `now`. A candle with
    // an open time already present replaces the old one. Returns the number
    // of candles added.
    size_t merge(const std::vector<RsiCandle>& candles, TimePoint now);

    bool is_closed(const RsiCandle& candle, TimePoint now) const;

    std::vector<double> closes() const;
    std::optional<RsiCandle> latest() const;
    size_t size() const { return candles_.size(); }
    bool empty() const { return candles_.empty(); }

private:
    RsiInterval interval_;
    size_t max_candles_;
    std::map<TimePoint, double> candles_;

    TimePoint bucket_start(TimePoint t) const;
};
