#include "candle_series.hpp"

CandleSeries::CandleSeries(RsiInterval interval, size_t max_candles)
    : interval_(interval)
    , max_candles_(max_candles)
{}

void CandleSeries::reset(RsiInterval interval) {
    interval_ = interval;
    candles_.clear();
}

TimePoint CandleSeries::bucket_start(TimePoint t) const {
    auto width = std::chrono::duration_cast<std::chrono::seconds>(interval_width(interval_)).count();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    auto start = (secs / width) * width;
    return TimePoint(std::chrono::seconds(start));
}

bool CandleSeries::is_closed(const RsiCandle& candle, TimePoint now) const {
    return bucket_start(candle.open_time) + interval_width(interval_) <= now;
}

size_t CandleSeries::merge(const std::vector<RsiCandle>& candles, TimePoint now) {
    size_t added = 0;
    for (const auto& candle : candles) {
        if (!is_closed(candle, now)) {
            continue;
        }
        auto start = bucket_start(candle.open_time);
        if (candles_.find(start) == candles_.end()) {
            added++;
        }
        candles_[start] = candle.close;
    }

    while (candles_.size() > max_candles_) {
        candles_.erase(candles_.begin());
    }
    return added;
}

std::vector<double> CandleSeries::closes() const {
    std::vector<double> out;
    out.reserve(candles_.size());
    for (const auto& [open_time, close] : candles_) {
        out.push_back(close);
    }
    return out;
}

std::optional<RsiCandle> CandleSeries::latest() const {
    if (candles_.empty()) {
        return std::nullopt;
    }
    auto it = candles_.rbegin();
    return RsiCandle{it->first, it->second};
}
