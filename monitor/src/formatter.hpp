#pragma once

#include "notifier.hpp"
#include "types.hpp"
#include <string>

class AlertFormatter {
public:
    explicit AlertFormatter(const std::string& display_zone = "UTC");

    Notification price_alert(const PriceThreshold& threshold, const PriceSample& sample) const;
    Notification rsi_alert(const RsiAlert& alert, double rsi, RsiInterval interval,
                           TimePoint candle_time) const;

private:
    std::string display_zone_;
};
