#include "formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>

AlertFormatter::AlertFormatter(const std::string& display_zone) : display_zone_(display_zone) {}

Notification AlertFormatter::price_alert(const PriceThreshold& threshold,
                                         const PriceSample& sample) const {
    Notification n;
    n.kind = "price";

    bool buy = threshold.key.side == Side::Buy;
    double price = buy ? sample.buy_price : sample.sell_price;

    n.title = buy ? "Buy Price Alert" : "Sell Price Alert";
    n.message = fmt::format("{} price ${:.8f} is {} target ${}\n{}",
                            buy ? "Buy" : "Sell",
                            price,
                            buy ? "≤" : "≥",
                            threshold.key.value_string(),
                            util::format_display(sample.timestamp, display_zone_));

    n.meta = {
        {"type", "price"},
        {"side", side_string(threshold.key.side)},
        {"threshold", threshold.value()},
        {"price", price},
        {"ts", util::format_iso8601(sample.timestamp)}
    };
    return n;
}

Notification AlertFormatter::rsi_alert(const RsiAlert& alert, double rsi, RsiInterval interval,
                                       TimePoint candle_time) const {
    Notification n;
    n.kind = "rsi";

    n.title = fmt::format("RSI Alert ({})", interval_string(interval));
    n.message = fmt::format("RSI {:.2f} is {} {:.2f} on the {} chart\nCandle: {}",
                            rsi,
                            direction_string(alert.key.direction),
                            alert.key.threshold(),
                            interval_string(interval),
                            util::format_display(candle_time, display_zone_));

    n.meta = {
        {"type", "rsi"},
        {"key", alert.key.to_string()},
        {"rsi", rsi},
        {"interval", interval_string(interval)},
        {"ts", util::format_iso8601(candle_time)}
    };
    return n;
}
