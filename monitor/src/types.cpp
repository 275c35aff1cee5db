#include "types.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <cmath>

std::string side_string(Side side) {
    switch (side) {
        case Side::Buy: return "buy";
        case Side::Sell: return "sell";
        default: return "unknown";
    }
}

ThresholdKey ThresholdKey::from_value(Side side, double value) {
    return ThresholdKey{side, std::llround(value * static_cast<double>(kScale))};
}

double ThresholdKey::value() const {
    return static_cast<double>(units) / static_cast<double>(kScale);
}

std::string ThresholdKey::value_string() const {
    return fmt::format("{:.8f}", value());
}

std::string ThresholdKey::to_string() const {
    return side_string(side) + ":" + value_string();
}

std::string direction_string(RsiDirection direction) {
    return direction == RsiDirection::Above ? "above" : "below";
}

RsiAlertKey RsiAlertKey::make(RsiDirection direction, double threshold) {
    if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 100.0) {
        throw InvalidInput(fmt::format("RSI threshold out of range: {}", threshold));
    }
    return RsiAlertKey{direction, std::llround(threshold * 100.0)};
}

RsiAlertKey RsiAlertKey::parse(const std::string& text) {
    auto sep = text.find(':');
    if (sep == std::string::npos) {
        throw InvalidInput("Invalid RSI alert format: " + text);
    }

    auto direction_text = util::to_lower(util::trim(text.substr(0, sep)));
    RsiDirection direction;
    if (direction_text == "above") {
        direction = RsiDirection::Above;
    } else if (direction_text == "below") {
        direction = RsiDirection::Below;
    } else {
        throw InvalidInput("Invalid RSI alert direction: " + text);
    }

    auto value_text = util::trim(text.substr(sep + 1));
    double threshold = 0.0;
    try {
        size_t consumed = 0;
        threshold = std::stod(value_text, &consumed);
        if (consumed != value_text.size()) {
            throw InvalidInput("Invalid RSI alert threshold: " + text);
        }
    } catch (const std::logic_error&) {
        throw InvalidInput("Invalid RSI alert threshold: " + text);
    }

    return make(direction, threshold);
}

double RsiAlertKey::threshold() const {
    return static_cast<double>(hundredths) / 100.0;
}

std::string RsiAlertKey::to_string() const {
    return fmt::format("{}:{:.2f}", direction_string(direction), threshold());
}

std::string interval_string(RsiInterval interval) {
    switch (interval) {
        case RsiInterval::OneSecond: return "1s";
        case RsiInterval::OneMinute: return "1m";
        case RsiInterval::FiveMinutes: return "5m";
        case RsiInterval::FifteenMinutes: return "15m";
        case RsiInterval::OneHour: return "1h";
        case RsiInterval::FourHours: return "4h";
        default: return "5m";
    }
}

std::optional<RsiInterval> parse_interval(const std::string& text) {
    auto lowered = util::to_lower(util::trim(text));
    if (lowered == "1s") return RsiInterval::OneSecond;
    if (lowered == "1m") return RsiInterval::OneMinute;
    if (lowered == "5m") return RsiInterval::FiveMinutes;
    if (lowered == "15m") return RsiInterval::FifteenMinutes;
    if (lowered == "1h") return RsiInterval::OneHour;
    if (lowered == "4h") return RsiInterval::FourHours;
    return std::nullopt;
}

std::chrono::seconds interval_width(RsiInterval interval) {
    switch (interval) {
        case RsiInterval::OneSecond: return std::chrono::seconds(1);
        case RsiInterval::OneMinute: return std::chrono::seconds(60);
        case RsiInterval::FiveMinutes: return std::chrono::seconds(300);
        case RsiInterval::FifteenMinutes: return std::chrono::seconds(900);
        case RsiInterval::OneHour: return std::chrono::seconds(3600);
        case RsiInterval::FourHours: return std::chrono::seconds(14400);
        default: return std::chrono::seconds(300);
    }
}

nlohmann::json time_to_json(const std::optional<TimePoint>& tp) {
    if (!tp) return nullptr;
    return util::format_iso8601(*tp);
}

std::optional<TimePoint> time_from_json(const nlohmann::json& j) {
    if (!j.is_string()) return std::nullopt;
    return util::parse_iso8601(j.get<std::string>());
}

void to_json(nlohmann::json& j, const PriceSample& sample) {
    j = {
        {"timestamp", util::format_iso8601(sample.timestamp)},
        {"buy_price", sample.buy_price},
        {"sell_price", sample.sell_price}
    };
}

void from_json(const nlohmann::json& j, PriceSample& sample) {
    auto ts = time_from_json(j.at("timestamp"));
    if (!ts) {
        throw std::runtime_error("Unparseable sample timestamp");
    }
    sample.timestamp = *ts;
    sample.buy_price = j.at("buy_price").get<double>();
    sample.sell_price = j.at("sell_price").get<double>();
}

void to_json(nlohmann::json& j, const WalletPnlRecord& record) {
    j = {
        {"wallet", record.wallet},
        {"holding", record.holding},
        {"realized", record.realized},
        {"unrealized", record.unrealized},
        {"current_value", record.current_value},
        {"cost_basis", record.cost_basis},
        {"last_trade_time", time_to_json(record.last_trade_time)},
        {"fetched_at", util::format_iso8601(record.fetched_at)}
    };
}

void from_json(const nlohmann::json& j, WalletPnlRecord& record) {
    record.wallet = j.at("wallet").get<std::string>();
    record.holding = j.value("holding", 0.0);
    record.realized = j.value("realized", 0.0);
    record.unrealized = j.value("unrealized", 0.0);
    record.current_value = j.value("current_value", 0.0);
    record.cost_basis = j.value("cost_basis", 0.0);
    record.last_trade_time = time_from_json(j.value("last_trade_time", nlohmann::json()));
    record.fetched_at = time_from_json(j.value("fetched_at", nlohmann::json())).value_or(TimePoint{});
}

void to_json(nlohmann::json& j, const AggregatePnl& aggregate) {
    j = {
        {"holding", aggregate.holding},
        {"realized", aggregate.realized},
        {"unrealized", aggregate.unrealized},
        {"current_value", aggregate.current_value},
        {"cost_basis", aggregate.cost_basis},
        {"last_trade_time", time_to_json(aggregate.last_trade_time)},
        {"failed_wallets", aggregate.failed_wallets},
        {"stale_wallets", aggregate.stale_wallets},
        {"stale_count", aggregate.stale_count}
    };
}

void from_json(const nlohmann::json& j, AggregatePnl& aggregate) {
    aggregate.holding = j.value("holding", 0.0);
    aggregate.realized = j.value("realized", 0.0);
    aggregate.unrealized = j.value("unrealized", 0.0);
    aggregate.current_value = j.value("current_value", 0.0);
    aggregate.cost_basis = j.value("cost_basis", 0.0);
    aggregate.last_trade_time = time_from_json(j.value("last_trade_time", nlohmann::json()));
    aggregate.failed_wallets = j.value("failed_wallets", std::vector<std::string>{});
    aggregate.stale_wallets = j.value("stale_wallets", std::vector<std::string>{});
    aggregate.stale_count = j.value("stale_count", 0);
}

void to_json(nlohmann::json& j, const PnlSnapshot& snapshot) {
    j = {
        {"run_at", util::format_iso8601(snapshot.run_at)},
        {"wallets", snapshot.records},
        {"aggregate", snapshot.aggregate}
    };
}

void from_json(const nlohmann::json& j, PnlSnapshot& snapshot) {
    snapshot.run_at = time_from_json(j.at("run_at")).value_or(TimePoint{});
    snapshot.records = j.value("wallets", std::vector<WalletPnlRecord>{});
    snapshot.aggregate = j.value("aggregate", AggregatePnl{});
}
