#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

struct PriceSample {
    TimePoint timestamp;
    double buy_price;
    double sell_price;
};

enum class Side {
    Buy,
    Sell
};

std::string side_string(Side side);

// Threshold price stored as an integer count of 1e-8 units so that keys compare exactly.
struct ThresholdKey {
    static constexpr int kDigits = 8;
    static constexpr int64_t kScale = 100000000;

    Side side;
    int64_t units;

    static ThresholdKey from_value(Side side, double value);

    double value() const;
    std::string value_string() const;
    std::string to_string() const;

    bool operator==(const ThresholdKey& other) const {
        return side == other.side && units == other.units;
    }
    bool operator!=(const ThresholdKey& other) const { return !(*this == other); }
    bool operator<(const ThresholdKey& other) const {
        if (side != other.side) return side < other.side;
        return units < other.units;
    }
};

struct PriceThreshold {
    ThresholdKey key;
    std::optional<TimePoint> last_triggered;

    double value() const { return key.value(); }
};

enum class RsiDirection {
    Above,
    Below
};

std::string direction_string(RsiDirection direction);

// "above:70.00" style key; threshold kept in hundredths.
struct RsiAlertKey {
    RsiDirection direction;
    int64_t hundredths;

    static RsiAlertKey make(RsiDirection direction, double threshold);
    static RsiAlertKey parse(const std::string& text);

    double threshold() const;
    std::string to_string() const;

    bool operator==(const RsiAlertKey& other) const {
        return direction == other.direction && hundredths == other.hundredths;
    }
    bool operator!=(const RsiAlertKey& other) const { return !(*this == other); }
    bool operator<(const RsiAlertKey& other) const {
        if (direction != other.direction) return direction < other.direction;
        return hundredths < other.hundredths;
    }
};

struct RsiAlert {
    RsiAlertKey key;
    bool triggered = false;
    std::optional<TimePoint> last_triggered;
};

enum class RsiInterval {
    OneSecond,
    OneMinute,
    FiveMinutes,
    FifteenMinutes,
    OneHour,
    FourHours
};

std::string interval_string(RsiInterval interval);
std::optional<RsiInterval> parse_interval(const std::string& text);
std::chrono::seconds interval_width(RsiInterval interval);

struct RsiConfig {
    RsiInterval interval = RsiInterval::FiveMinutes;
    bool reset_enabled = false;
};

struct RsiCandle {
    TimePoint open_time;
    double close;
};

struct WalletPnlRecord {
    std::string wallet;
    double holding = 0.0;
    double realized = 0.0;
    double unrealized = 0.0;
    double current_value = 0.0;
    double cost_basis = 0.0;
    std::optional<TimePoint> last_trade_time;
    TimePoint fetched_at;
};

struct AggregatePnl {
    double holding = 0.0;
    double realized = 0.0;
    double unrealized = 0.0;
    double current_value = 0.0;
    double cost_basis = 0.0;
    std::optional<TimePoint> last_trade_time;
    std::vector<std::string> failed_wallets;
    std::vector<std::string> stale_wallets;
    int stale_count = 0;
};

struct PnlSnapshot {
    TimePoint run_at;
    std::vector<WalletPnlRecord> records;
    AggregatePnl aggregate;
};

// JSON mapping used for persistence and the health payload
void to_json(nlohmann::json& j, const PriceSample& sample);
void from_json(const nlohmann::json& j, PriceSample& sample);
void to_json(nlohmann::json& j, const WalletPnlRecord& record);
void from_json(const nlohmann::json& j, WalletPnlRecord& record);
void to_json(nlohmann::json& j, const AggregatePnl& aggregate);
void from_json(const nlohmann::json& j, AggregatePnl& aggregate);
void to_json(nlohmann::json& j, const PnlSnapshot& snapshot);
void from_json(const nlohmann::json& j, PnlSnapshot& snapshot);

nlohmann::json time_to_json(const std::optional<TimePoint>& tp);
std::optional<TimePoint> time_from_json(const nlohmann::json& j);
