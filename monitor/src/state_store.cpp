#include "state_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace {
constexpr const char* kConfigDocument = "config";
constexpr const char* kRuntimeDocument = "runtime";
}

nlohmann::json StateSnapshot::to_json() const {
    nlohmann::json buy = nlohmann::json::array();
    nlohmann::json sell = nlohmann::json::array();
    nlohmann::json triggered_buy = nlohmann::json::object();
    nlohmann::json triggered_sell = nlohmann::json::object();

    for (const auto& t : thresholds) {
        auto& list = t.key.side == Side::Buy ? buy : sell;
        auto& triggered = t.key.side == Side::Buy ? triggered_buy : triggered_sell;
        list.push_back(t.value());
        if (t.last_triggered) {
            triggered[t.key.value_string()] = util::format_iso8601(*t.last_triggered);
        }
    }

    nlohmann::json alerts = nlohmann::json::object();
    for (const auto& alert : rsi_alerts) {
        alerts[alert.key.to_string()] = {
            {"triggered", alert.triggered},
            {"last_triggered", time_to_json(alert.last_triggered)}
        };
    }

    nlohmann::json j = {
        {"tracked_token", tracked_token},
        {"usd_amount", usd_amount},
        {"alert_reset_minutes", reset_minutes},
        {"buy_alerts", buy},
        {"sell_alerts", sell},
        {"last_triggered_buy", triggered_buy},
        {"last_triggered_sell", triggered_sell},
        {"latest_prices", price_history},
        {"wallets", wallets},
        {"rsi_interval", interval_string(rsi_config.interval)},
        {"rsi_reset_enabled", rsi_config.reset_enabled},
        {"rsi_alerts", alerts},
        {"pnl", nullptr}
    };
    if (pnl) {
        j["pnl"] = *pnl;
    }
    return j;
}

StateStore::StateStore(std::shared_ptr<DocumentStore> persistence, StateDefaults defaults)
    : persistence_(std::move(persistence))
    , defaults_(std::move(defaults))
    , usd_amount_(defaults_.usd_amount)
    , reset_minutes_(defaults_.reset_minutes)
{}

void StateStore::load() {
    std::vector<PendingWrite> writes;
    std::unique_lock<std::mutex> lock(mutex_);

    std::optional<nlohmann::json> config_doc;
    std::optional<nlohmann::json> runtime_doc;
    if (persistence_) {
        config_doc = persistence_->load(kConfigDocument);
        runtime_doc = persistence_->load(kRuntimeDocument);
    }

    apply_defaults_locked();

    if (config_doc) {
        try {
            apply_config_locked(*config_doc);
            spdlog::info("Loaded persisted configuration");
        } catch (const std::exception& e) {
            spdlog::warn("Persisted configuration unreadable, using defaults: {}", e.what());
            apply_defaults_locked();
        }
    } else {
        spdlog::info("No persisted configuration, seeding from environment defaults");
    }

    if (runtime_doc) {
        try {
            apply_runtime_locked(*runtime_doc);
            spdlog::info("Loaded persisted runtime state ({} samples)", history_.size());
        } catch (const std::exception& e) {
            spdlog::warn("Persisted runtime state unreadable, starting fresh: {}", e.what());
            history_.clear();
            pnl_.reset();
        }
    }

    writes.push_back(stage_config_locked());
    writes.push_back(stage_runtime_locked());
    lock.unlock();
    persist(writes);
}

void StateStore::apply_defaults_locked() {
    usd_amount_ = defaults_.usd_amount;
    reset_minutes_ = defaults_.reset_minutes;
    rsi_config_ = defaults_.rsi_config;

    thresholds_.clear();
    for (double v : defaults_.buy_thresholds) {
        if (!std::isfinite(v) || v <= 0.0) continue;
        auto key = ThresholdKey::from_value(Side::Buy, v);
        thresholds_.emplace(key, PriceThreshold{key, std::nullopt});
    }
    for (double v : defaults_.sell_thresholds) {
        if (!std::isfinite(v) || v <= 0.0) continue;
        auto key = ThresholdKey::from_value(Side::Sell, v);
        thresholds_.emplace(key, PriceThreshold{key, std::nullopt});
    }

    rsi_alerts_.clear();
    for (const auto& entry : defaults_.rsi_alerts) {
        try {
            auto key = RsiAlertKey::parse(entry);
            rsi_alerts_.emplace(key, RsiAlert{key, false, std::nullopt});
        } catch (const InvalidInput& e) {
            spdlog::warn("Skipping RSI alert '{}': {}", entry, e.what());
        }
    }

    wallets_.clear();
    for (const auto& address : defaults_.wallets) {
        if (!util::is_valid_solana_address(address)) {
            spdlog::warn("Skipping malformed wallet address '{}'", address);
            continue;
        }
        if (std::find(wallets_.begin(), wallets_.end(), address) == wallets_.end()) {
            wallets_.push_back(address);
        }
    }
}

void StateStore::apply_config_locked(const nlohmann::json& doc) {
    usd_amount_ = doc.value("usd_amount", usd_amount_);
    reset_minutes_ = std::max(0, doc.value("alert_reset_minutes", reset_minutes_));

    if (doc.contains("buy_alerts") || doc.contains("sell_alerts")) {
        thresholds_.clear();
        for (double v : doc.value("buy_alerts", std::vector<double>{})) {
            auto key = ThresholdKey::from_value(Side::Buy, v);
            thresholds_.emplace(key, PriceThreshold{key, std::nullopt});
        }
        for (double v : doc.value("sell_alerts", std::vector<double>{})) {
            auto key = ThresholdKey::from_value(Side::Sell, v);
            thresholds_.emplace(key, PriceThreshold{key, std::nullopt});
        }
    }

    if (doc.contains("rsi_alerts")) {
        rsi_alerts_.clear();
        for (const auto& entry : doc["rsi_alerts"]) {
            auto key = RsiAlertKey::parse(entry.get<std::string>());
            rsi_alerts_.emplace(key, RsiAlert{key, false, std::nullopt});
        }
    }

    if (doc.contains("rsi_interval")) {
        auto interval = parse_interval(doc["rsi_interval"].get<std::string>());
        if (interval) {
            rsi_config_.interval = *interval;
        }
    }
    rsi_config_.reset_enabled = doc.value("rsi_reset_enabled", rsi_config_.reset_enabled);

    if (doc.contains("wallets")) {
        wallets_ = doc["wallets"].get<std::vector<std::string>>();
    }
}

void StateStore::apply_runtime_locked(const nlohmann::json& doc) {
    history_.clear();
    for (const auto& entry : doc.value("latest_prices", nlohmann::json::array())) {
        history_.push_back(entry.get<PriceSample>());
    }
    while (history_.size() > defaults_.history_cap) {
        history_.pop_front();
    }

    auto restore_triggers = [this](const nlohmann::json& map, Side side) {
        for (auto& [value_text, ts] : map.items()) {
            auto key = ThresholdKey::from_value(side, std::stod(value_text));
            auto it = thresholds_.find(key);
            if (it == thresholds_.end()) continue;
            it->second.last_triggered = time_from_json(ts);
        }
    };
    restore_triggers(doc.value("last_triggered_buy", nlohmann::json::object()), Side::Buy);
    restore_triggers(doc.value("last_triggered_sell", nlohmann::json::object()), Side::Sell);

    for (auto& [key_text, entry] : doc.value("rsi_state", nlohmann::json::object()).items()) {
        auto it = rsi_alerts_.find(RsiAlertKey::parse(key_text));
        if (it == rsi_alerts_.end()) continue;
        it->second.triggered = entry.value("triggered", false);
        it->second.last_triggered = time_from_json(entry.value("last_triggered", nlohmann::json()));
    }

    if (doc.contains("pnl") && !doc["pnl"].is_null()) {
        pnl_ = doc["pnl"].get<PnlSnapshot>();
    }
}

nlohmann::json StateStore::config_document_locked() const {
    std::vector<double> buy;
    std::vector<double> sell;
    for (const auto& [key, threshold] : thresholds_) {
        (key.side == Side::Buy ? buy : sell).push_back(key.value());
    }

    std::vector<std::string> alerts;
    for (const auto& [key, alert] : rsi_alerts_) {
        alerts.push_back(key.to_string());
    }

    return {
        {"usd_amount", usd_amount_},
        {"buy_alerts", buy},
        {"sell_alerts", sell},
        {"alert_reset_minutes", reset_minutes_},
        {"rsi_alerts", alerts},
        {"rsi_interval", interval_string(rsi_config_.interval)},
        {"rsi_reset_enabled", rsi_config_.reset_enabled},
        {"wallets", wallets_}
    };
}

nlohmann::json StateStore::runtime_document_locked() const {
    nlohmann::json triggered_buy = nlohmann::json::object();
    nlohmann::json triggered_sell = nlohmann::json::object();
    for (const auto& [key, threshold] : thresholds_) {
        if (!threshold.last_triggered) continue;
        auto& target = key.side == Side::Buy ? triggered_buy : triggered_sell;
        target[key.value_string()] = util::format_iso8601(*threshold.last_triggered);
    }

    nlohmann::json rsi_state = nlohmann::json::object();
    for (const auto& [key, alert] : rsi_alerts_) {
        rsi_state[key.to_string()] = {
            {"triggered", alert.triggered},
            {"last_triggered", time_to_json(alert.last_triggered)}
        };
    }

    nlohmann::json doc = {
        {"latest_prices", std::vector<PriceSample>(history_.begin(), history_.end())},
        {"last_triggered_buy", triggered_buy},
        {"last_triggered_sell", triggered_sell},
        {"rsi_state", rsi_state},
        {"pnl", nullptr}
    };
    if (pnl_) {
        doc["pnl"] = *pnl_;
    }
    return doc;
}

StateStore::PendingWrite StateStore::stage_config_locked() {
    return PendingWrite{kConfigDocument, config_document_locked(), ++next_sequence_};
}

StateStore::PendingWrite StateStore::stage_runtime_locked() {
    return PendingWrite{kRuntimeDocument, runtime_document_locked(), ++next_sequence_};
}

void StateStore::persist(const std::vector<PendingWrite>& writes) {
    if (!persistence_) return;

    std::lock_guard<std::mutex> lock(persist_mutex_);
    for (const auto& write : writes) {
        auto& written = written_sequence_[write.name];
        if (write.sequence <= written) {
            spdlog::debug("Skipping superseded save of {}", write.name);
            continue;
        }
        written = write.sequence;
        if (!persistence_->save(write.name, write.document)) {
            spdlog::warn("Change to {} kept in memory only", write.name);
        }
    }
}

StateSnapshot StateStore::snapshot_locked() const {
    StateSnapshot snap;
    snap.tracked_token = defaults_.tracked_token;
    snap.usd_amount = usd_amount_;
    snap.reset_minutes = reset_minutes_;
    for (const auto& [key, threshold] : thresholds_) {
        snap.thresholds.push_back(threshold);
    }
    snap.price_history.assign(history_.begin(), history_.end());
    snap.wallets = wallets_;
    snap.rsi_config = rsi_config_;
    for (const auto& [key, alert] : rsi_alerts_) {
        snap.rsi_alerts.push_back(alert);
    }
    snap.pnl = pnl_;
    return snap;
}

StateSnapshot StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

std::string StateStore::tracked_token() const {
    return defaults_.tracked_token;
}

double StateStore::usd_amount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return usd_amount_;
}

int StateStore::reset_minutes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reset_minutes_;
}

std::vector<PriceThreshold> StateStore::thresholds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PriceThreshold> result;
    for (const auto& [key, threshold] : thresholds_) {
        result.push_back(threshold);
    }
    return result;
}

std::vector<PriceSample> StateStore::price_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<PriceSample>(history_.begin(), history_.end());
}

std::vector<std::string> StateStore::wallets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wallets_;
}

RsiConfig StateStore::rsi_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rsi_config_;
}

std::vector<RsiAlert> StateStore::rsi_alerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RsiAlert> result;
    for (const auto& [key, alert] : rsi_alerts_) {
        result.push_back(alert);
    }
    return result;
}

std::optional<PnlSnapshot> StateStore::pnl_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pnl_;
}

void StateStore::set_usd_amount(double usd_amount) {
    if (!std::isfinite(usd_amount) || usd_amount <= 0.0) {
        throw InvalidInput("USD amount must be positive");
    }

    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        usd_amount_ = usd_amount;
        // Prices sampled at another notional are not comparable
        history_.clear();
        writes.push_back(stage_config_locked());
        writes.push_back(stage_runtime_locked());
    }
    persist(writes);
    spdlog::info("Notional set to ${:.2f}, price history cleared", usd_amount);
}

void StateStore::set_reset_minutes(int minutes) {
    if (minutes < 0) {
        throw InvalidInput("Reset minutes must be >= 0");
    }

    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_minutes_ = minutes;
        writes.push_back(stage_config_locked());
    }
    persist(writes);
    spdlog::info("Alert reset set to {} minutes", minutes);
}

ThresholdKey StateStore::checked_key(Side side, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidInput(fmt::format("Invalid {} threshold: {}", side_string(side), value));
    }
    auto key = ThresholdKey::from_value(side, value);
    if (key.units <= 0) {
        throw InvalidInput(fmt::format("Threshold {} rounds to zero", value));
    }
    return key;
}

bool StateStore::add_threshold(Side side, double value) {
    auto key = checked_key(side, value);

    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = thresholds_.emplace(key, PriceThreshold{key, std::nullopt});
        if (!inserted) {
            return false;
        }
        writes.push_back(stage_config_locked());
    }
    persist(writes);
    spdlog::info("Added {} threshold {}", side_string(side), key.value_string());
    return true;
}

bool StateStore::remove_threshold(Side side, double value) {
    auto key = checked_key(side, value);

    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (thresholds_.erase(key) == 0) {
            return false;
        }
        writes.push_back(stage_config_locked());
        writes.push_back(stage_runtime_locked());
    }
    persist(writes);
    spdlog::info("Removed {} threshold {}", side_string(side), key.value_string());
    return true;
}

bool StateStore::reset_threshold(Side side, double value) {
    auto key = checked_key(side, value);

    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = thresholds_.find(key);
        if (it == thresholds_.end()) {
            return false;
        }
        it->second.last_triggered.reset();
        writes.push_back(stage_runtime_locked());
    }
    persist(writes);
    spdlog::info("Re-armed {} threshold {}", side_string(side), key.value_string());
    return true;
}

void StateStore::append_price(const PriceSample& sample) {
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(sample);
        while (history_.size() > defaults_.history_cap) {
            history_.pop_front();
        }
        writes.push_back(stage_runtime_locked());
    }
    persist(writes);
}

std::vector<PriceThreshold> StateStore::evaluate_thresholds(const ThresholdVisitor& visitor) {
    std::vector<PriceThreshold> changed;
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, threshold] : thresholds_) {
            if (visitor(threshold, reset_minutes_)) {
                changed.push_back(threshold);
            }
        }
        if (!changed.empty()) {
            writes.push_back(stage_runtime_locked());
        }
    }
    persist(writes);
    return changed;
}

bool StateStore::add_wallet(const std::string& address) {
    auto trimmed = util::trim(address);
    if (!util::is_valid_solana_address(trimmed)) {
        throw InvalidInput("Invalid Solana address format: " + address);
    }

    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(wallets_.begin(), wallets_.end(), trimmed) != wallets_.end()) {
            return false;
        }
        wallets_.push_back(trimmed);
        writes.push_back(stage_config_locked());
    }
    persist(writes);
    spdlog::info("Tracking wallet {}", util::short_address(trimmed));
    return true;
}

bool StateStore::set_rsi_interval(RsiInterval interval) {
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rsi_config_.interval == interval) {
            return false;
        }
        rsi_config_.interval = interval;
        writes.push_back(stage_config_locked());
    }
    persist(writes);
    spdlog::info("RSI interval set to {}", interval_string(interval));
    return true;
}

bool StateStore::set_rsi_interval(const std::string& interval) {
    auto parsed = parse_interval(interval);
    if (!parsed) {
        throw InvalidInput("Unsupported RSI interval: " + interval);
    }
    return set_rsi_interval(*parsed);
}

void StateStore::set_rsi_reset_enabled(bool enabled) {
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rsi_config_.reset_enabled = enabled;
        writes.push_back(stage_config_locked());
    }
    persist(writes);
    spdlog::info("RSI auto reset {}", enabled ? "enabled" : "disabled");
}

bool StateStore::add_rsi_alert(const RsiAlertKey& key) {
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = rsi_alerts_.emplace(key, RsiAlert{key, false, std::nullopt});
        if (!inserted) {
            return false;
        }
        writes.push_back(stage_config_locked());
    }
    persist(writes);
    spdlog::info("Added RSI alert {}", key.to_string());
    return true;
}

bool StateStore::remove_rsi_alert(const RsiAlertKey& key) {
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rsi_alerts_.erase(key) == 0) {
            return false;
        }
        writes.push_back(stage_config_locked());
        writes.push_back(stage_runtime_locked());
    }
    persist(writes);
    spdlog::info("Removed RSI alert {}", key.to_string());
    return true;
}

bool StateStore::reset_rsi_alert(const RsiAlertKey& key) {
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rsi_alerts_.find(key);
        if (it == rsi_alerts_.end()) {
            return false;
        }
        it->second.triggered = false;
        it->second.last_triggered.reset();
        writes.push_back(stage_runtime_locked());
    }
    persist(writes);
    spdlog::info("Re-armed RSI alert {}", key.to_string());
    return true;
}

std::vector<RsiAlert> StateStore::evaluate_rsi_alerts(const RsiAlertVisitor& visitor) {
    std::vector<RsiAlert> changed;
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, alert] : rsi_alerts_) {
            if (visitor(alert, rsi_config_)) {
                changed.push_back(alert);
            }
        }
        if (!changed.empty()) {
            writes.push_back(stage_runtime_locked());
        }
    }
    persist(writes);
    return changed;
}

void StateStore::store_pnl_snapshot(const PnlSnapshot& snapshot) {
    std::vector<PendingWrite> writes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pnl_ = snapshot;
        writes.push_back(stage_runtime_locked());
    }
    persist(writes);
}
