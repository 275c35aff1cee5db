#pragma once

#include "types.hpp"
#include "document_store.hpp"
#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <memory>
#include <optional>
#include <functional>
#include <cstdint>
#include <nlohmann/json.hpp>

// Values used when no persisted state exists yet.
struct StateDefaults {
    std::string tracked_token;
    double usd_amount = 100.0;
    int reset_minutes = 0;
    size_t history_cap = 100;
    std::vector<double> buy_thresholds;
    std::vector<double> sell_thresholds;
    std::vector<std::string> rsi_alerts;
    RsiConfig rsi_config;
    std::vector<std::string> wallets;
};

struct StateSnapshot {
    std::string tracked_token;
    double usd_amount;
    int reset_minutes;
    std::vector<PriceThreshold> thresholds;
    std::vector<PriceSample> price_history;
    std::vector<std::string> wallets;
    RsiConfig rsi_config;
    std::vector<RsiAlert> rsi_alerts;
    std::optional<PnlSnapshot> pnl;

    nlohmann::json to_json() const;
};

using ThresholdVisitor = std::function<bool(PriceThreshold& threshold, int reset_minutes)>;
using RsiAlertVisitor = std::function<bool(RsiAlert& alert, const RsiConfig& config)>;

class StateStore {
public:
    StateStore(std::shared_ptr<DocumentStore> persistence, StateDefaults defaults);

    // Loads persisted documents, seeding from defaults where none exist.
    void load();

    StateSnapshot snapshot() const;

    std::string tracked_token() const;
    double usd_amount() const;
    int reset_minutes() const;
    std::vector<PriceThreshold> thresholds() const;
    std::vector<PriceSample> price_history() const;
    std::vector<std::string> wallets() const;
    RsiConfig rsi_config() const;
    std::vector<RsiAlert> rsi_alerts() const;
    std::optional<PnlSnapshot> pnl_snapshot() const;

    void set_usd_amount(double usd_amount);
    void set_reset_minutes(int minutes);

    bool add_threshold(Side side, double value);
    bool remove_threshold(Side side, double value);
    bool reset_threshold(Side side, double value);

    void append_price(const PriceSample& sample);

    // Runs visitor over every threshold under the store lock. Thresholds for
    // which the visitor returns true are persisted and returned.
    std::vector<PriceThreshold> evaluate_thresholds(const ThresholdVisitor& visitor);

    bool add_wallet(const std::string& address);

    bool set_rsi_interval(RsiInterval interval);
    bool set_rsi_interval(const std::string& interval);
    void set_rsi_reset_enabled(bool enabled);

    bool add_rsi_alert(const RsiAlertKey& key);
    bool remove_rsi_alert(const RsiAlertKey& key);
    bool reset_rsi_alert(const RsiAlertKey& key);

    std::vector<RsiAlert> evaluate_rsi_alerts(const RsiAlertVisitor& visitor);

    void store_pnl_snapshot(const PnlSnapshot& snapshot);

private:
    // A document built under the state lock and saved after it is released.
    struct PendingWrite {
        std::string name;
        nlohmann::json document;
        uint64_t sequence;
    };

    std::shared_ptr<DocumentStore> persistence_;
    StateDefaults defaults_;

    mutable std::mutex mutex_;
    double usd_amount_;
    int reset_minutes_;
    std::map<ThresholdKey, PriceThreshold> thresholds_;
    std::deque<PriceSample> history_;
    std::vector<std::string> wallets_;
    RsiConfig rsi_config_;
    std::map<RsiAlertKey, RsiAlert> rsi_alerts_;
    std::optional<PnlSnapshot> pnl_;
    uint64_t next_sequence_ = 0;

    // Serializes saves; a save older than the last one written is dropped
    std::mutex persist_mutex_;
    std::map<std::string, uint64_t> written_sequence_;

    void apply_defaults_locked();
    void apply_config_locked(const nlohmann::json& doc);
    void apply_runtime_locked(const nlohmann::json& doc);

    nlohmann::json config_document_locked() const;
    nlohmann::json runtime_document_locked() const;
    PendingWrite stage_config_locked();
    PendingWrite stage_runtime_locked();
    void persist(const std::vector<PendingWrite>& writes);

    StateSnapshot snapshot_locked() const;

    static ThresholdKey checked_key(Side side, double value);
};
