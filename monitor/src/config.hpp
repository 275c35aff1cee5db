#pragma once

#include "state_store.hpp"
#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Assets
    std::string input_mint;
    std::string output_mint;
    int input_decimals;
    int output_decimals;
    double usd_amount;
    int slippage_bps;

    // Price alerts
    int check_interval_seconds;
    std::vector<double> buy_alerts;
    std::vector<double> sell_alerts;
    int alert_reset_minutes;
    int price_history_cap;

    // RSI
    std::string solanatracker_api_key;
    int rsi_check_interval_minutes;
    std::vector<std::string> rsi_alerts;
    std::string rsi_interval;
    bool rsi_reset_enabled;

    // Wallet PnL
    std::vector<std::string> wallet_addresses;
    int pnl_refresh_minutes;
    int pnl_request_spacing_ms;
    int pnl_retry_backoff_ms;

    // Notifications
    std::string ntfy_topic;
    std::string ntfy_server;
    std::string display_tz;

    // Collaborators
    std::string jupiter_base;
    std::string solanatracker_base;
    int request_timeout_ms;

    // Redis
    std::string redis_url;
    std::string state_key_prefix;
    std::string stream_alerts;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    StateDefaults to_state_defaults() const;

    static std::vector<double> parse_price_list(const std::string& value, const char* name);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
