#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cmath>

namespace {
const char* kUsdcMint = "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v";
}

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string v = util::to_lower(util::trim(val));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

std::vector<double> Config::parse_price_list(const std::string& value, const char* name) {
    std::vector<double> prices;
    for (const auto& entry : util::split(value, ',')) {
        try {
            size_t used = 0;
            double price = std::stod(entry, &used);
            if (used != entry.size() || !std::isfinite(price) || price <= 0.0) {
                throw std::invalid_argument("not a positive price");
            }
            prices.push_back(price);
        } catch (const std::exception&) {
            spdlog::warn("Ignoring {} entry '{}'", name, entry);
        }
    }
    return prices;
}

Config Config::from_env() {
    Config cfg;

    cfg.input_mint = get_env("INPUT_MINT", kUsdcMint);
    cfg.output_mint = get_env("OUTPUT_MINT");
    cfg.input_decimals = get_env_int("INPUT_DECIMALS", 6);
    cfg.output_decimals = get_env_int("OUTPUT_DECIMALS", 6);
    cfg.usd_amount = get_env_double("USD_AMOUNT", 100.0);
    cfg.slippage_bps = get_env_int("SLIPPAGE_BPS", 100);

    cfg.check_interval_seconds = get_env_int("CHECK_INTERVAL", 60);
    cfg.buy_alerts = parse_price_list(get_env("BUY_ALERTS"), "BUY_ALERTS");
    cfg.sell_alerts = parse_price_list(get_env("SELL_ALERTS"), "SELL_ALERTS");
    cfg.alert_reset_minutes = get_env_int("ALERT_RESET_MINUTES", 0);
    cfg.price_history_cap = get_env_int("PRICE_HISTORY_CAP", 100);

    cfg.solanatracker_api_key = get_env("SOLANATRACKER_API_KEY");
    cfg.rsi_check_interval_minutes = get_env_int("RSI_CHECK_INTERVAL", 5);
    cfg.rsi_alerts = util::split(get_env("RSI_ALERTS"), ',');
    cfg.rsi_interval = get_env("RSI_INTERVAL", "5m");
    cfg.rsi_reset_enabled = get_env_bool("RSI_RESET_ENABLED", false);

    cfg.wallet_addresses = util::split(get_env("WALLET_ADDRESSES"), ',');
    cfg.pnl_refresh_minutes = get_env_int("PNL_REFRESH_MINUTES", 0);
    cfg.pnl_request_spacing_ms = get_env_int("PNL_REQUEST_SPACING_MS", 1100);
    cfg.pnl_retry_backoff_ms = get_env_int("PNL_RETRY_BACKOFF_MS", 2000);

    cfg.ntfy_topic = get_env("NTFY_TOPIC");
    cfg.ntfy_server = get_env("NTFY_SERVER", "https://ntfy.sh");
    cfg.display_tz = get_env("DISPLAY_TZ", "UTC");

    cfg.jupiter_base = get_env("JUPITER_BASE", "https://quote-api.jup.ag/v6");
    cfg.solanatracker_base = get_env("SOLANATRACKER_BASE", "https://data.solanatracker.io");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 10000);

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.state_key_prefix = get_env("STATE_KEY_PREFIX", "jupwatch");
    cfg.stream_alerts = get_env("STREAM_ALERTS", "jupwatch.alerts");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "jupwatch");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (output_mint.empty()) {
        throw std::runtime_error("OUTPUT_MINT is required");
    }
    if (input_mint.empty()) {
        throw std::runtime_error("INPUT_MINT must not be empty");
    }
    if (input_decimals < 0 || input_decimals > 18 || output_decimals < 0 || output_decimals > 18) {
        throw std::runtime_error("INPUT_DECIMALS and OUTPUT_DECIMALS must be between 0 and 18");
    }
    if (!std::isfinite(usd_amount) || usd_amount <= 0.0) {
        throw std::runtime_error("USD_AMOUNT must be positive");
    }
    if (check_interval_seconds <= 0 || rsi_check_interval_minutes <= 0) {
        throw std::runtime_error("CHECK_INTERVAL and RSI_CHECK_INTERVAL must be positive");
    }
    if (alert_reset_minutes < 0) {
        throw std::runtime_error("ALERT_RESET_MINUTES must not be negative");
    }
    if (price_history_cap <= 0) {
        throw std::runtime_error("PRICE_HISTORY_CAP must be positive");
    }
    if (!parse_interval(rsi_interval)) {
        throw std::runtime_error("RSI_INTERVAL must be one of 1s, 1m, 5m, 15m, 1h, 4h");
    }
    if (!util::is_valid_zone(display_tz)) {
        spdlog::warn("DISPLAY_TZ '{}' not understood, alerts will show UTC", display_tz);
    }
    if (solanatracker_api_key.empty()) {
        spdlog::warn("SOLANATRACKER_API_KEY not set, RSI and wallet PnL disabled");
    }
    if (ntfy_topic.empty()) {
        spdlog::warn("NTFY_TOPIC not set, alerts will only be logged");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Tracking {} with ${} notional", util::short_address(output_mint), usd_amount);
    spdlog::info("  Price check every {}s, reset {} min", check_interval_seconds, alert_reset_minutes);
    spdlog::info("  RSI {} every {} min", rsi_interval, rsi_check_interval_minutes);
    spdlog::info("  {} wallets tracked", wallet_addresses.size());
}

StateDefaults Config::to_state_defaults() const {
    StateDefaults defaults;
    defaults.tracked_token = output_mint;
    defaults.usd_amount = usd_amount;
    defaults.reset_minutes = alert_reset_minutes;
    defaults.history_cap = static_cast<size_t>(price_history_cap > 0 ? price_history_cap : 100);
    defaults.buy_thresholds = buy_alerts;
    defaults.sell_thresholds = sell_alerts;
    defaults.rsi_alerts = rsi_alerts;
    defaults.rsi_config.interval = parse_interval(rsi_interval).value_or(RsiInterval::FiveMinutes);
    defaults.rsi_config.reset_enabled = rsi_reset_enabled;
    defaults.wallets = wallet_addresses;
    return defaults;
}
