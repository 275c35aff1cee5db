#include "solana_tracker_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace {

double number_field(const nlohmann::json& obj, const char* name) {
    if (!obj.contains(name)) return 0.0;
    const auto& v = obj[name];
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

// Anything above this is taken to be milliseconds (year 33658 in seconds)
constexpr double kMillisecondCutoff = 1e12;

} // namespace

SolanaTrackerClient::SolanaTrackerClient(const std::string& base_url,
                                         const std::string& api_key,
                                         std::shared_ptr<HttpClient> http,
                                         std::shared_ptr<RequestPacer> pacer)
    : base_url_(base_url)
    , api_key_(api_key)
    , http_(std::move(http))
    , pacer_(std::move(pacer))
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::optional<nlohmann::json> SolanaTrackerClient::fetch(const std::string& url,
                                                         const std::string& what) {
    if (!enabled()) {
        return std::nullopt;
    }

    if (pacer_) {
        pacer_->wait();
    }

    try {
        return http_->get_json(url, {"x-api-key: " + api_key_});
    } catch (const RateLimited& e) {
        spdlog::warn("SolanaTracker rate limited on {}: {}", what, e.what());
    } catch (const CollaboratorUnavailable& e) {
        spdlog::warn("SolanaTracker {} failed: {}", what, e.what());
    }
    return std::nullopt;
}

std::optional<TimePoint> SolanaTrackerClient::parse_trade_time(const nlohmann::json& value) {
    if (value.is_number()) {
        double raw = value.get<double>();
        if (!std::isfinite(raw) || raw <= 0) return std::nullopt;
        int64_t ms = raw >= kMillisecondCutoff ? static_cast<int64_t>(raw)
                                               : static_cast<int64_t>(raw * 1000.0);
        return util::from_timestamp_ms(ms);
    }
    if (value.is_string()) {
        return util::parse_iso8601(value.get<std::string>());
    }
    return std::nullopt;
}

std::vector<RsiCandle> SolanaTrackerClient::parse_chart(const nlohmann::json& response) {
    std::vector<RsiCandle> candles;
    if (!response.is_object() || !response.contains("oclhv") || !response["oclhv"].is_array()) {
        return candles;
    }

    for (const auto& entry : response["oclhv"]) {
        if (!entry.is_object() || !entry.contains("time") || !entry.contains("close")) {
            continue;
        }
        if (!entry["time"].is_number() || !entry["close"].is_number()) {
            continue;
        }
        auto secs = entry["time"].get<int64_t>();
        candles.push_back(RsiCandle{TimePoint(std::chrono::seconds(secs)),
                                    entry["close"].get<double>()});
    }

    std::sort(candles.begin(), candles.end(), [](const RsiCandle& a, const RsiCandle& b) {
        return a.open_time < b.open_time;
    });
    return candles;
}

std::optional<std::vector<RsiCandle>> SolanaTrackerClient::chart(const std::string& token,
                                                                 RsiInterval interval) {
    std::string url = fmt::format("{}/chart/{}?type={}&removeOutliers=true",
                                  base_url_, HttpClient::escape(token), interval_string(interval));

    auto response = fetch(url, "chart");
    if (!response) {
        return std::nullopt;
    }
    if (!response->contains("oclhv")) {
        spdlog::warn("SolanaTracker chart response has no oclhv field");
        return std::nullopt;
    }

    auto candles = parse_chart(*response);
    spdlog::debug("Fetched {} {} candles for {}", candles.size(),
                  interval_string(interval), util::short_address(token));
    return candles;
}

WalletPnlRecord SolanaTrackerClient::parse_pnl(const std::string& wallet,
                                               const nlohmann::json& response) {
    WalletPnlRecord record;
    record.wallet = wallet;
    record.holding = number_field(response, "holding");
    record.realized = number_field(response, "realized");
    record.unrealized = number_field(response, "unrealized");
    record.current_value = number_field(response, "current_value");
    record.cost_basis = number_field(response, "cost_basis");
    if (response.contains("last_trade_time")) {
        record.last_trade_time = parse_trade_time(response["last_trade_time"]);
    }
    return record;
}

std::optional<WalletPnlRecord> SolanaTrackerClient::wallet_pnl(const std::string& wallet,
                                                               const std::string& token) {
    std::string url = fmt::format("{}/pnl/{}/{}", base_url_,
                                  HttpClient::escape(wallet), HttpClient::escape(token));

    auto response = fetch(url, "pnl");
    if (!response) {
        return std::nullopt;
    }
    if (!response->is_object()) {
        spdlog::warn("SolanaTracker pnl response for {} is not an object",
                     util::short_address(wallet));
        return std::nullopt;
    }
    return parse_pnl(wallet, *response);
}
