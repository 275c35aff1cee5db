#pragma once

#include "types.hpp"
#include "http_client.hpp"
#include "request_pacer.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>

// Candle history for the RSI engine.
class ChartSource {
public:
    virtual ~ChartSource() = default;

    virtual std::optional<std::vector<RsiCandle>> chart(const std::string& token,
                                                        RsiInterval interval) = 0;
};

// Per-wallet profit and loss for one token.
class PnlSource {
public:
    virtual ~PnlSource() = default;

    virtual std::optional<WalletPnlRecord> wallet_pnl(const std::string& wallet,
                                                      const std::string& token) = 0;
};

class SolanaTrackerClient : public ChartSource, public PnlSource {
public:
    SolanaTrackerClient(const std::string& base_url,
                        const std::string& api_key,
                        std::shared_ptr<HttpClient> http,
                        std::shared_ptr<RequestPacer> pacer);

    bool enabled() const { return !api_key_.empty(); }

    std::optional<std::vector<RsiCandle>> chart(const std::string& token,
                                                RsiInterval interval) override;
    std::optional<WalletPnlRecord> wallet_pnl(const std::string& wallet,
                                              const std::string& token) override;

    // Sorted by open time; malformed entries are dropped.
    static std::vector<RsiCandle> parse_chart(const nlohmann::json& response);
    static WalletPnlRecord parse_pnl(const std::string& wallet, const nlohmann::json& response);

    // Accepts epoch milliseconds, epoch seconds or an ISO-8601 string.
    static std::optional<TimePoint> parse_trade_time(const nlohmann::json& value);

private:
    std::string base_url_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<RequestPacer> pacer_;

    std::optional<nlohmann::json> fetch(const std::string& url, const std::string& what);
};
