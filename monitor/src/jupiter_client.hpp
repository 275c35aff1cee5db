#pragma once

#include "http_client.hpp"
#include <string>
#include <memory>
#include <optional>
#include <cstdint>

struct SwapQuote {
    uint64_t in_amount;
    uint64_t out_amount;
    double price_impact_pct;
};

// Impact-inclusive swap quotes in atomic units.
class QuoteSource {
public:
    virtual ~QuoteSource() = default;

    virtual std::optional<SwapQuote> quote(const std::string& input_mint,
                                           const std::string& output_mint,
                                           uint64_t amount) = 0;
};

class JupiterClient : public QuoteSource {
public:
    JupiterClient(const std::string& base_url, int slippage_bps, std::shared_ptr<HttpClient> http);

    std::optional<SwapQuote> quote(const std::string& input_mint,
                                   const std::string& output_mint,
                                   uint64_t amount) override;

    static std::optional<SwapQuote> parse_quote(const nlohmann::json& response);

private:
    std::string base_url_;
    int slippage_bps_;
    std::shared_ptr<HttpClient> http_;
};
