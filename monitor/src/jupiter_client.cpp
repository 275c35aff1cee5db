#include "jupiter_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

// Jupiter encodes amounts as decimal strings
uint64_t amount_field(const nlohmann::json& j) {
    if (j.is_string()) return std::stoull(j.get<std::string>());
    if (j.is_number_unsigned()) return j.get<uint64_t>();
    if (j.is_number_integer()) {
        auto v = j.get<int64_t>();
        if (v < 0) throw std::out_of_range("negative amount");
        return static_cast<uint64_t>(v);
    }
    throw std::invalid_argument("amount is not numeric");
}

} // namespace

JupiterClient::JupiterClient(const std::string& base_url, int slippage_bps,
                             std::shared_ptr<HttpClient> http)
    : base_url_(base_url)
    , slippage_bps_(slippage_bps)
    , http_(std::move(http))
{}

std::optional<SwapQuote> JupiterClient::parse_quote(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("outAmount")) {
        return std::nullopt;
    }

    try {
        SwapQuote q;
        q.out_amount = amount_field(response["outAmount"]);
        q.in_amount = response.contains("inAmount") ? amount_field(response["inAmount"]) : 0;
        q.price_impact_pct = 0.0;
        if (response.contains("priceImpactPct")) {
            const auto& impact = response["priceImpactPct"];
            q.price_impact_pct = impact.is_string() ? std::stod(impact.get<std::string>())
                                                    : impact.get<double>();
        }
        return q;
    } catch (const std::exception& e) {
        spdlog::warn("Unreadable Jupiter quote: {}", e.what());
        return std::nullopt;
    }
}

std::optional<SwapQuote> JupiterClient::quote(const std::string& input_mint,
                                              const std::string& output_mint,
                                              uint64_t amount) {
    if (amount == 0) {
        return std::nullopt;
    }

    std::string url = fmt::format("{}/quote?inputMint={}&outputMint={}&amount={}&slippageBps={}",
                                  base_url_, HttpClient::escape(input_mint),
                                  HttpClient::escape(output_mint), amount, slippage_bps_);

    try {
        auto response = http_->get_json(url);
        auto q = parse_quote(response);
        if (!q) {
            spdlog::warn("Jupiter quote missing outAmount ({} -> {})",
                         input_mint.substr(0, 8), output_mint.substr(0, 8));
            return std::nullopt;
        }
        if (q->out_amount == 0) {
            spdlog::warn("Jupiter returned zero outAmount");
            return std::nullopt;
        }
        return q;
    } catch (const RateLimited& e) {
        spdlog::warn("Jupiter rate limited: {}", e.what());
    } catch (const CollaboratorUnavailable& e) {
        spdlog::warn("Jupiter quote failed: {}", e.what());
    }
    return std::nullopt;
}
