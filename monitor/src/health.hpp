#pragma once

#include "redis_bus.hpp"
#include "state_store.hpp"
#include "rsi_engine.hpp"
#include "pnl_aggregator.hpp"
#include "alert_dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

class HealthCheck {
public:
    HealthCheck(const std::string& service_name,
                std::shared_ptr<RedisBus> redis,
                const StateStore& store,
                const RsiEngine& rsi,
                const PnlAggregator& pnl,
                const AlertDispatcher& dispatcher);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    std::string service_name_;
    std::shared_ptr<RedisBus> redis_;
    const StateStore& store_;
    const RsiEngine& rsi_;
    const PnlAggregator& pnl_;
    const AlertDispatcher& dispatcher_;

    bool redis_ok() const;
};
