#include <catch2/catch_test_macros.hpp>
#include "../src/health.hpp"
#include "fakes.hpp"

TEST_CASE("Health report", "[health]") {
    auto clock = std::make_shared<ManualClock>();
    StateDefaults defaults;
    defaults.tracked_token = fixtures::kToken;
    StateStore store(nullptr, defaults);
    store.load();

    RsiEngine rsi(store, nullptr, clock, nullptr, AlertFormatter());
    PnlAggregator pnl(store, nullptr, clock);
    AlertDispatcher dispatcher(std::make_shared<RecordingNotifier>(), nullptr, "");
    HealthCheck health("jupwatch", nullptr, store, rsi, pnl, dispatcher);

    SECTION("Without Redis the service reports unhealthy") {
        auto status = health.get_status();
        REQUIRE(status["service"] == "jupwatch");
        REQUIRE(status["ok"] == false);
        REQUIRE(status["redis"] == false);
        REQUIRE_FALSE(health.is_healthy());
    }

    SECTION("Component states are reported") {
        store.append_price(PriceSample{clock->now(), 1.0, 0.9});
        dispatcher.deliver(Notification{"t", "m", "price", nlohmann::json::object()});

        auto status = health.get_status();
        REQUIRE(status["rsi"]["status"] == "disabled");
        REQUIRE(status["rsi"]["value"].is_null());
        REQUIRE(status["rsi"]["interval"] == "5m");
        REQUIRE(status["pnl"]["status"] == "disabled");
        REQUIRE(status["pnl"]["running"] == false);
        REQUIRE(status["pnl"]["last_run"].is_null());
        REQUIRE(status["price"]["samples"] == 1);
        REQUIRE(status["price"]["last_sample_ts"].is_string());
        REQUIRE(status["notifications"]["delivered"] == 1);
    }
}

TEST_CASE("Health RSI value follows the reading status", "[health]") {
    auto clock = std::make_shared<ManualClock>();
    auto chart = std::make_shared<FakeChartSource>();
    StateDefaults defaults;
    defaults.tracked_token = fixtures::kToken;
    defaults.rsi_config.interval = RsiInterval::OneMinute;
    StateStore store(nullptr, defaults);
    store.load();

    RsiEngine rsi(store, chart, clock, nullptr, AlertFormatter());
    PnlAggregator pnl(store, nullptr, clock);
    AlertDispatcher dispatcher(std::make_shared<RecordingNotifier>(), nullptr, "");
    HealthCheck health("jupwatch", nullptr, store, rsi, pnl, dispatcher);

    std::vector<RsiCandle> candles;
    auto first = clock->now() - std::chrono::minutes(21);
    for (int i = 0; i < 20; i++) {
        candles.push_back(RsiCandle{first + std::chrono::minutes(i), 1.0 + 0.01 * i});
    }
    chart->candles = candles;
    REQUIRE(rsi.refresh());
    REQUIRE(health.get_status()["rsi"]["value"] == 100.0);

    chart->candles.reset();
    REQUIRE_FALSE(rsi.refresh());
    auto status = health.get_status();
    REQUIRE(status["rsi"]["status"] == "unavailable");
    REQUIRE(status["rsi"]["value"].is_null());
}
