#include <catch2/catch_test_macros.hpp>
#include "../src/threshold_engine.hpp"
#include "fakes.hpp"
#include <atomic>
#include <map>
#include <thread>

using namespace std::chrono_literals;

namespace {

StateDefaults buy_only(double value, int reset_minutes) {
    StateDefaults defaults;
    defaults.tracked_token = fixtures::kToken;
    defaults.reset_minutes = reset_minutes;
    defaults.buy_thresholds = {value};
    return defaults;
}

PriceSample sample(const ManualClock& clock, double buy, double sell) {
    return PriceSample{clock.now(), buy, sell};
}

} // namespace

TEST_CASE("Threshold conditions", "[thresholds]") {
    PriceSample s{TimePoint{}, 0.00134, 0.00150};
    PriceThreshold buy{ThresholdKey::from_value(Side::Buy, 0.00135), std::nullopt};
    PriceThreshold sell{ThresholdKey::from_value(Side::Sell, 0.00150), std::nullopt};
    PriceThreshold high_sell{ThresholdKey::from_value(Side::Sell, 0.002), std::nullopt};

    REQUIRE(ThresholdEngine::condition_met(buy, s));
    REQUIRE(ThresholdEngine::condition_met(sell, s));
    REQUIRE_FALSE(ThresholdEngine::condition_met(high_sell, s));
}

TEST_CASE("Cooldown rules", "[thresholds]") {
    auto t0 = TimePoint(std::chrono::seconds(1700000000));
    PriceThreshold fresh{ThresholdKey::from_value(Side::Buy, 1.0), std::nullopt};
    PriceThreshold fired{ThresholdKey::from_value(Side::Buy, 1.0), t0};

    SECTION("Never-triggered thresholds are armed") {
        REQUIRE(ThresholdEngine::should_fire(fresh, 0, t0));
        REQUIRE(ThresholdEngine::should_fire(fresh, 30, t0));
    }

    SECTION("Zero reset never re-arms") {
        REQUIRE_FALSE(ThresholdEngine::should_fire(fired, 0, t0 + std::chrono::hours(24 * 365)));
    }

    SECTION("Positive reset re-arms once the minutes have elapsed") {
        REQUIRE_FALSE(ThresholdEngine::should_fire(fired, 30, t0 + 29min + 59s));
        REQUIRE(ThresholdEngine::should_fire(fired, 30, t0 + 30min));
    }
}

TEST_CASE("Buy threshold with no reset fires once", "[thresholds]") {
    auto clock = std::make_shared<ManualClock>();
    auto sink = std::make_shared<RecordingSink>();
    StateStore store(nullptr, buy_only(0.00135, 0));
    store.load();
    ThresholdEngine engine(store, clock, sink, AlertFormatter());

    auto first = engine.evaluate(sample(*clock, 0.00134, 0.00120));
    REQUIRE(first.size() == 1);
    auto fired_at = clock->now();
    REQUIRE(store.thresholds()[0].last_triggered == fired_at);
    REQUIRE(sink->size() == 1);
    REQUIRE(sink->notifications[0].title == "Buy Price Alert");

    clock->advance(24h);
    auto second = engine.evaluate(sample(*clock, 0.00130, 0.00120));
    REQUIRE(second.empty());
    REQUIRE(store.thresholds()[0].last_triggered == fired_at);
    REQUIRE(sink->size() == 1);

    SECTION("Manual reset re-arms immediately") {
        store.reset_threshold(Side::Buy, 0.00135);
        auto third = engine.evaluate(sample(*clock, 0.00130, 0.00120));
        REQUIRE(third.size() == 1);
        REQUIRE(sink->size() == 2);
    }
}

TEST_CASE("Buy threshold with a reset window", "[thresholds]") {
    auto clock = std::make_shared<ManualClock>();
    auto sink = std::make_shared<RecordingSink>();
    StateStore store(nullptr, buy_only(2.0, 10));
    store.load();
    ThresholdEngine engine(store, clock, sink, AlertFormatter());

    REQUIRE(engine.evaluate(sample(*clock, 1.5, 1.4)).size() == 1);

    clock->advance(9min);
    REQUIRE(engine.evaluate(sample(*clock, 1.5, 1.4)).empty());

    SECTION("No re-fire without the condition") {
        clock->advance(5min);
        REQUIRE(engine.evaluate(sample(*clock, 2.5, 2.4)).empty());
    }

    SECTION("Fires again after the window while the condition holds") {
        clock->advance(1min);
        REQUIRE(engine.evaluate(sample(*clock, 1.9, 1.8)).size() == 1);
        REQUIRE(store.thresholds()[0].last_triggered == clock->now());
        REQUIRE(sink->size() == 2);
    }
}

TEST_CASE("Sell thresholds fire at or above the level", "[thresholds]") {
    auto clock = std::make_shared<ManualClock>();
    auto sink = std::make_shared<RecordingSink>();
    StateDefaults defaults;
    defaults.tracked_token = fixtures::kToken;
    defaults.sell_thresholds = {0.002, 0.003};
    StateStore store(nullptr, defaults);
    store.load();
    ThresholdEngine engine(store, clock, sink, AlertFormatter());

    auto fired = engine.evaluate(sample(*clock, 0.0021, 0.002));
    REQUIRE(fired.size() == 1);
    REQUIRE(fired[0].key == ThresholdKey::from_value(Side::Sell, 0.002));
    REQUIRE(sink->notifications[0].title == "Sell Price Alert");
    REQUIRE(sink->notifications[0].meta["side"] == "sell");
}

TEST_CASE("Evaluation racing resets and additions", "[thresholds]") {
    auto clock = std::make_shared<ManualClock>();
    auto sink = std::make_shared<RecordingSink>();
    StateStore store(nullptr, buy_only(0.00135, 0));
    store.load();
    ThresholdEngine engine(store, clock, sink, AlertFormatter());

    const auto watched = ThresholdKey::from_value(Side::Buy, 0.00135);
    constexpr int kResets = 50;
    constexpr int kAdded = 20;

    std::atomic<bool> done{false};
    std::atomic<int> watched_fires{0};
    std::mutex fired_mutex;
    std::map<ThresholdKey, std::vector<TimePoint>> fired;
    size_t fired_total = 0;
    int rejected_mutations = 0;

    // Every tick is a distinct instant, so each fire leaves its own timestamp
    auto tick = [&] {
        clock->advance(1s);
        for (const auto& threshold : engine.evaluate(sample(*clock, 0.001, 0.001))) {
            std::lock_guard<std::mutex> lock(fired_mutex);
            fired[threshold.key].push_back(*threshold.last_triggered);
            fired_total++;
            if (threshold.key == watched) watched_fires++;
        }
    };

    std::thread evaluator([&] {
        while (!done) tick();
    });

    std::thread mutator([&] {
        for (int i = 0; i < kResets; i++) {
            // Re-arm only once the previous arm has fired
            auto deadline = std::chrono::steady_clock::now() + 2s;
            while (watched_fires < i + 1 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::yield();
            }
            if (!store.reset_threshold(Side::Buy, 0.00135)) {
                rejected_mutations++;
            }
            if (i < kAdded && !store.add_threshold(Side::Buy, 0.002 + 0.0001 * i)) {
                rejected_mutations++;
            }
        }
    });

    mutator.join();
    done = true;
    evaluator.join();
    tick();

    REQUIRE(rejected_mutations == 0);
    REQUIRE(watched_fires.load() == kResets + 1);
    REQUIRE(sink->size() == fired_total);
    REQUIRE(fired_total == static_cast<size_t>(kResets + 1 + kAdded));

    const auto& watched_times = fired[watched];
    for (size_t i = 1; i < watched_times.size(); i++) {
        REQUIRE(watched_times[i] > watched_times[i - 1]);
    }

    auto thresholds = store.thresholds();
    REQUIRE(thresholds.size() == static_cast<size_t>(1 + kAdded));
    for (const auto& threshold : thresholds) {
        REQUIRE(threshold.last_triggered.has_value());
        REQUIRE(fired[threshold.key].size() == (threshold.key == watched ? kResets + 1u : 1u));
        REQUIRE(*threshold.last_triggered == fired[threshold.key].back());
    }
}
