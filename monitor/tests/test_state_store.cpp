#include <catch2/catch_test_macros.hpp>
#include "../src/state_store.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"
#include <cmath>
#include <condition_variable>
#include <future>
#include <thread>

namespace {

StateDefaults make_defaults() {
    StateDefaults defaults;
    defaults.tracked_token = fixtures::kToken;
    defaults.usd_amount = 100.0;
    defaults.history_cap = 3;
    defaults.buy_thresholds = {0.00135};
    defaults.sell_thresholds = {0.002};
    defaults.rsi_alerts = {"below:30", "above:70", "nonsense"};
    defaults.wallets = {fixtures::kWalletA, "not-a-wallet"};
    return defaults;
}

PriceSample sample_at(int seconds, double buy, double sell) {
    return PriceSample{TimePoint(std::chrono::seconds(1700000000 + seconds)), buy, sell};
}

// Saves block while the gate is closed.
class GatedDocumentStore : public DocumentStore {
public:
    std::optional<nlohmann::json> load(const std::string&) override {
        return std::nullopt;
    }

    bool save(const std::string& name, const nlohmann::json& document) override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            blocked_++;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !closed_; });
        }
        documents_[name] = document;
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = false;
        }
        cv_.notify_all();
    }

    bool wait_until_blocked() {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(2), [this] { return blocked_ > 0; });
    }

    nlohmann::json document(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return documents_[name];
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
    int blocked_ = 0;
    std::map<std::string, nlohmann::json> documents_;
};

} // namespace

TEST_CASE("State store seeding", "[state]") {
    auto docs = std::make_shared<MemoryDocumentStore>();
    StateStore store(docs, make_defaults());
    store.load();

    SECTION("Defaults seed an empty store, dropping bad entries") {
        auto snap = store.snapshot();
        REQUIRE(snap.thresholds.size() == 2);
        REQUIRE(snap.rsi_alerts.size() == 2);
        REQUIRE(snap.wallets == std::vector<std::string>{fixtures::kWalletA});
        REQUIRE(docs->documents.count("config") == 1);
        REQUIRE(docs->documents.count("runtime") == 1);
    }

    SECTION("Persisted state wins over defaults") {
        store.add_threshold(Side::Buy, 0.001);
        store.set_reset_minutes(15);

        StateDefaults other = make_defaults();
        other.buy_thresholds = {5.0};
        StateStore reloaded(docs, other);
        reloaded.load();

        REQUIRE(reloaded.reset_minutes() == 15);
        auto thresholds = reloaded.thresholds();
        REQUIRE(thresholds.size() == 3);
        bool has_five = false;
        for (const auto& t : thresholds) {
            if (t.key == ThresholdKey::from_value(Side::Buy, 5.0)) has_five = true;
        }
        REQUIRE_FALSE(has_five);
    }
}

TEST_CASE("Price thresholds", "[state]") {
    StateStore store(nullptr, make_defaults());
    store.load();

    SECTION("Duplicate add is a no-op") {
        REQUIRE_FALSE(store.add_threshold(Side::Buy, 0.00135));
        REQUIRE(store.add_threshold(Side::Sell, 0.00135));
        REQUIRE(store.thresholds().size() == 3);
    }

    SECTION("Removing an absent key is a no-op") {
        REQUIRE_FALSE(store.remove_threshold(Side::Sell, 9.0));
        REQUIRE(store.remove_threshold(Side::Sell, 0.002));
        REQUIRE(store.thresholds().size() == 1);
    }

    SECTION("Invalid values are rejected before any change") {
        REQUIRE_THROWS_AS(store.add_threshold(Side::Buy, -1.0), InvalidInput);
        REQUIRE_THROWS_AS(store.add_threshold(Side::Buy, 0.0), InvalidInput);
        REQUIRE_THROWS_AS(store.add_threshold(Side::Buy, std::nan("")), InvalidInput);
        REQUIRE(store.thresholds().size() == 2);
    }

    SECTION("Reset clears the trigger instant") {
        auto now = TimePoint(std::chrono::seconds(1700000000));
        store.evaluate_thresholds([&](PriceThreshold& t, int) {
            t.last_triggered = now;
            return true;
        });
        REQUIRE(store.reset_threshold(Side::Buy, 0.00135));
        for (const auto& t : store.thresholds()) {
            if (t.key.side == Side::Buy) {
                REQUIRE_FALSE(t.last_triggered.has_value());
            } else {
                REQUIRE(t.last_triggered == now);
            }
        }
    }
}

TEST_CASE("Price history", "[state]") {
    StateStore store(nullptr, make_defaults());
    store.load();

    SECTION("History is capped, oldest dropped first") {
        for (int i = 0; i < 5; i++) {
            store.append_price(sample_at(i, 1.0 + i, 1.0));
        }
        auto history = store.price_history();
        REQUIRE(history.size() == 3);
        REQUIRE(history.front().buy_price == 3.0);
        REQUIRE(history.back().buy_price == 5.0);
    }

    SECTION("Changing the notional clears history") {
        store.append_price(sample_at(0, 1.0, 1.0));
        store.set_usd_amount(250.0);
        REQUIRE(store.usd_amount() == 250.0);
        REQUIRE(store.price_history().empty());
    }

    SECTION("Notional must be positive") {
        store.append_price(sample_at(0, 1.0, 1.0));
        REQUIRE_THROWS_AS(store.set_usd_amount(0.0), InvalidInput);
        REQUIRE(store.price_history().size() == 1);
        REQUIRE_THROWS_AS(store.set_reset_minutes(-1), InvalidInput);
    }
}

TEST_CASE("Wallets and RSI settings", "[state]") {
    StateStore store(nullptr, make_defaults());
    store.load();

    SECTION("Wallet addresses are validated and deduplicated") {
        REQUIRE(store.add_wallet(fixtures::kWalletB));
        REQUIRE_FALSE(store.add_wallet(fixtures::kWalletB));
        REQUIRE_THROWS_AS(store.add_wallet("0OIl"), InvalidInput);
        REQUIRE(store.wallets().size() == 2);
    }

    SECTION("RSI interval") {
        REQUIRE(store.set_rsi_interval("1m"));
        REQUIRE_FALSE(store.set_rsi_interval(RsiInterval::OneMinute));
        REQUIRE_THROWS_AS(store.set_rsi_interval("7m"), InvalidInput);
        REQUIRE(store.rsi_config().interval == RsiInterval::OneMinute);
    }

    SECTION("RSI alert reset clears triggered state") {
        auto key = RsiAlertKey::parse("above:70");
        store.evaluate_rsi_alerts([](RsiAlert& alert, const RsiConfig&) {
            alert.triggered = true;
            return true;
        });
        REQUIRE(store.reset_rsi_alert(key));
        REQUIRE_FALSE(store.reset_rsi_alert(RsiAlertKey::parse("above:90")));
        for (const auto& alert : store.rsi_alerts()) {
            REQUIRE(alert.triggered == (alert.key != key));
        }
    }
}

TEST_CASE("Runtime state survives a restart", "[state]") {
    auto docs = std::make_shared<MemoryDocumentStore>();
    auto fired_at = TimePoint(std::chrono::seconds(1700000000));
    {
        StateStore store(docs, make_defaults());
        store.load();
        store.append_price(sample_at(0, 0.0013, 0.0012));
        store.evaluate_thresholds([&](PriceThreshold& t, int) {
            if (t.key.side != Side::Buy) return false;
            t.last_triggered = fired_at;
            return true;
        });
        store.evaluate_rsi_alerts([](RsiAlert& alert, const RsiConfig&) {
            if (alert.key.direction != RsiDirection::Below) return false;
            alert.triggered = true;
            return true;
        });
    }

    REQUIRE(docs->documents["runtime"]["last_triggered_buy"].contains("0.00135000"));

    StateStore restored(docs, make_defaults());
    restored.load();
    REQUIRE(restored.price_history().size() == 1);
    for (const auto& t : restored.thresholds()) {
        if (t.key.side == Side::Buy) {
            REQUIRE(t.last_triggered == fired_at);
        }
    }
    for (const auto& alert : restored.rsi_alerts()) {
        REQUIRE(alert.triggered == (alert.key.direction == RsiDirection::Below));
    }
}

TEST_CASE("Persistence failure keeps the in-memory change", "[state]") {
    auto docs = std::make_shared<MemoryDocumentStore>();
    StateStore store(docs, make_defaults());
    store.load();

    docs->fail_saves = true;
    REQUIRE(store.add_threshold(Side::Buy, 0.5));
    REQUIRE(store.thresholds().size() == 3);
}

TEST_CASE("Snapshot JSON view", "[state]") {
    StateStore store(nullptr, make_defaults());
    store.load();
    store.append_price(sample_at(0, 0.0013, 0.0012));

    auto j = store.snapshot().to_json();
    REQUIRE(j["tracked_token"] == fixtures::kToken);
    REQUIRE(j["buy_alerts"].size() == 1);
    REQUIRE(j["sell_alerts"].size() == 1);
    REQUIRE(j["latest_prices"].size() == 1);
    REQUIRE(j["rsi_interval"] == "5m");
    REQUIRE(j["rsi_alerts"].contains("above:70.00"));
    REQUIRE(j["pnl"].is_null());
}

TEST_CASE("A slow save does not block readers", "[state]") {
    auto docs = std::make_shared<GatedDocumentStore>();
    StateStore store(docs, make_defaults());
    store.load();
    docs->close();

    std::thread first([&] { store.append_price(sample_at(0, 1.0, 0.9)); });
    REQUIRE(docs->wait_until_blocked());

    auto reader = std::async(std::launch::async, [&] { return store.price_history().size(); });
    bool answered = reader.wait_for(std::chrono::seconds(2)) == std::future_status::ready;

    // Queues behind the blocked save with a newer document
    std::thread second([&] { store.append_price(sample_at(1, 1.1, 1.0)); });

    auto evaluator = std::async(std::launch::async, [&] {
        return store.evaluate_thresholds([](PriceThreshold&, int) { return false; }).size();
    });
    bool evaluated = evaluator.wait_for(std::chrono::seconds(2)) == std::future_status::ready;

    docs->open();
    first.join();
    second.join();

    REQUIRE(answered);
    REQUIRE(reader.get() == 1);
    REQUIRE(evaluated);
    REQUIRE(evaluator.get() == 0);
    REQUIRE(docs->document("runtime")["latest_prices"].size() == 2);
}
