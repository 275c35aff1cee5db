#include <catch2/catch_test_macros.hpp>
#include "../src/alert_dispatcher.hpp"
#include "../src/formatter.hpp"
#include "../src/ntfy_client.hpp"
#include "../src/util.hpp"
#include "fakes.hpp"

namespace {

Notification note(const std::string& title) {
    Notification n;
    n.title = title;
    n.message = "body";
    n.kind = "price";
    return n;
}

} // namespace

TEST_CASE("Alert formatter", "[alerts]") {
    AlertFormatter formatter("+02:00");
    auto ts = *util::parse_iso8601("2024-03-10T09:30:00Z");

    SECTION("Price alert") {
        PriceThreshold threshold{ThresholdKey::from_value(Side::Buy, 0.00135), ts};
        auto n = formatter.price_alert(threshold, PriceSample{ts, 0.00134, 0.0012});
        REQUIRE(n.title == "Buy Price Alert");
        REQUIRE(n.message.find("Buy price $0.00134000") != std::string::npos);
        REQUIRE(n.message.find("target $0.00135000") != std::string::npos);
        REQUIRE(n.message.find("2024-03-10 11:30:00 +02:00") != std::string::npos);
        REQUIRE(n.meta["ts"] == "2024-03-10T09:30:00.000Z");
    }

    SECTION("RSI alert") {
        RsiAlert alert{RsiAlertKey::parse("below:30"), true, ts};
        auto n = formatter.rsi_alert(alert, 27.5, RsiInterval::FifteenMinutes, ts);
        REQUIRE(n.title == "RSI Alert (15m)");
        REQUIRE(n.message.find("RSI 27.50 is below 30.00") != std::string::npos);
        REQUIRE(n.meta["key"] == "below:30.00");
    }
}

TEST_CASE("ntfy titles are ASCII only", "[alerts]") {
    REQUIRE(NtfyClient::ascii_title(" \xF0\x9F\x9A\xA8 Buy Price Alert ") == "Buy Price Alert");
    REQUIRE(NtfyClient::ascii_title("RSI Alert (5m)") == "RSI Alert (5m)");
}

TEST_CASE("ntfy without a topic skips delivery", "[alerts]") {
    NtfyClient client("https://ntfy.sh/", "", std::make_shared<HttpClient>(1000));
    REQUIRE_FALSE(client.enabled());
    auto result = client.send(note("x"));
    REQUIRE(result.status == DeliveryStatus::Skipped);
}

TEST_CASE("Alert dispatcher", "[alerts]") {
    auto notifier = std::make_shared<RecordingNotifier>();

    SECTION("Synchronous delivery counts outcomes") {
        AlertDispatcher dispatcher(notifier, nullptr, "");
        REQUIRE(dispatcher.deliver(note("a")).delivered());

        notifier->status = DeliveryStatus::Failed;
        REQUIRE_FALSE(dispatcher.deliver(note("b")).delivered());

        REQUIRE(dispatcher.delivered_count() == 1);
        REQUIRE(dispatcher.failed_count() == 1);
    }

    SECTION("Worker delivers queued alerts in order") {
        AlertDispatcher dispatcher(notifier, nullptr, "");
        dispatcher.start();
        dispatcher.enqueue(note("first"));
        dispatcher.enqueue(note("second"));
        dispatcher.stop();

        REQUIRE(notifier->sent_count() == 2);
        REQUIRE(notifier->sent[0].title == "first");
        REQUIRE(notifier->sent[1].title == "second");
        REQUIRE(dispatcher.pending() == 0);
    }

    SECTION("Stopping drains what is already queued") {
        AlertDispatcher dispatcher(notifier, nullptr, "");
        dispatcher.enqueue(note("queued before start"));
        dispatcher.start();
        dispatcher.stop();
        REQUIRE(notifier->sent_count() == 1);
    }

    SECTION("A full queue drops the oldest alert") {
        AlertDispatcher dispatcher(notifier, nullptr, "", 2);
        dispatcher.enqueue(note("1"));
        dispatcher.enqueue(note("2"));
        dispatcher.enqueue(note("3"));
        REQUIRE(dispatcher.pending() == 2);
        REQUIRE(dispatcher.dropped_count() == 1);

        dispatcher.start();
        dispatcher.stop();
        REQUIRE(notifier->sent[0].title == "2");
    }

    SECTION("Failed deliveries are counted") {
        notifier->status = DeliveryStatus::Failed;
        AlertDispatcher dispatcher(notifier, nullptr, "");
        dispatcher.start();
        dispatcher.enqueue(note("lost"));
        dispatcher.stop();
        REQUIRE(dispatcher.failed_count() == 1);
        REQUIRE(dispatcher.delivered_count() == 0);
    }
}
