#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"

TEST_CASE("ISO-8601 instants", "[util]") {
    SECTION("Offsets are folded into UTC") {
        auto utc = util::parse_iso8601("2024-03-10T09:30:00Z");
        auto shifted = util::parse_iso8601("2024-03-10T11:30:00+02:00");
        REQUIRE(utc.has_value());
        REQUIRE(shifted.has_value());
        REQUIRE(*utc == *shifted);
    }

    SECTION("Fractional seconds and space separator") {
        auto tp = util::parse_iso8601("2024-03-10 09:30:00.250");
        REQUIRE(tp.has_value());
        REQUIRE(util::format_iso8601(*tp) == "2024-03-10T09:30:00.250Z");
    }

    SECTION("Garbage is rejected") {
        REQUIRE_FALSE(util::parse_iso8601("yesterday").has_value());
        REQUIRE_FALSE(util::parse_iso8601("2024-03-10T09:30:00+25:00").has_value());
    }
}

TEST_CASE("Display time zone", "[util]") {
    auto tp = *util::parse_iso8601("2024-03-10T23:30:00Z");

    REQUIRE(util::format_display(tp, "UTC") == "2024-03-10 23:30:00 UTC");
    REQUIRE(util::format_display(tp, "+05:30") == "2024-03-11 05:00:00 +05:30");
    REQUIRE(util::format_display(tp, "-0800") == "2024-03-10 15:30:00 -08:00");
    REQUIRE(util::is_valid_zone("+02:00"));
    REQUIRE_FALSE(util::is_valid_zone("Europe/Berlin"));
    REQUIRE_FALSE(util::is_valid_zone("+\xC3\xA9\xC3\xA9"));
    REQUIRE_FALSE(util::is_valid_zone("-\xFF\xFF\xFF\xFF"));
    REQUIRE_FALSE(util::parse_iso8601("2024-03-10T09:30:00+\xC3\xA9:00").has_value());
}

TEST_CASE("String helpers", "[util]") {
    REQUIRE(util::split(" 1.5, ,2 ,", ',') == std::vector<std::string>{"1.5", "2"});
    REQUIRE(util::trim("\t x \n") == "x");
    REQUIRE(util::to_lower("AbC") == "abc");
}

TEST_CASE("Solana addresses", "[util]") {
    REQUIRE(util::is_valid_solana_address("9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM"));
    REQUIRE_FALSE(util::is_valid_solana_address("short"));
    // 0, O, I and l are not base58
    REQUIRE_FALSE(util::is_valid_solana_address("0WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM"));
    REQUIRE(util::short_address("9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM") == "9WzD...AWWM");
}
