#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace util {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string format_iso8601(TimePoint tp);
    std::optional<TimePoint> parse_iso8601(const std::string& text);

    // Renders tp for humans. zone is "UTC" or a fixed offset such as "+02:00".
    std::string format_display(TimePoint tp, const std::string& zone);
    bool is_valid_zone(const std::string& zone);

    TimePoint from_timestamp_ms(int64_t ms);

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_lower(std::string str);

    bool is_valid_solana_address(const std::string& address);
    std::string short_address(const std::string& address);
}
