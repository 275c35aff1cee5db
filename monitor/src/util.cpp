#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>

namespace util {

namespace {

// Parses "+HH:MM", "-HHMM" or "Z" into seconds east of UTC.
std::optional<int> parse_offset(const std::string& text) {
    if (text.empty() || text == "Z" || text == "UTC") return 0;
    if (text[0] != '+' && text[0] != '-') return std::nullopt;

    int hours = 0;
    int minutes = 0;
    std::string digits = text.substr(1);
    digits.erase(std::remove(digits.begin(), digits.end(), ':'), digits.end());
    if (digits.size() != 4 || !std::all_of(digits.begin(), digits.end(),
                                                 [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    hours = std::stoi(digits.substr(0, 2));
    minutes = std::stoi(digits.substr(2, 2));
    if (hours > 14 || minutes > 59) return std::nullopt;

    int seconds = hours * 3600 + minutes * 60;
    return text[0] == '-' ? -seconds : seconds;
}

std::tm to_utc_tm(TimePoint tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&itt, &tm);
    return tm;
}

} // namespace

std::string format_iso8601(TimePoint tp) {
    auto tm = to_utc_tm(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    std::ostringstream ss;
    ss << std::put_time(&tm, "%FT%T") << '.'
       << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    std::string s = trim(text);
    if (s.size() < 19) return std::nullopt;

    std::tm tm{};
    std::istringstream ss(s.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        // Accept the space separated form as well
        std::istringstream alt(s.substr(0, 19));
        tm = std::tm{};
        alt >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (alt.fail()) return std::nullopt;
    }

    size_t pos = 19;
    int64_t millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        std::string frac;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            frac += s[pos++];
        }
        if (frac.empty()) return std::nullopt;
        frac = frac.substr(0, 3);
        while (frac.size() < 3) frac += '0';
        millis = std::stoll(frac);
    }

    auto offset = parse_offset(s.substr(pos));
    if (!offset) return std::nullopt;

    time_t epoch = timegm(&tm);
    if (epoch == static_cast<time_t>(-1)) return std::nullopt;

    auto tp = std::chrono::system_clock::from_time_t(epoch)
            + std::chrono::milliseconds(millis)
            - std::chrono::seconds(*offset);
    return tp;
}

bool is_valid_zone(const std::string& zone) {
    return parse_offset(zone).has_value();
}

std::string format_display(TimePoint tp, const std::string& zone) {
    auto offset = parse_offset(zone).value_or(0);
    auto tm = to_utc_tm(tp + std::chrono::seconds(offset));

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (offset == 0) {
        ss << " UTC";
    } else {
        int abs_offset = std::abs(offset);
        ss << ' ' << (offset < 0 ? '-' : '+')
           << std::setw(2) << std::setfill('0') << abs_offset / 3600 << ':'
           << std::setw(2) << std::setfill('0') << (abs_offset % 3600) / 60;
    }
    return ss.str();
}

TimePoint from_timestamp_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

bool is_valid_solana_address(const std::string& address) {
    static const std::string base58 =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    if (address.size() < 32 || address.size() > 44) return false;
    return address.find_first_not_of(base58) == std::string::npos;
}

std::string short_address(const std::string& address) {
    if (address.size() <= 10) return address;
    return address.substr(0, 4) + "..." + address.substr(address.size() - 4);
}

} // namespace util
