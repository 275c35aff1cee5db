#pragma once

#include <vector>
#include <optional>

namespace rsi {

constexpr int kDefaultPeriod = 14;

// Wilder RSI of the last close. Seeded with the simple mean of the first
// `period` changes, then avg = (avg * (period - 1) + x) / period.
// Needs at least period + 1 closes. Result rounded to 2 decimals.
std::optional<double> compute_latest(const std::vector<double>& closes,
                                     int period = kDefaultPeriod);

double from_averages(double avg_gain, double avg_loss);

double round2(double value);

} // namespace rsi
