#include "rsi.hpp"
#include <cmath>

namespace rsi {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return 100.0;
    }
    if (avg_gain == 0.0) {
        return 0.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

std::optional<double> compute_latest(const std::vector<double>& closes, int period) {
    if (period <= 0 || closes.size() < static_cast<size_t>(period) + 1) {
        return std::nullopt;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; i++) {
        double delta = closes[i] - closes[i - 1];
        if (delta > 0) {
            avg_gain += delta;
        } else {
            avg_loss -= delta;
        }
    }
    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = period + 1; i < closes.size(); i++) {
        double delta = closes[i] - closes[i - 1];
        double gain = delta > 0 ? delta : 0.0;
        double loss = delta < 0 ? -delta : 0.0;
        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
    }

    return round2(from_averages(avg_gain, avg_loss));
}

} // namespace rsi
