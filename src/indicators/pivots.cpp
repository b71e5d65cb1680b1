#include "indicators/pivots.h"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace ds {

namespace {

// NaN neighbours fail `center < v` and so disqualify the window.
bool strictly_below(double center, const std::optional<double>& neighbour) {
    return neighbour.has_value() && center < *neighbour;
}

} // anonymous namespace

std::vector<int> find_pivot_lows(const Series& series, int left, int right) {
    if (left < 0 || right < 0) {
        throw std::invalid_argument("Pivot window must be non-negative, got left=" +
                                    std::to_string(left) + " right=" + std::to_string(right));
    }

    const int n = static_cast<int>(series.size());
    std::vector<int> pivots;

    for (int i = left; i < n - right; i++) {
        if (!series[i] || !is_valid(*series[i])) continue;
        const double v = *series[i];

        bool is_pivot = true;
        for (int j = 1; j <= left && is_pivot; j++) {
            is_pivot = strictly_below(v, series[i - j]);
        }
        for (int j = 1; j <= right && is_pivot; j++) {
            is_pivot = strictly_below(v, series[i + j]);
        }

        if (is_pivot) pivots.push_back(i);
    }

    spdlog::debug("find_pivot_lows: {} pivots in {} values (left={}, right={})",
                  pivots.size(), n, left, right);
    return pivots;
}

} // namespace ds
