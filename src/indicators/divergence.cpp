#include "indicators/divergence.h"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace ds {

std::vector<int> check_bullish_divergence(const std::vector<OHLCVBar>& bars,
                                          const Series& oscillator,
                                          const std::vector<int>& pivots)
{
    const int n_bars = static_cast<int>(bars.size());
    const int n_osc = static_cast<int>(oscillator.size());
    for (int p : pivots) {
        if (p < 0 || p >= n_bars || p >= n_osc) {
            throw std::out_of_range("Pivot index " + std::to_string(p) + " outside series of " +
                                    std::to_string(n_bars) + " bars / " +
                                    std::to_string(n_osc) + " oscillator values");
        }
    }

    std::vector<int> divergences;

    for (size_t k = 1; k < pivots.size(); k++) {
        const int curr = pivots[k];
        const int prev = pivots[k - 1];

        const auto& osc_curr = oscillator[curr];
        const auto& osc_prev = oscillator[prev];
        if (!osc_curr || !osc_prev) continue;

        bool osc_higher_low = *osc_curr > *osc_prev;
        bool price_lower_low = bars[curr].low < bars[prev].low;

        if (osc_higher_low && price_lower_low) {
            divergences.push_back(curr);
        }
    }

    spdlog::debug("check_bullish_divergence: {} of {} pivots flagged", divergences.size(), pivots.size());
    return divergences;
}

} // namespace ds
