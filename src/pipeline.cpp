#include "pipeline.h"
#include "indicators/divergence.h"
#include "indicators/pivots.h"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace ds {

void PipelineSettings::validate() const {
    if (rsi_period < 2) {
        throw std::invalid_argument("rsi_period must be at least 2, got " + std::to_string(rsi_period));
    }
    if (pivot_left < 0 || pivot_right < 0) {
        throw std::invalid_argument("pivot window must be non-negative, got left=" +
                                    std::to_string(pivot_left) + " right=" + std::to_string(pivot_right));
    }
}

int SymbolAnalysis::index_of(const Date& date) const {
    auto it = std::lower_bound(bars.begin(), bars.end(), date,
                               [](const OHLCVBar& b, const Date& d) { return b.date < d; });
    if (it == bars.end() || it->date != date) return -1;
    return static_cast<int>(it - bars.begin());
}

Pipeline::Pipeline(const PipelineSettings& settings) : settings_(settings) {
    settings_.validate();
    rsi_calc_.period = settings_.rsi_period;
}

SymbolAnalysis Pipeline::compute(std::vector<OHLCVBar> bars) const {
    for (size_t i = 1; i < bars.size(); i++) {
        if (!(bars[i - 1].date < bars[i].date)) {
            throw std::runtime_error("Bar series not strictly increasing by date at " +
                                     bars[i].date.to_string());
        }
    }

    SymbolAnalysis a;
    a.bars = std::move(bars);
    const int n = static_cast<int>(a.bars.size());

    // 1. RSI
    a.rsi = rsi_calc_.compute(closes_of(a.bars));

    // 2. Pivot lows
    a.pivots = find_pivot_lows(a.rsi, settings_.pivot_left, settings_.pivot_right);

    // 3. Divergences
    a.divergences = check_bullish_divergence(a.bars, a.rsi, a.pivots);

    spdlog::debug("Pipeline: {} bars -> {} pivots -> {} divergences", n, a.pivots.size(),
                  a.divergences.size());
    return a;
}

} // namespace ds
