#pragma once

#include "indicators/base.h"
#include "indicators/rsi.h"

#include <vector>

namespace ds {

struct PipelineSettings {
    int rsi_period = 14;
    int pivot_left = 5;
    int pivot_right = 5;

    /// Throws std::invalid_argument on a period below 2 or a negative
    /// pivot window.
    void validate() const;
};

/// Everything derived from one symbol's bar series.
struct SymbolAnalysis {
    std::vector<OHLCVBar> bars;
    Series rsi;
    std::vector<int> pivots;
    std::vector<int> divergences;

    /// Index of the bar dated `date`, or -1.
    int index_of(const Date& date) const;
};

/// Orchestrate the per-symbol computation in dependency order:
/// 1. RSI over closes
/// 2. Pivot lows over RSI
/// 3. Bullish divergence between adjacent pivots
class Pipeline {
public:
    explicit Pipeline(const PipelineSettings& settings = {});

    /// Throws std::runtime_error if bars are not strictly increasing by date.
    SymbolAnalysis compute(std::vector<OHLCVBar> bars) const;

    const PipelineSettings& settings() const { return settings_; }

private:
    PipelineSettings settings_;
    RsiCalculator rsi_calc_;
};

} // namespace ds
