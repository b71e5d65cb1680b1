#pragma once

#include "indicators/base.h"
#include <vector>

namespace ds {

/// Flag bullish divergences between adjacent pivot lows.
///
/// For each pair (prev, curr) of consecutive pivots, curr is flagged iff
/// oscillator[curr] > oscillator[prev] and bars[curr].low < bars[prev].low.
/// The first pivot has no predecessor and is never flagged. Pairs with an
/// undefined oscillator value are skipped.
///
/// Throws std::out_of_range if a pivot index is outside bars or oscillator.
std::vector<int> check_bullish_divergence(const std::vector<OHLCVBar>& bars,
                                          const Series& oscillator,
                                          const std::vector<int>& pivots);

} // namespace ds
