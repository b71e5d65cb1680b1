#pragma once

#include "indicators/base.h"
#include <vector>

namespace ds {

/// Relative Strength Index over close prices, computed with TA-Lib (TA_RSI).
///
/// The first average gain and loss are the plain means of the first `period`
/// moves; later values are Wilder-smoothed. The first `period` entries are
/// nullopt. RSI = 100 * gain / (gain + loss), 0 when there is no movement.
/// A non-finite close splits the series: each finite run gets its own warm-up.
struct RsiCalculator {
    int period = 14;

    /// Throws std::invalid_argument if period < 2 (TA-Lib's minimum). Fewer
    /// than period + 1 closes yields an all-nullopt series of the same length.
    Series compute(const std::vector<double>& closes) const;
};

} // namespace ds
