#pragma once

#include "calendar.h"

#include <cmath>
#include <cstdint>
#include <optional>
#include <vector>

namespace ds {

struct OHLCVBar {
    Date date;          // exchange-local session date
    double open, high, low, close;
    int64_t volume;
};

/// Indicator values aligned 1:1 with a bar series. std::nullopt marks
/// indices where the indicator is undefined (warm-up, missing input).
using Series = std::vector<std::optional<double>>;

// ---------------------------------------------------------------------------
// Math utilities
// ---------------------------------------------------------------------------

inline bool is_valid(double v) {
    return std::isfinite(v);
}

/// Round half away from zero to 2 decimal places.
inline double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

inline std::vector<double> closes_of(const std::vector<OHLCVBar>& bars) {
    std::vector<double> closes;
    closes.reserve(bars.size());
    for (const auto& b : bars) closes.push_back(b.close);
    return closes;
}

} // namespace ds
