#pragma once

#include "indicators/base.h"

#include <optional>
#include <vector>

namespace ds {

constexpr int DEFAULT_HORIZON = 5;

enum class PriceBasis { Close, NextOpen };

inline const char* to_string(PriceBasis basis) {
    switch (basis) {
        case PriceBasis::NextOpen: return "Open Next Day";
        case PriceBasis::Close:    return "Close";
    }
    return "Close";
}

/// Forward returns following a divergence bar.
struct SignalProjection {
    int index = -1;
    std::optional<double> prev_close;
    double divergence_close = 0.0;
    std::optional<double> next_open;
    double base_price = 0.0;
    PriceBasis basis = PriceBasis::Close;

    /// False when the base price is zero or non-finite; every return slot is
    /// then nullopt.
    bool available = true;

    /// forward_returns[j - 1] is the Day+j percentage return against
    /// base_price, rounded to 2 decimals. nullopt where bar idx + j does not
    /// exist. Always `horizon` slots long.
    std::vector<std::optional<double>> forward_returns;

    /// Largest j with a computed return, 0 if none.
    int available_days = 0;
};

/// Project returns for the divergence at bar `idx`.
///
/// The base price is the next bar's open when `use_next_open` is set and that
/// bar exists, otherwise the close of bar `idx`.
/// Throws std::out_of_range for an index outside bars and
/// std::invalid_argument for horizon <= 0.
SignalProjection project_signal(const std::vector<OHLCVBar>& bars,
                                int idx,
                                bool use_next_open,
                                int horizon = DEFAULT_HORIZON);

} // namespace ds
