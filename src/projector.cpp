#include "projector.h"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace ds {

SignalProjection project_signal(const std::vector<OHLCVBar>& bars,
                                int idx,
                                bool use_next_open,
                                int horizon)
{
    const int n = static_cast<int>(bars.size());
    if (idx < 0 || idx >= n) {
        throw std::out_of_range("Signal index " + std::to_string(idx) +
                                " outside series of " + std::to_string(n) + " bars");
    }
    if (horizon <= 0) {
        throw std::invalid_argument("Projection horizon must be positive, got " + std::to_string(horizon));
    }

    SignalProjection p;
    p.index = idx;
    p.divergence_close = bars[idx].close;
    p.forward_returns.assign(horizon, std::nullopt);

    if (idx > 0) p.prev_close = bars[idx - 1].close;
    if (idx + 1 < n) p.next_open = bars[idx + 1].open;

    if (use_next_open && p.next_open) {
        p.base_price = *p.next_open;
        p.basis = PriceBasis::NextOpen;
    } else {
        p.base_price = p.divergence_close;
        p.basis = PriceBasis::Close;
    }

    if (!is_valid(p.base_price) || p.base_price == 0.0) {
        spdlog::debug("project_signal: degenerate base price {} at index {}, projection unavailable",
                      p.base_price, idx);
        p.available = false;
        return p;
    }

    for (int j = 1; j <= horizon; j++) {
        if (idx + j >= n) break;
        double future_close = bars[idx + j].close;
        if (!is_valid(future_close)) continue;
        p.forward_returns[j - 1] = round2((future_close - p.base_price) / p.base_price * 100.0);
        p.available_days = j;
    }

    return p;
}

} // namespace ds
