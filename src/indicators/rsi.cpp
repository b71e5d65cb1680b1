#include "indicators/rsi.h"

#include <spdlog/spdlog.h>
#include <ta-lib/ta_libc.h>
#include <stdexcept>
#include <string>

namespace ds {

namespace {

void ensure_talib() {
    static const TA_RetCode init = TA_Initialize();
    if (init != TA_SUCCESS) {
        throw std::runtime_error("TA_Initialize failed: [" + std::to_string(init) + "]");
    }
}

// Write TA-Lib output into the series, offset by the run start and outBegIdx
void write_output(Series& out, const double* values, int run_start, int outBegIdx, int outNbElement) {
    for (int i = 0; i < outNbElement; i++)
        out[run_start + outBegIdx + i] = values[i];
}

} // anonymous namespace

Series RsiCalculator::compute(const std::vector<double>& closes) const {
    if (period < 2) {
        throw std::invalid_argument("RSI period must be at least 2, got " + std::to_string(period));
    }
    ensure_talib();

    const int n = static_cast<int>(closes.size());
    Series out(n);

    if (n < period + 1) {
        spdlog::debug("RsiCalculator: {} closes is less than period {} + 1, no values", n, period);
        return out;
    }

    // TA-Lib has no missing-value marker, so each run of finite closes is
    // computed on its own.
    std::vector<double> buf(n);
    int runs = 0;
    for (int start = 0; start < n;) {
        if (!is_valid(closes[start])) {
            start++;
            continue;
        }
        int end = start;
        while (end < n && is_valid(closes[end])) end++;

        const int len = end - start;
        if (len >= period + 1) {
            int outBeg = 0, outNb = 0;
            TA_RetCode rc = TA_RSI(0, len - 1, closes.data() + start, period, &outBeg, &outNb, buf.data());
            if (rc != TA_SUCCESS) {
                throw std::runtime_error("TA_RSI failed: [" + std::to_string(rc) + "]");
            }
            write_output(out, buf.data(), start, outBeg, outNb);
            runs++;
        }
        start = end;
    }

    spdlog::debug("RsiCalculator: computed {} closes in {} runs (period={})", n, runs, period);
    return out;
}

} // namespace ds
