#include "report.h"

#include <spdlog/fmt/fmt.h>

namespace ds {

namespace {

constexpr const char* RULE = "========================================\n";

nlohmann::json rounded_or_null(const std::optional<double>& v) {
    if (!v || !is_valid(*v)) return nullptr;
    return round2(*v);
}

std::string cell(const std::optional<double>& v) {
    if (!v) return "-";
    return fmt::format("{:.2f}", *v);
}

} // anonymous namespace

std::string format_volume(int64_t volume) {
    return fmt::format("{:.1f}k", static_cast<double>(volume) / 1000.0);
}

std::optional<std::string> tradingview_link(const std::string& symbol) {
    auto ends_with = [&symbol](const std::string& suffix) {
        return symbol.size() > suffix.size() &&
               symbol.compare(symbol.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    std::string exchange;
    if (ends_with(".NS")) {
        exchange = "NSE";
    } else if (ends_with(".BSE")) {
        exchange = "BSE";
    } else {
        return std::nullopt;
    }

    std::string base = symbol.substr(0, symbol.find('.'));
    return "https://www.tradingview.com/chart/?symbol=" + exchange + ":" + base;
}

std::string build_alert_subject(size_t signal_count, const Date& date) {
    return fmt::format("RSI Divergence Alert - {} Signal(s) - {}", signal_count, date.to_string());
}

std::string build_text_report(const std::vector<DivergenceSignal>& signals,
                              const std::string& generated_at)
{
    if (signals.empty()) {
        return "No bullish RSI divergences detected today.\n";
    }

    std::string out;
    out += RULE;
    out += "RSI DIVERGENCE INDICATOR\n";
    out += RULE;
    out += "\nBULLISH DIVERGENCE ALERT\n";
    out += generated_at + "\n\n";
    out += fmt::format("DETECTED {} BULLISH RSI DIVERGENCE SIGNAL{}\n\n", signals.size(),
                       signals.size() > 1 ? "S" : "");
    out += "Stock Details:\n";

    for (size_t i = 0; i < signals.size(); i++) {
        const auto& s = signals[i];
        out += fmt::format("\n{}. {}\n", i + 1, s.symbol);
        out += fmt::format("   RSI: {:.2f}\n", s.rsi);
        out += fmt::format("   Close Price: ₹{:.2f}\n", s.close);
        out += fmt::format("   Low Price: ₹{:.2f}\n", s.low);
        out += fmt::format("   High Price: ₹{:.2f}\n", s.high);
        out += fmt::format("   Volume: {}\n", format_volume(s.volume));
        if (auto link = tradingview_link(s.symbol)) {
            out += fmt::format("   Chart: {}\n", *link);
        }
    }

    out += "\n";
    out += RULE;
    out += "WHAT IS RSI BULLISH DIVERGENCE?\n";
    out += RULE;
    out += "\nRSI Bullish Divergence occurs when the stock price makes a lower low, "
           "but the RSI makes a higher low. This technical pattern suggests that selling "
           "pressure is weakening and a potential upward price movement may follow.\n\n";
    out += "DISCLAIMER: This is an automated technical analysis alert for educational "
           "purposes only. Please conduct your own research and consult with a qualified "
           "financial advisor before making any investment decisions. Past performance "
           "does not guarantee future results.\n";
    return out;
}

std::string build_projection_table(const std::vector<ProjectionRecord>& records) {
    if (records.empty()) return "No bullish RSI divergences found.\n";

    size_t horizon = records.front().projection.forward_returns.size();

    std::string out = fmt::format("{:<16} {:>10} {:>10} {:>10} {:>7} {:<14} {:>4}",
                                  "Symbol", "PrevClose", "DivClose", "NextOpen", "RSI", "Basis", "Days");
    for (size_t j = 1; j <= horizon; j++) out += fmt::format(" {:>8}", fmt::format("Day+{}", j));
    out += "\n";

    for (const auto& r : records) {
        const auto& p = r.projection;
        out += fmt::format("{:<16} {:>10} {:>10.2f} {:>10} {:>7.2f} {:<14} {:>4}",
                           r.symbol, cell(p.prev_close), p.divergence_close, cell(p.next_open),
                           r.rsi, to_string(p.basis), p.available_days);
        for (size_t j = 0; j < horizon; j++) {
            std::optional<double> v = j < p.forward_returns.size() ? p.forward_returns[j] : std::nullopt;
            out += fmt::format(" {:>8}", p.available ? cell(v) : "n/a");
        }
        out += "\n";
    }
    return out;
}


void to_json(nlohmann::json& j, const DivergenceSignal& s) {
    j = nlohmann::json{
        {"symbol", s.symbol},
        {"date", s.date.to_string()},
        {"rsi", round2(s.rsi)},
        {"close", round2(s.close)},
        {"low", round2(s.low)},
        {"high", round2(s.high)},
        {"volume", s.volume},
    };
    if (auto link = tradingview_link(s.symbol)) j["chart"] = *link;
}

void to_json(nlohmann::json& j, const ProjectionRecord& r) {
    const auto& p = r.projection;
    j = nlohmann::json{
        {"symbol", r.symbol},
        {"date", r.date.to_string()},
        {"rsi", round2(r.rsi)},
        {"prev_close", rounded_or_null(p.prev_close)},
        {"divergence_close", rounded_or_null(p.divergence_close)},
        {"open_next_day", rounded_or_null(p.next_open)},
        {"used_price", to_string(p.basis)},
        {"base_price", rounded_or_null(p.base_price)},
        {"available", p.available},
        {"available_future_days", p.available_days},
        {"is_today_signal", r.is_today_signal},
    };
    for (size_t k = 0; k < p.forward_returns.size(); k++) {
        j[fmt::format("day_{}_return_pct", k + 1)] = rounded_or_null(p.forward_returns[k]);
    }
}

void to_json(nlohmann::json& j, const SymbolError& e) {
    j = nlohmann::json{{"symbol", e.symbol}, {"error", e.message}};
}

} // namespace ds
