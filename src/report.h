#pragma once

#include "scanner.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ds {

/// 12345 -> "12.3k"
std::string format_volume(int64_t volume);

/// TradingView chart URL for NSE (".NS") and BSE (".BSE") symbols.
std::optional<std::string> tradingview_link(const std::string& symbol);

/// "RSI Divergence Alert - 2 Signal(s) - 2025-04-07"
std::string build_alert_subject(size_t signal_count, const Date& date);

/// Plain-text alert body for same-day signals. `generated_at` is printed
/// under the title as-is.
std::string build_text_report(const std::vector<DivergenceSignal>& signals,
                              const std::string& generated_at);

/// Fixed-width table of projection records, one row per record.
std::string build_projection_table(const std::vector<ProjectionRecord>& records);

// JSON encodings. Prices and RSI are rounded to 2 decimals; absent values
// are null. Found by nlohmann::json through ADL.
void to_json(nlohmann::json& j, const DivergenceSignal& s);
void to_json(nlohmann::json& j, const ProjectionRecord& r);
void to_json(nlohmann::json& j, const SymbolError& e);

} // namespace ds
