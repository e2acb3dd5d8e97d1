#pragma once

#include <optional>
#include <string>

namespace stratlab {
namespace backtest {

// Which commission figure a closed Trade carries.
enum class CommissionAttribution {
    PER_TRADE,      // entry + exit commission of that round trip
    CUMULATIVE      // portfolio running total at close time, before the exit commission (legacy)
};

inline std::string toString(CommissionAttribution attribution) {
    return attribution == CommissionAttribution::CUMULATIVE ? "cumulative" : "per_trade";
}

inline std::optional<CommissionAttribution> commissionAttributionFromString(const std::string& value) {
    if (value == "per_trade") return CommissionAttribution::PER_TRADE;
    if (value == "cumulative") return CommissionAttribution::CUMULATIVE;
    return std::nullopt;
}

// Explicit run parameters handed to the BacktestEngine.
struct BacktestConfig {
    double initial_capital = 100000.0;
    double commission_rate = 0.001;     // 0.1% per side
    double slippage_rate = 0.0005;      // 0.05% against the fill
    double risk_free_rate = 0.02;       // annual, for Sharpe/Sortino
    CommissionAttribution commission_attribution = CommissionAttribution::PER_TRADE;
};

} // namespace backtest
} // namespace stratlab
