#pragma once

#include <vector>
#include "common/Types.h"
#include "backtest/Portfolio.h"

namespace stratlab {
namespace backtest {

struct DrawdownInfo {
    double max_drawdown_pct = 0.0;  // <= 0
    Timestamp peak_date = 0;
    Timestamp trough_date = 0;
    double peak_value = 0.0;
    double trough_value = 0.0;
};

struct MetricsReport {
    bool has_equity = false;        // false when the equity curve was empty
    double initial_capital = 0.0;
    double final_equity = 0.0;
    double total_return_pct = 0.0;
    double cagr_pct = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    DrawdownInfo drawdown;

    int total_trades = 0;
    int winning_trades = 0;         // pnl > 0
    int losing_trades = 0;          // pnl < 0
    double win_rate_pct = 0.0;
    double profit_factor = 0.0;     // +inf with profits and no losses
    double expectancy = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;
    double avg_holding_days = 0.0;
};

struct MonthlyReturn {
    int year = 0;
    unsigned month = 0;
    double return_pct = 0.0;
};

struct TradeDistribution {
    double mean_pnl = 0.0;
    double median_pnl = 0.0;
    double std_pnl = 0.0;           // population
    double mean_pnl_pct = 0.0;
    double median_pnl_pct = 0.0;
    double std_pnl_pct = 0.0;
};

class PerformanceMetrics {
public:
    // Simple returns between consecutive points; the first is 0.
    static std::vector<double> calculateReturns(const std::vector<EquityPoint>& curve);

    static double totalReturn(double initial_capital, double final_equity);
    static double cagr(double initial_capital, double final_equity, double years);

    // Annualized over 252 periods with sample standard deviation.
    static double sharpeRatio(const std::vector<double>& returns, double risk_free_rate = 0.02);
    static double sortinoRatio(const std::vector<double>& returns, double risk_free_rate = 0.02);

    // Deepest (equity - running max) / running max and the peak preceding it.
    static DrawdownInfo maxDrawdown(const std::vector<EquityPoint>& curve);

    static double winRate(const std::vector<Trade>& trades);
    static double profitFactor(const std::vector<Trade>& trades);
    static double expectancy(const std::vector<Trade>& trades);

    static MetricsReport calculateAll(const std::vector<EquityPoint>& curve,
                                      const std::vector<Trade>& trades,
                                      double initial_capital,
                                      double risk_free_rate = 0.02);

    // Month-end equity change in percent; the first month has no prior and is omitted.
    static std::vector<MonthlyReturn> monthlyReturns(const std::vector<EquityPoint>& curve);

    // All zeros when there are no trades.
    static TradeDistribution tradeDistribution(const std::vector<Trade>& trades);
};

} // namespace backtest
} // namespace stratlab
