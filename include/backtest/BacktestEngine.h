#pragma once

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <utility>
#include "common/Types.h"
#include "analytics/IndicatorFrame.h"
#include "backtest/BacktestConfig.h"
#include "backtest/IMarketDataSource.h"
#include "backtest/Portfolio.h"
#include "backtest/PerformanceMetrics.h"
#include "strategy/RuleAst.h"
#include "strategy/Strategy.h"

namespace stratlab {
namespace backtest {

struct BacktestResult {
    std::vector<std::string> tickers;
    std::string strategy_name;
    std::string start_date;
    std::string end_date;
    double initial_capital = 0.0;

    MetricsReport metrics;
    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    PortfolioStatistics portfolio_stats;
    std::vector<MonthlyReturn> monthly_returns;
    TradeDistribution trade_distribution;

    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

using TickerBars = std::pair<std::string, std::vector<Bar>>;

// Bar-by-bar simulation of one strategy. Holds only its configuration and
// data source, so separate runs may execute concurrently.
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config = {},
                            std::shared_ptr<IMarketDataSource> data_source = nullptr);

    // Fetch from the data source, then runSingle().
    BacktestResult runBacktest(const std::string& ticker,
                               const strategy::Strategy& strategy,
                               const std::string& start_date,
                               const std::string& end_date) const;

    // Fetch every ticker, then runMulti() over those with data.
    BacktestResult runMultiBacktest(const std::vector<std::string>& tickers,
                                    const strategy::Strategy& strategy,
                                    const std::string& start_date,
                                    const std::string& end_date) const;

    BacktestResult runSingle(const std::string& ticker,
                             const std::vector<Bar>& bars,
                             const strategy::Strategy& strategy) const;

    // Shared cash over the union of dates; within a date tickers are
    // processed in the given order.
    BacktestResult runMulti(const std::vector<TickerBars>& data,
                            const strategy::Strategy& strategy) const;

    const BacktestConfig& config() const { return config_; }

private:
    // Per-ticker signals and state for one run
    struct TickerRun {
        std::string ticker;
        analytics::IndicatorFrame frame;
        SignalSeries entry_signal;
        SignalSeries exit_signal;
        strategy::RuleList exit_rules;
        bool exit_uses_entry_price = false;
    };

    TickerRun prepare(const std::string& ticker,
                      const std::vector<Bar>& bars,
                      const strategy::Strategy& strategy) const;

    void processBar(TickerRun& run,
                    size_t index,
                    Portfolio& portfolio,
                    const strategy::Strategy& strategy) const;

    void forceClose(const TickerRun& run, Portfolio& portfolio) const;

    BacktestResult finish(std::vector<std::string> tickers,
                          const strategy::Strategy& strategy,
                          const Portfolio& portfolio) const;

    BacktestConfig config_;
    std::shared_ptr<IMarketDataSource> data_source_;
};

} // namespace backtest
} // namespace stratlab
