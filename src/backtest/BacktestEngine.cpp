#include "backtest/BacktestEngine.h"
#include "backtest/PositionSizer.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "strategy/RuleEvaluator.h"
#include "strategy/RuleParser.h"
#include <algorithm>
#include <map>
#include <set>

namespace stratlab {
namespace backtest {

namespace {

// Unparseable rules behave as an empty list: a signal that never fires.
strategy::RuleList parseOrDisable(const std::string& text, const char* label, const std::string& ticker) {
    try {
        return strategy::RuleParser::parseRules(text);
    } catch (const strategy::ParseError& e) {
        LOG_WARN("[{}] {} rules disabled: {}", ticker, label, e.what());
        return {};
    }
}

double columnValue(const analytics::IndicatorFrame& frame, const analytics::IndicatorKey& key, size_t index) {
    const Series* column = frame.find(key);
    if (!column || index >= column->size()) {
        return missingValue();
    }
    return (*column)[index];
}

} // namespace

BacktestEngine::BacktestEngine(BacktestConfig config, std::shared_ptr<IMarketDataSource> data_source)
    : config_(config)
    , data_source_(std::move(data_source)) {
}

BacktestEngine::TickerRun BacktestEngine::prepare(const std::string& ticker,
                                                  const std::vector<Bar>& bars,
                                                  const strategy::Strategy& strategy) const {
    TickerRun run;
    run.ticker = ticker;
    run.frame = analytics::IndicatorFrame::build(bars);

    const auto entry_rules = parseOrDisable(strategy.entry_rules, "entry", ticker);
    run.entry_signal = strategy::RuleEvaluator::evaluate(entry_rules, run.frame);

    run.exit_rules = parseOrDisable(strategy.exit_rules, "exit", ticker);
    run.exit_uses_entry_price = strategy::RuleEvaluator::referencesEntryPrice(run.exit_rules);
    // Rebound to the actual entry price whenever a position opens.
    run.exit_signal = strategy::RuleEvaluator::evaluate(run.exit_rules, run.frame);
    return run;
}

void BacktestEngine::processBar(TickerRun& run,
                                size_t index,
                                Portfolio& portfolio,
                                const strategy::Strategy& strategy) const {
    const Bar& bar = run.frame.bars()[index];
    const double close = bar.close;
    const double buy_price = close * (1.0 + config_.slippage_rate);
    const double sell_price = close * (1.0 - config_.slippage_rate);
    const auto& risk = strategy.risk_management;

    if (portfolio.hasPosition(run.ticker)) {
        if (risk.trailing_stop) {
            portfolio.updateTrailingStop(run.ticker, close);
        }

        const auto exit_reason = portfolio.checkExitConditions(run.ticker, close, bar.low);
        const bool exit_signal = run.exit_signal[index];

        if (exit_reason || exit_signal) {
            const auto reason = exit_reason.value_or(ExitReason::SIGNAL);
            if (auto trade = portfolio.closePosition(run.ticker, bar.timestamp, sell_price, reason)) {
                LOG_DEBUG("[{}] {} exit ({}) at {:.4f}, pnl {:.2f}",
                          run.ticker, utils::TimeUtils::formatDate(bar.timestamp),
                          toString(reason), sell_price, trade->pnl());
            }
        }
        return;
    }

    if (!run.entry_signal[index]) {
        return;
    }

    const double atr = columnValue(run.frame, analytics::IndicatorKey(analytics::IndicatorKind::ATR, {14}), index);
    const Quantity shares = PositionSizer::shares(strategy.position_sizing, portfolio.getCash(), buy_price, atr);
    if (shares <= 0) {
        return;
    }

    std::optional<double> stop_loss;
    if (risk.stop_loss_pct) {
        stop_loss = buy_price * (1.0 - *risk.stop_loss_pct / 100.0);
    }
    std::optional<double> take_profit;
    if (risk.take_profit_pct) {
        take_profit = buy_price * (1.0 + *risk.take_profit_pct / 100.0);
    }
    const std::optional<double> trailing = risk.trailing_stop ? risk.trailing_stop_pct : std::nullopt;

    if (!portfolio.openPosition(run.ticker, bar.timestamp, buy_price, shares, stop_loss, take_profit, trailing)) {
        return;
    }

    LOG_DEBUG("[{}] {} entry {} @ {:.4f}", run.ticker,
              utils::TimeUtils::formatDate(bar.timestamp), shares, buy_price);

    if (run.exit_uses_entry_price) {
        strategy::EvaluationContext context;
        context.entry_price = buy_price;
        run.exit_signal = strategy::RuleEvaluator::evaluate(run.exit_rules, run.frame, context);
    }
}

void BacktestEngine::forceClose(const TickerRun& run, Portfolio& portfolio) const {
    if (!portfolio.hasPosition(run.ticker) || run.frame.empty()) {
        return;
    }
    const Bar& last = run.frame.bars().back();
    portfolio.closePosition(run.ticker, last.timestamp,
                            last.close * (1.0 - config_.slippage_rate),
                            ExitReason::END_OF_DATA);
}

BacktestResult BacktestEngine::finish(std::vector<std::string> tickers,
                                      const strategy::Strategy& strategy,
                                      const Portfolio& portfolio) const {
    BacktestResult result;
    result.tickers = std::move(tickers);
    result.strategy_name = strategy.name.empty() ? "Unknown" : strategy.name;
    result.initial_capital = config_.initial_capital;
    result.trades = portfolio.getTrades();
    result.equity_curve = portfolio.getEquityCurve();
    result.portfolio_stats = portfolio.getStatistics();
    result.metrics = PerformanceMetrics::calculateAll(result.equity_curve, result.trades,
                                                      config_.initial_capital, config_.risk_free_rate);
    result.monthly_returns = PerformanceMetrics::monthlyReturns(result.equity_curve);
    result.trade_distribution = PerformanceMetrics::tradeDistribution(result.trades);

    if (!result.equity_curve.empty()) {
        result.start_date = utils::TimeUtils::formatDate(result.equity_curve.front().date);
        result.end_date = utils::TimeUtils::formatDate(result.equity_curve.back().date);
    }

    LOG_INFO("Backtest '{}' finished: {} trades, return {:.2f}%, max drawdown {:.2f}%",
             result.strategy_name, result.trades.size(),
             result.metrics.total_return_pct, result.metrics.drawdown.max_drawdown_pct);
    return result;
}

BacktestResult BacktestEngine::runSingle(const std::string& ticker,
                                         const std::vector<Bar>& bars,
                                         const strategy::Strategy& strategy) const {
    if (bars.empty()) {
        LOG_WARN("No data available for {}", ticker);
        BacktestResult result;
        result.tickers = {ticker};
        result.strategy_name = strategy.name;
        result.initial_capital = config_.initial_capital;
        result.error = "No data available for " + ticker;
        return result;
    }

    LOG_INFO("Backtest '{}' on {} ({} bars)", strategy.name, ticker, bars.size());

    Portfolio portfolio(config_.initial_capital, config_.commission_rate, config_.commission_attribution);
    TickerRun run = prepare(ticker, bars, strategy);

    for (size_t i = 0; i < run.frame.size(); ++i) {
        processBar(run, i, portfolio, strategy);
        portfolio.recordEquity(run.frame.bars()[i].timestamp, {{ticker, run.frame.bars()[i].close}});
    }
    forceClose(run, portfolio);

    return finish({ticker}, strategy, portfolio);
}

BacktestResult BacktestEngine::runMulti(const std::vector<TickerBars>& data,
                                        const strategy::Strategy& strategy) const {
    std::vector<std::string> requested;
    std::vector<TickerRun> runs;
    std::vector<std::map<Timestamp, size_t>> index_by_date;
    std::set<Timestamp> all_dates;
    std::set<std::string> seen;

    for (const auto& [ticker, bars] : data) {
        if (!seen.insert(ticker).second) {
            continue;
        }
        requested.push_back(ticker);
        if (bars.empty()) {
            LOG_WARN("No data available for {}, skipped", ticker);
            continue;
        }

        runs.push_back(prepare(ticker, bars, strategy));
        std::map<Timestamp, size_t> dates;
        const auto& frame_bars = runs.back().frame.bars();
        for (size_t i = 0; i < frame_bars.size(); ++i) {
            dates[frame_bars[i].timestamp] = i;
            all_dates.insert(frame_bars[i].timestamp);
        }
        index_by_date.push_back(std::move(dates));
    }

    if (runs.empty()) {
        LOG_WARN("No data available for any tickers");
        BacktestResult result;
        result.tickers = requested;
        result.strategy_name = strategy.name;
        result.initial_capital = config_.initial_capital;
        result.error = "No data available for any tickers";
        return result;
    }

    LOG_INFO("Backtest '{}' on {} tickers ({} dates)", strategy.name, runs.size(), all_dates.size());

    Portfolio portfolio(config_.initial_capital, config_.commission_rate, config_.commission_attribution);

    for (Timestamp date : all_dates) {
        std::map<std::string, double> current_prices;
        for (size_t k = 0; k < runs.size(); ++k) {
            auto it = index_by_date[k].find(date);
            if (it == index_by_date[k].end()) {
                continue;
            }
            current_prices[runs[k].ticker] = runs[k].frame.bars()[it->second].close;
            processBar(runs[k], it->second, portfolio, strategy);
        }
        portfolio.recordEquity(date, current_prices);
    }

    for (const auto& run : runs) {
        forceClose(run, portfolio);
    }

    return finish(requested, strategy, portfolio);
}

BacktestResult BacktestEngine::runBacktest(const std::string& ticker,
                                           const strategy::Strategy& strategy,
                                           const std::string& start_date,
                                           const std::string& end_date) const {
    std::vector<Bar> bars;
    if (data_source_) {
        bars = data_source_->getHistoricalData(ticker, start_date, end_date);
    } else {
        LOG_ERROR("No market data source configured");
    }

    BacktestResult result = runSingle(ticker, bars, strategy);
    if (!start_date.empty()) result.start_date = start_date;
    if (!end_date.empty()) result.end_date = end_date;
    return result;
}

BacktestResult BacktestEngine::runMultiBacktest(const std::vector<std::string>& tickers,
                                                const strategy::Strategy& strategy,
                                                const std::string& start_date,
                                                const std::string& end_date) const {
    std::vector<TickerBars> data;
    for (const auto& ticker : tickers) {
        std::vector<Bar> bars;
        if (data_source_) {
            bars = data_source_->getHistoricalData(ticker, start_date, end_date);
        }
        data.emplace_back(ticker, std::move(bars));
    }
    if (!data_source_) {
        LOG_ERROR("No market data source configured");
    }

    BacktestResult result = runMulti(data, strategy);
    if (!start_date.empty()) result.start_date = start_date;
    if (!end_date.empty()) result.end_date = end_date;
    return result;
}

} // namespace backtest
} // namespace stratlab
