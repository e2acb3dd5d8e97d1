#include "backtest/BacktestEngine.h"
#include "backtest/BacktestResultIO.h"
#include "analytics/TechnicalIndicators.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>

using namespace stratlab;
using namespace stratlab::backtest;
using stratlab::analytics::TechnicalIndicators;
using stratlab::utils::TimeUtils;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

const Timestamp kStart = *TimeUtils::parseDate("2024-01-01");

std::vector<Bar> barsFromCloses(const std::vector<double>& closes, Timestamp start = kStart) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        bars.emplace_back(c, c * 1.001, c * 0.999, c, 1000.0, start + static_cast<Timestamp>(i) * MS_PER_DAY);
    }
    return bars;
}

strategy::Strategy simpleStrategy(const std::string& entry, const std::string& exit, double pct = 100.0) {
    strategy::Strategy s;
    s.name = "Test";
    s.entry_rules = entry;
    s.exit_rules = exit;
    s.position_sizing = {strategy::SizingMethod::PERCENTAGE, pct};
    return s;
}

BacktestConfig frictionless() {
    BacktestConfig config;
    config.initial_capital = 10000.0;
    config.commission_rate = 0.0;
    config.slippage_rate = 0.0;
    return config;
}

// In-memory bars keyed by ticker
class FakeDataSource : public IMarketDataSource {
public:
    std::map<std::string, std::vector<Bar>> data;
    int calls = 0;

    std::vector<Bar> getHistoricalData(const std::string& ticker,
                                       const std::string&,
                                       const std::string&) override {
        ++calls;
        auto it = data.find(ticker);
        return it == data.end() ? std::vector<Bar>{} : it->second;
    }
};
}

int main() {
    {
        BacktestEngine engine(frictionless());
        const auto result = engine.runSingle("AAA", barsFromCloses({5, 12, 15, 8, 20}),
                                             simpleStrategy("close > 10", "close < 10"));
        assert(result.ok());
        assert(result.equity_curve.size() == 5);
        assert(result.trades.size() == 2);

        const auto& first = result.trades[0];
        assert(first.entry_date == kStart + MS_PER_DAY);
        assert(first.quantity == 833);
        assert(near(first.exit_price, 8.0));
        assert(first.exit_reason == ExitReason::SIGNAL);
        assert(near(first.pnl(), -4.0 * 833));

        // Exit bar does not re-enter; the next bar does and is force-closed
        const auto& second = result.trades[1];
        assert(second.entry_date == kStart + 4 * MS_PER_DAY);
        assert(second.quantity == 333);
        assert(second.exit_reason == ExitReason::END_OF_DATA);

        assert(near(result.equity_curve[0].equity, 10000.0));
        assert(near(result.equity_curve[2].equity, 4.0 + 833 * 15.0));
        assert(near(result.equity_curve[4].equity, 6668.0));
        assert(near(result.metrics.total_return_pct, -33.32));
        assert(result.start_date == "2024-01-01");
        assert(result.end_date == "2024-01-05");
    }

    {
        // entry_price is rebound for every new position
        BacktestEngine engine(frictionless());
        const auto result = engine.runSingle("AAA", barsFromCloses({12, 11, 10.5, 10, 13, 12}),
                                             simpleStrategy("close > 10", "close < entry_price * 0.9"));
        assert(result.trades.size() == 2);
        assert(near(result.trades[0].entry_price, 12.0));
        assert(near(result.trades[0].exit_price, 10.5));
        assert(near(result.trades[1].entry_price, 13.0));
        assert(result.trades[1].exit_reason == ExitReason::END_OF_DATA);
    }

    {
        auto s = simpleStrategy("close > 0", "");
        s.risk_management.stop_loss_pct = 5.0;
        s.risk_management.take_profit_pct = 10.0;

        std::vector<Bar> bars = barsFromCloses({100, 101, 96, 100, 111});
        bars[2].low = 94.0;

        BacktestEngine engine(frictionless());
        const auto result = engine.runSingle("AAA", bars, s);
        assert(result.trades.size() == 2);
        assert(result.trades[0].exit_reason == ExitReason::STOP_LOSS);
        assert(near(result.trades[0].exit_price, 96.0));
        assert(result.trades[1].entry_date == kStart + 3 * MS_PER_DAY);
        assert(result.trades[1].exit_reason == ExitReason::TAKE_PROFIT);
        assert(result.trades[1].exit_date == kStart + 4 * MS_PER_DAY);
    }

    {
        auto s = simpleStrategy("close > 0", "");
        s.risk_management.trailing_stop = true;
        s.risk_management.trailing_stop_pct = 10.0;

        std::vector<Bar> bars = barsFromCloses({100, 120, 110, 107, 130});
        BacktestEngine engine(frictionless());
        const auto result = engine.runSingle("AAA", bars, s);
        // Stop ratchets to 108 at 120 and is hit by the 107 bar
        assert(result.trades[0].exit_reason == ExitReason::STOP_LOSS);
        assert(result.trades[0].exit_date == kStart + 3 * MS_PER_DAY);
    }

    {
        BacktestConfig config = frictionless();
        config.slippage_rate = 0.01;
        config.commission_rate = 0.001;
        BacktestEngine engine(config);
        const auto result = engine.runSingle("AAA", barsFromCloses({100, 100, 100}),
                                             simpleStrategy("close > 0", "", 10.0));
        assert(result.trades.size() == 1);
        assert(near(result.trades[0].entry_price, 101.0));
        assert(near(result.trades[0].exit_price, 99.0));
        assert(result.trades[0].quantity == 9);
        assert(result.trades[0].pnl() < 0.0);
    }

    {
        // Long uptrend, then a sharp dip that stays above the 200-day average
        std::vector<double> closes;
        for (int i = 0; i < 230; ++i) closes.push_back(100.0 + i);
        for (int k = 1; k <= 8; ++k) closes.push_back(329.0 - 5.0 * k);
        for (int k = 1; k <= 30; ++k) closes.push_back(289.0 + 3.0 * k);
        const auto bars = barsFromCloses(closes);

        const auto rsi = TechnicalIndicators::rsi(closes, 14);
        const auto sma200 = TechnicalIndicators::sma(closes, 200);
        size_t expected_entry = closes.size();
        for (size_t i = 0; i < closes.size(); ++i) {
            if (rsi[i] < 30.0 && closes[i] > sma200[i]) {
                expected_entry = i;
                break;
            }
        }
        assert(expected_entry >= 230 && expected_entry < closes.size());

        auto s = strategy::createDefaultStrategy();
        BacktestEngine engine;
        const auto result = engine.runSingle("TREND", bars, s);
        assert(result.ok());
        assert(!result.trades.empty());
        assert(result.trades[0].entry_date == bars[expected_entry].timestamp);
        assert(result.equity_curve.size() == bars.size());
        assert(result.metrics.total_trades == static_cast<int>(result.trades.size()));

        // Same entry, closed on the first later bar where RSI-14 rises above 70
        size_t expected_exit = closes.size();
        for (size_t i = expected_entry + 1; i < closes.size(); ++i) {
            if (rsi[i] > 70.0) {
                expected_exit = i;
                break;
            }
        }
        assert(expected_exit < closes.size());

        auto rsi_only = strategy::createDefaultStrategy();
        rsi_only.exit_rules = "rsi(14) > 70";
        rsi_only.risk_management = strategy::RiskManagement{};
        const auto rsi_result = engine.runSingle("TREND", bars, rsi_only);
        assert(rsi_result.ok());
        assert(!rsi_result.trades.empty());
        assert(rsi_result.trades[0].entry_date == bars[expected_entry].timestamp);
        assert(rsi_result.trades[0].exit_date == bars[expected_exit].timestamp);
        assert(rsi_result.trades[0].exit_reason == ExitReason::SIGNAL);
    }

    {
        // Shared cash over the union of dates, duplicates ignored
        const auto a = barsFromCloses({10, 10, 10});
        const auto b = barsFromCloses({20, 20, 20}, kStart + MS_PER_DAY);

        BacktestEngine engine(frictionless());
        const auto result = engine.runMulti({{"A", a}, {"B", b}, {"A", a}},
                                            simpleStrategy("close > 0", "", 50.0));
        assert(result.ok());
        assert(result.tickers == std::vector<std::string>({"A", "B"}));
        assert(result.equity_curve.size() == 4);
        assert(result.trades.size() == 2);
        assert(result.trades[0].ticker == "A" || result.trades[1].ticker == "A");

        const Trade& trade_a = result.trades[0].ticker == "A" ? result.trades[0] : result.trades[1];
        const Trade& trade_b = result.trades[0].ticker == "B" ? result.trades[0] : result.trades[1];
        assert(trade_a.quantity == 500);
        assert(trade_b.quantity == 125);
        assert(near(result.equity_curve.back().equity, 10000.0));

        // A has no bar on the last date and is marked at its entry price
        assert(near(result.equity_curve[3].positions_value, 500 * 10.0 + 125 * 20.0));
    }

    {
        BacktestEngine engine(frictionless());
        const auto s = simpleStrategy("close > 0", "");

        const auto single = engine.runSingle("NONE", {}, s);
        assert(!single.ok());
        assert(*single.error == "No data available for NONE");
        assert(single.tickers == std::vector<std::string>{"NONE"});

        const auto multi = engine.runMulti({{"X", {}}, {"Y", {}}}, s);
        assert(!multi.ok());
        assert(*multi.error == "No data available for any tickers");

        const auto json = BacktestResultIO::toJson(single);
        assert(json["error"] == "No data available for NONE");
        assert(json["ticker"] == "NONE");
    }

    {
        // Unparseable rules never fire during a run
        BacktestEngine engine(frictionless());
        const auto result = engine.runSingle("AAA", barsFromCloses({1, 2, 3}),
                                             simpleStrategy("close >> 1", ""));
        assert(result.ok());
        assert(result.trades.empty());
        assert(result.equity_curve.size() == 3);
    }

    {
        auto source = std::make_shared<FakeDataSource>();
        source->data["AAA"] = barsFromCloses({10, 11, 12});
        source->data["BBB"] = barsFromCloses({10, 9, 12});

        BacktestEngine engine(frictionless(), source);
        const auto single = engine.runBacktest("AAA", simpleStrategy("close > 10", ""), "2024-01-01", "2024-01-03");
        assert(single.ok());
        assert(single.start_date == "2024-01-01");
        assert(single.trades.size() == 1);

        const auto multi = engine.runMultiBacktest({"AAA", "BBB", "CCC"}, simpleStrategy("close > 10", "", 30.0), "", "");
        assert(multi.ok());
        assert(multi.tickers.size() == 3);
        assert(source->calls == 4);

        const auto missing = engine.runBacktest("ZZZ", simpleStrategy("close > 10", ""), "", "");
        assert(!missing.ok());
    }

    {
        BacktestEngine engine(frictionless());
        const auto result = engine.runSingle("AAA", barsFromCloses({10, 12, 14}),
                                             simpleStrategy("close > 0", ""));
        const auto json = BacktestResultIO::toJson(result);
        assert(json["metrics"]["profit_factor"] == "inf");
        assert(json["trades"].size() == 1);
        assert(json["trades"][0]["exit_reason"] == "end_of_data");
        assert(json["trades"][0]["entry_date"] == "2024-01-01");
        assert(json["equity_curve"].size() == 3);
        assert(BacktestResultIO::number(std::nan("")) == "nan");
        assert(BacktestResultIO::number(-INFINITY) == "-inf");

        std::ostringstream out;
        BacktestResultIO::printSummary(result, out);
        assert(out.str().find("Total return") != std::string::npos);
    }

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
