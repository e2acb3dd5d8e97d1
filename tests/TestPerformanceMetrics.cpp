#include "backtest/PerformanceMetrics.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace stratlab;
using namespace stratlab::backtest;
using stratlab::utils::TimeUtils;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

std::vector<EquityPoint> curveOf(const std::vector<double>& equities, const std::string& start = "2024-01-01") {
    std::vector<EquityPoint> curve;
    const Timestamp t0 = *TimeUtils::parseDate(start);
    for (size_t i = 0; i < equities.size(); ++i) {
        EquityPoint p;
        p.date = t0 + static_cast<Timestamp>(i) * MS_PER_DAY;
        p.equity = equities[i];
        p.cash = equities[i];
        curve.push_back(p);
    }
    return curve;
}

Trade tradeWithPnl(double pnl, long long days = 5) {
    Trade t;
    t.ticker = "AAA";
    t.entry_date = 0;
    t.exit_date = days * MS_PER_DAY;
    t.entry_price = 100.0;
    t.exit_price = 100.0 + pnl;
    t.quantity = 1;
    return t;
}
}

int main() {
    {
        const auto curve = curveOf({100, 120, 90, 130});
        const auto dd = PerformanceMetrics::maxDrawdown(curve);
        assert(near(dd.max_drawdown_pct, -25.0));
        assert(dd.peak_date == curve[1].date);
        assert(dd.trough_date == curve[2].date);
        assert(near(dd.peak_value, 120.0));
        assert(near(dd.trough_value, 90.0));
    }

    {
        // Monotone rise: no drawdown, peak and trough at the first point
        const auto curve = curveOf({100, 101, 102});
        const auto dd = PerformanceMetrics::maxDrawdown(curve);
        assert(dd.max_drawdown_pct == 0.0);
        assert(dd.peak_date == curve[0].date && dd.trough_date == curve[0].date);
    }

    {
        const auto returns = PerformanceMetrics::calculateReturns(curveOf({100, 110, 99}));
        assert(returns.size() == 3);
        assert(returns[0] == 0.0);
        assert(near(returns[1], 0.1));
        assert(near(returns[2], -0.1));
    }

    {
        assert(near(PerformanceMetrics::totalReturn(1000.0, 1100.0), 10.0));
        assert(near(PerformanceMetrics::cagr(1000.0, 1210.0, 2.0), 10.0));
        assert(PerformanceMetrics::cagr(1000.0, 1210.0, 0.0) == 0.0);
        assert(PerformanceMetrics::cagr(0.0, 1210.0, 2.0) == 0.0);
    }

    {
        // Constant returns have no variance
        assert(PerformanceMetrics::sharpeRatio({0.01, 0.01, 0.01}) == 0.0);
        assert(PerformanceMetrics::sharpeRatio({0.01}) == 0.0);

        const std::vector<double> r = {0.0, 0.02, -0.01, 0.015, -0.005};
        const double mean = 0.004;
        double sq = 0.0;
        for (double v : r) sq += (v - mean) * (v - mean);
        const double sd = std::sqrt(sq / 4.0);
        const double expected = std::sqrt(252.0) * (mean - 0.02 / 252.0) / sd;
        assert(near(PerformanceMetrics::sharpeRatio(r, 0.02), expected));

        // Fewer than two negative returns
        assert(PerformanceMetrics::sortinoRatio({0.01, -0.02, 0.03}) == 0.0);
        const double down_sd = std::sqrt(((-0.01 + 0.0075) * (-0.01 + 0.0075) +
                                          (-0.005 + 0.0075) * (-0.005 + 0.0075)) / 1.0);
        const double sortino = std::sqrt(252.0) * (mean - 0.02 / 252.0) / down_sd;
        assert(near(PerformanceMetrics::sortinoRatio(r, 0.02), sortino));
    }

    {
        std::vector<Trade> trades = {tradeWithPnl(50.0), tradeWithPnl(-20.0), tradeWithPnl(30.0, 9)};
        assert(near(PerformanceMetrics::winRate(trades), 200.0 / 3.0));
        assert(near(PerformanceMetrics::profitFactor(trades), 4.0));
        assert(near(PerformanceMetrics::expectancy(trades), 20.0));

        const std::vector<Trade> winners = {tradeWithPnl(10.0)};
        assert(std::isinf(PerformanceMetrics::profitFactor(winners)));
        const std::vector<Trade> flat = {tradeWithPnl(0.0)};
        assert(PerformanceMetrics::profitFactor(flat) == 0.0);
        assert(PerformanceMetrics::profitFactor({}) == 0.0);
        assert(PerformanceMetrics::winRate({}) == 0.0);
    }

    {
        const auto curve = curveOf({10000, 10100, 9900, 10200});
        std::vector<Trade> trades = {tradeWithPnl(50.0), tradeWithPnl(-20.0), tradeWithPnl(0.0, 8)};
        const auto report = PerformanceMetrics::calculateAll(curve, trades, 10000.0);
        assert(report.has_equity);
        assert(near(report.final_equity, 10200.0));
        assert(near(report.total_return_pct, 2.0));
        assert(report.total_trades == 3);
        assert(report.winning_trades == 1);
        assert(report.losing_trades == 1);
        assert(near(report.largest_win, 50.0));
        assert(near(report.largest_loss, -20.0));
        assert(near(report.avg_win, 50.0));
        assert(near(report.avg_loss, -20.0));
        assert(near(report.avg_holding_days, 6.0));
        assert(report.drawdown.max_drawdown_pct < 0.0);

        const auto empty = PerformanceMetrics::calculateAll({}, {}, 10000.0);
        assert(!empty.has_equity);
        assert(empty.total_trades == 0);
    }

    {
        std::vector<EquityPoint> curve;
        auto add = [&curve](const char* date, double equity) {
            EquityPoint p;
            p.date = *TimeUtils::parseDate(date);
            p.equity = equity;
            curve.push_back(p);
        };
        add("2024-01-15", 100.0);
        add("2024-01-31", 110.0);
        add("2024-02-10", 105.0);
        add("2024-02-29", 121.0);
        add("2024-03-05", 108.9);

        const auto months = PerformanceMetrics::monthlyReturns(curve);
        assert(months.size() == 2);
        assert(months[0].year == 2024 && months[0].month == 2);
        assert(near(months[0].return_pct, 10.0));
        assert(months[1].month == 3);
        assert(near(months[1].return_pct, -10.0));
    }

    {
        std::vector<Trade> trades = {tradeWithPnl(10.0), tradeWithPnl(-10.0), tradeWithPnl(30.0)};
        const auto dist = PerformanceMetrics::tradeDistribution(trades);
        assert(near(dist.mean_pnl, 10.0));
        assert(near(dist.median_pnl, 10.0));
        assert(near(dist.std_pnl, std::sqrt(800.0 / 3.0)));
        assert(near(dist.mean_pnl_pct, 10.0));

        const auto none = PerformanceMetrics::tradeDistribution({});
        assert(none.mean_pnl == 0.0 && none.std_pnl == 0.0);
    }

    std::cout << "[TEST] PerformanceMetrics PASSED\n";
    return 0;
}
