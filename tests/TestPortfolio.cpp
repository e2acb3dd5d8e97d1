#include "backtest/Portfolio.h"
#include "backtest/PositionSizer.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace stratlab;
using namespace stratlab::backtest;
using stratlab::utils::TimeUtils;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    const Timestamp d0 = *TimeUtils::parseDate("2024-01-02");
    const Timestamp d1 = *TimeUtils::parseDate("2024-01-12");

    {
        Portfolio p(10000.0, 0.001);
        assert(p.openPosition("AAA", d0, 100.0, 50));
        assert(near(p.getCash(), 4995.0));
        assert(p.hasPosition("AAA"));

        // One position per ticker; cash must cover cost plus commission
        assert(!p.openPosition("AAA", d0, 100.0, 1));
        assert(!p.openPosition("BBB", d0, 100.0, 0));
        assert(!p.openPosition("BBB", d0, 100.0, 50));
        assert(near(p.getCash(), 4995.0));

        auto trade = p.closePosition("AAA", d1, 110.0);
        assert(trade.has_value());
        assert(!p.hasPosition("AAA"));
        assert(near(p.getCash(), 4995.0 + 5500.0 - 5.5));
        assert(near(trade->commission, 10.5));
        assert(near(trade->pnl(), 489.5));
        assert(near(trade->pnlPct(), 10.0));
        assert(trade->holdingDays() == 10);
        assert(trade->exit_reason == ExitReason::SIGNAL);
        assert(near(p.getTotalCommission(), 10.5));
        assert(p.getTrades().size() == 1);

        assert(!p.closePosition("AAA", d1, 110.0).has_value());
    }

    {
        // 100 shares from 50 to 55 at 0.1%: fees 5.0 in and 5.5 out
        Portfolio per_trade(10000.0, 0.001);
        assert(per_trade.openPosition("AAA", d0, 50.0, 100));
        assert(near(per_trade.getCash(), 4995.0));
        const auto own_fees = per_trade.closePosition("AAA", d1, 55.0);
        assert(near(own_fees->commission, 10.5));
        assert(near(own_fees->pnl(), 489.5));
        assert(near(own_fees->pnlPct(), 10.0));
        assert(near(per_trade.getCash(), 10489.5));

        Portfolio cumulative(10000.0, 0.001, CommissionAttribution::CUMULATIVE);
        assert(cumulative.openPosition("AAA", d0, 50.0, 100));
        const auto running_total = cumulative.closePosition("AAA", d1, 55.0);
        assert(near(running_total->commission, 5.0));
        assert(near(running_total->pnl(), 495.0));
    }

    {
        // Legacy attribution: the running total before the exit commission
        Portfolio p(10000.0, 0.001, CommissionAttribution::CUMULATIVE);
        assert(p.openPosition("AAA", d0, 100.0, 50));
        auto trade = p.closePosition("AAA", d1, 110.0, ExitReason::TAKE_PROFIT);
        assert(near(trade->commission, 5.0));
        assert(near(trade->pnl(), 495.0));
        assert(trade->exit_reason == ExitReason::TAKE_PROFIT);
        assert(toString(trade->exit_reason) == "take_profit");
    }

    {
        Portfolio p(10000.0, 0.0);
        assert(p.openPosition("AAA", d0, 100.0, 10, std::nullopt, 130.0, 10.0));

        p.updateTrailingStop("AAA", 100.0);
        assert(near(*p.getPosition("AAA")->stop_loss, 90.0));
        p.updateTrailingStop("AAA", 95.0);
        assert(near(*p.getPosition("AAA")->stop_loss, 90.0));
        p.updateTrailingStop("AAA", 120.0);
        assert(near(*p.getPosition("AAA")->stop_loss, 108.0));

        assert(!p.checkExitConditions("AAA", 115.0, 109.0).has_value());
        assert(p.checkExitConditions("AAA", 131.0, 110.0) == ExitReason::TAKE_PROFIT);
        // Stop is checked first, against the low
        assert(p.checkExitConditions("AAA", 131.0, 107.0) == ExitReason::STOP_LOSS);
        assert(!p.checkExitConditions("ZZZ", 1.0, 1.0).has_value());
    }

    {
        Portfolio p(10000.0, 0.0);
        assert(p.openPosition("AAA", d0, 100.0, 10));
        assert(p.openPosition("BBB", d0, 50.0, 20));
        assert(near(p.getCash(), 8000.0));

        // BBB has no price today and is marked at its entry price
        assert(near(p.getTotalValue({{"AAA", 110.0}}), 8000.0 + 1100.0 + 1000.0));
        p.recordEquity(d0, {{"AAA", 110.0}});
        const auto& point = p.getEquityCurve().back();
        assert(near(point.equity, 10100.0));
        assert(near(point.cash, 8000.0));
        assert(near(point.positions_value, 2100.0));

        p.closePosition("AAA", d1, 120.0);
        p.closePosition("BBB", d1, 50.0);
        const auto stats = p.getStatistics();
        assert(stats.total_trades == 2);
        assert(stats.winning_trades == 1);
        // A flat trade counts as a loss here
        assert(stats.losing_trades == 1);
        assert(near(stats.win_rate, 50.0));
        assert(near(stats.total_pnl, 200.0));
        assert(near(stats.avg_holding_days, 10.0));
    }

    {
        strategy::PositionSizing fixed{strategy::SizingMethod::FIXED, 5000.0};
        assert(PositionSizer::shares(fixed, 10000.0, 100.0) == 50);

        strategy::PositionSizing pct{strategy::SizingMethod::PERCENTAGE, 10.0};
        assert(PositionSizer::shares(pct, 10000.0, 30.0) == 33);

        strategy::PositionSizing risk{strategy::SizingMethod::RISK_BASED, 2.0};
        assert(PositionSizer::shares(risk, 10000.0, 100.0, 2.5) == 40);
        assert(PositionSizer::shares(risk, 10000.0, 100.0) == 2);
        assert(PositionSizer::shares(risk, 10000.0, 100.0, 0.0) == 2);

        assert(PositionSizer::shares(pct, 10000.0, 0.0) == 0);
        assert(PositionSizer::shares(pct, 10000.0, missingValue()) == 0);
        strategy::PositionSizing negative{strategy::SizingMethod::PERCENTAGE, -5.0};
        assert(PositionSizer::shares(negative, 10000.0, 100.0) == 0);
    }

    std::cout << "[TEST] Portfolio PASSED\n";
    return 0;
}
