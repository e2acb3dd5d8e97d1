#include "backtest/PerformanceMetrics.h"
#include "common/TimeUtils.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace stratlab {
namespace backtest {

namespace {
constexpr double TRADING_DAYS_PER_YEAR = 252.0;

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// ddof = 1 for sample, 0 for population
double stddev(const std::vector<double>& values, int ddof) {
    const double n = static_cast<double>(values.size());
    if (n - ddof <= 0) return missingValue();
    const double m = mean(values);
    double sq = 0.0;
    for (double v : values) {
        sq += (v - m) * (v - m);
    }
    return std::sqrt(sq / (n - ddof));
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) return values[mid];
    return (values[mid - 1] + values[mid]) / 2.0;
}
}

std::vector<double> PerformanceMetrics::calculateReturns(const std::vector<EquityPoint>& curve) {
    std::vector<double> returns(curve.size(), 0.0);
    for (size_t i = 1; i < curve.size(); ++i) {
        const double r = curve[i].equity / curve[i - 1].equity - 1.0;
        returns[i] = isMissing(r) ? 0.0 : r;
    }
    return returns;
}

double PerformanceMetrics::totalReturn(double initial_capital, double final_equity) {
    if (initial_capital == 0.0) return 0.0;
    return (final_equity - initial_capital) / initial_capital * 100.0;
}

double PerformanceMetrics::cagr(double initial_capital, double final_equity, double years) {
    if (years <= 0.0 || initial_capital <= 0.0) {
        return 0.0;
    }
    return (std::pow(final_equity / initial_capital, 1.0 / years) - 1.0) * 100.0;
}

double PerformanceMetrics::sharpeRatio(const std::vector<double>& returns, double risk_free_rate) {
    if (returns.size() < 2) return 0.0;

    const double sd = stddev(returns, 1);
    if (!(sd > 0.0) || !std::isfinite(sd)) return 0.0;

    const double excess = mean(returns) - risk_free_rate / TRADING_DAYS_PER_YEAR;
    return std::sqrt(TRADING_DAYS_PER_YEAR) * excess / sd;
}

double PerformanceMetrics::sortinoRatio(const std::vector<double>& returns, double risk_free_rate) {
    std::vector<double> downside;
    for (double r : returns) {
        if (r < 0.0) downside.push_back(r);
    }
    if (downside.size() < 2) return 0.0;

    const double sd = stddev(downside, 1);
    if (!(sd > 0.0) || !std::isfinite(sd)) return 0.0;

    const double excess = mean(returns) - risk_free_rate / TRADING_DAYS_PER_YEAR;
    return std::sqrt(TRADING_DAYS_PER_YEAR) * excess / sd;
}

DrawdownInfo PerformanceMetrics::maxDrawdown(const std::vector<EquityPoint>& curve) {
    DrawdownInfo info;
    if (curve.empty()) return info;

    double running_max = curve[0].equity;
    double worst = 0.0;
    size_t trough = 0;
    for (size_t i = 0; i < curve.size(); ++i) {
        running_max = std::max(running_max, curve[i].equity);
        const double dd = (curve[i].equity - running_max) / running_max * 100.0;
        if (dd < worst) {
            worst = dd;
            trough = i;
        }
    }

    size_t peak = 0;
    for (size_t i = 0; i <= trough; ++i) {
        if (curve[i].equity > curve[peak].equity) peak = i;
    }

    info.max_drawdown_pct = worst;
    info.peak_date = curve[peak].date;
    info.peak_value = curve[peak].equity;
    info.trough_date = curve[trough].date;
    info.trough_value = curve[trough].equity;
    return info;
}

double PerformanceMetrics::winRate(const std::vector<Trade>& trades) {
    if (trades.empty()) return 0.0;
    const auto wins = std::count_if(trades.begin(), trades.end(),
                                    [](const Trade& t) { return t.pnl() > 0.0; });
    return static_cast<double>(wins) / static_cast<double>(trades.size()) * 100.0;
}

double PerformanceMetrics::profitFactor(const std::vector<Trade>& trades) {
    if (trades.empty()) return 0.0;

    double gross_profit = 0.0;
    double gross_loss = 0.0;
    for (const auto& t : trades) {
        const double pnl = t.pnl();
        if (pnl > 0.0) gross_profit += pnl;
        else if (pnl < 0.0) gross_loss += -pnl;
    }

    if (gross_loss == 0.0) {
        return gross_profit > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return gross_profit / gross_loss;
}

double PerformanceMetrics::expectancy(const std::vector<Trade>& trades) {
    if (trades.empty()) return 0.0;
    double total = 0.0;
    for (const auto& t : trades) total += t.pnl();
    return total / static_cast<double>(trades.size());
}

MetricsReport PerformanceMetrics::calculateAll(const std::vector<EquityPoint>& curve,
                                               const std::vector<Trade>& trades,
                                               double initial_capital,
                                               double risk_free_rate) {
    MetricsReport report;
    report.initial_capital = initial_capital;
    if (curve.empty()) {
        return report;
    }

    report.has_equity = true;
    report.final_equity = curve.back().equity;
    report.total_return_pct = totalReturn(initial_capital, report.final_equity);

    const double days = static_cast<double>(
        utils::TimeUtils::daysBetween(curve.front().date, curve.back().date));
    report.cagr_pct = cagr(initial_capital, report.final_equity, days / 365.25);

    const auto returns = calculateReturns(curve);
    if (returns.size() > 1) {
        report.sharpe_ratio = sharpeRatio(returns, risk_free_rate);
        report.sortino_ratio = sortinoRatio(returns, risk_free_rate);
    }

    report.drawdown = maxDrawdown(curve);

    if (trades.empty()) {
        return report;
    }

    double win_sum = 0.0;
    double loss_sum = 0.0;
    double holding_sum = 0.0;
    report.largest_win = trades.front().pnl();
    report.largest_loss = trades.front().pnl();
    for (const auto& t : trades) {
        const double pnl = t.pnl();
        if (pnl > 0.0) {
            report.winning_trades++;
            win_sum += pnl;
        } else if (pnl < 0.0) {
            report.losing_trades++;
            loss_sum += pnl;
        }
        report.largest_win = std::max(report.largest_win, pnl);
        report.largest_loss = std::min(report.largest_loss, pnl);
        holding_sum += static_cast<double>(t.holdingDays());
    }

    report.total_trades = static_cast<int>(trades.size());
    report.win_rate_pct = winRate(trades);
    report.profit_factor = profitFactor(trades);
    report.expectancy = expectancy(trades);
    report.avg_win = report.winning_trades > 0 ? win_sum / report.winning_trades : 0.0;
    report.avg_loss = report.losing_trades > 0 ? loss_sum / report.losing_trades : 0.0;
    report.avg_holding_days = holding_sum / report.total_trades;
    return report;
}

std::vector<MonthlyReturn> PerformanceMetrics::monthlyReturns(const std::vector<EquityPoint>& curve) {
    struct MonthEnd {
        int year;
        unsigned month;
        double equity;
    };
    std::vector<MonthEnd> month_ends;
    for (const auto& point : curve) {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        utils::TimeUtils::toCivil(point.date, year, month, day);
        if (!month_ends.empty() && month_ends.back().year == year && month_ends.back().month == month) {
            month_ends.back().equity = point.equity;
        } else {
            month_ends.push_back({year, month, point.equity});
        }
    }

    std::vector<MonthlyReturn> out;
    for (size_t i = 1; i < month_ends.size(); ++i) {
        MonthlyReturn m;
        m.year = month_ends[i].year;
        m.month = month_ends[i].month;
        m.return_pct = (month_ends[i].equity / month_ends[i - 1].equity - 1.0) * 100.0;
        out.push_back(m);
    }
    return out;
}

TradeDistribution PerformanceMetrics::tradeDistribution(const std::vector<Trade>& trades) {
    TradeDistribution dist;
    if (trades.empty()) return dist;

    std::vector<double> pnls;
    std::vector<double> pnl_pcts;
    for (const auto& t : trades) {
        pnls.push_back(t.pnl());
        pnl_pcts.push_back(t.pnlPct());
    }

    dist.mean_pnl = mean(pnls);
    dist.median_pnl = median(pnls);
    dist.std_pnl = stddev(pnls, 0);
    dist.mean_pnl_pct = mean(pnl_pcts);
    dist.median_pnl_pct = median(pnl_pcts);
    dist.std_pnl_pct = stddev(pnl_pcts, 0);
    return dist;
}

} // namespace backtest
} // namespace stratlab
