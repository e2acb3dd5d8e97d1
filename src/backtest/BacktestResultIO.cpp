#include "backtest/BacktestResultIO.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace stratlab {
namespace backtest {

using utils::TimeUtils;

nlohmann::json BacktestResultIO::number(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    return value;
}

nlohmann::json BacktestResultIO::toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["tickers"] = result.tickers;
    if (result.tickers.size() == 1) {
        j["ticker"] = result.tickers.front();
    }
    j["strategy_name"] = result.strategy_name;
    j["start_date"] = result.start_date;
    j["end_date"] = result.end_date;
    if (result.error) {
        j["error"] = *result.error;
        return j;
    }

    const auto& m = result.metrics;
    nlohmann::json metrics;
    metrics["initial_capital"] = number(m.initial_capital);
    metrics["final_equity"] = number(m.final_equity);
    metrics["total_return_pct"] = number(m.total_return_pct);
    metrics["cagr_pct"] = number(m.cagr_pct);
    metrics["sharpe_ratio"] = number(m.sharpe_ratio);
    metrics["sortino_ratio"] = number(m.sortino_ratio);
    metrics["max_drawdown_pct"] = number(m.drawdown.max_drawdown_pct);
    metrics["peak_date"] = TimeUtils::formatDate(m.drawdown.peak_date);
    metrics["trough_date"] = TimeUtils::formatDate(m.drawdown.trough_date);
    metrics["peak_value"] = number(m.drawdown.peak_value);
    metrics["trough_value"] = number(m.drawdown.trough_value);
    metrics["total_trades"] = m.total_trades;
    metrics["winning_trades"] = m.winning_trades;
    metrics["losing_trades"] = m.losing_trades;
    metrics["win_rate_pct"] = number(m.win_rate_pct);
    metrics["profit_factor"] = number(m.profit_factor);
    metrics["expectancy"] = number(m.expectancy);
    metrics["avg_win"] = number(m.avg_win);
    metrics["avg_loss"] = number(m.avg_loss);
    metrics["largest_win"] = number(m.largest_win);
    metrics["largest_loss"] = number(m.largest_loss);
    metrics["avg_holding_days"] = number(m.avg_holding_days);
    j["metrics"] = metrics;

    j["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        j["trades"].push_back({
            {"ticker", t.ticker},
            {"entry_date", TimeUtils::formatDate(t.entry_date)},
            {"exit_date", TimeUtils::formatDate(t.exit_date)},
            {"entry_price", number(t.entry_price)},
            {"exit_price", number(t.exit_price)},
            {"quantity", t.quantity},
            {"commission", number(t.commission)},
            {"pnl", number(t.pnl())},
            {"pnl_pct", number(t.pnlPct())},
            {"holding_days", t.holdingDays()},
            {"exit_reason", toString(t.exit_reason)}
        });
    }

    j["equity_curve"] = nlohmann::json::array();
    for (const auto& p : result.equity_curve) {
        j["equity_curve"].push_back({
            {"date", TimeUtils::formatDate(p.date)},
            {"equity", number(p.equity)},
            {"cash", number(p.cash)},
            {"positions_value", number(p.positions_value)}
        });
    }

    const auto& s = result.portfolio_stats;
    j["portfolio_stats"] = {
        {"total_trades", s.total_trades},
        {"winning_trades", s.winning_trades},
        {"losing_trades", s.losing_trades},
        {"win_rate", number(s.win_rate)},
        {"total_pnl", number(s.total_pnl)},
        {"avg_win", number(s.avg_win)},
        {"avg_loss", number(s.avg_loss)},
        {"total_commission", number(s.total_commission)},
        {"avg_holding_days", number(s.avg_holding_days)}
    };

    j["monthly_returns"] = nlohmann::json::array();
    for (const auto& mr : result.monthly_returns) {
        std::ostringstream month;
        month << mr.year << "-" << std::setw(2) << std::setfill('0') << mr.month;
        j["monthly_returns"].push_back({
            {"month", month.str()},
            {"return_pct", number(mr.return_pct)}
        });
    }

    if (!result.trades.empty()) {
        const auto& d = result.trade_distribution;
        j["trade_distribution"] = {
            {"mean_pnl", number(d.mean_pnl)},
            {"median_pnl", number(d.median_pnl)},
            {"std_pnl", number(d.std_pnl)},
            {"mean_pnl_pct", number(d.mean_pnl_pct)},
            {"median_pnl_pct", number(d.median_pnl_pct)},
            {"std_pnl_pct", number(d.std_pnl_pct)}
        };
    }
    return j;
}

bool BacktestResultIO::save(const BacktestResult& result, const std::string& path) {
    const std::filesystem::path out_path(path);
    std::error_code ec;
    if (out_path.has_parent_path()) {
        std::filesystem::create_directories(out_path.parent_path(), ec);
    }

    const std::filesystem::path tmp_path = out_path.string() + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot write result file: {}", tmp_path.string());
            return false;
        }
        out << toJson(result).dump(2) << "\n";
        if (!out.good()) {
            LOG_ERROR("Failed writing result file: {}", tmp_path.string());
            return false;
        }
    }

    std::filesystem::rename(tmp_path, out_path, ec);
    if (ec) {
        LOG_ERROR("Failed to move result file into place: {} ({})", path, ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    LOG_INFO("Result written to {}", path);
    return true;
}

void BacktestResultIO::printSummary(const BacktestResult& result, std::ostream& out) {
    out << "\nBacktest result: " << result.strategy_name << "\n";
    out << "---------------------------------------------\n";
    out << "Tickers:       ";
    for (size_t i = 0; i < result.tickers.size(); ++i) {
        if (i > 0) out << ", ";
        out << result.tickers[i];
    }
    out << "\n";

    if (result.error) {
        out << "Error:         " << *result.error << "\n";
        out << "---------------------------------------------\n";
        return;
    }

    const auto& m = result.metrics;
    out << std::fixed << std::setprecision(2);
    out << "Period:        " << result.start_date << " .. " << result.end_date << "\n";
    out << "Initial:       " << m.initial_capital << "\n";
    out << "Final equity:  " << m.final_equity << "\n";
    out << "Total return:  " << m.total_return_pct << "%\n";
    out << "CAGR:          " << m.cagr_pct << "%\n";
    out << "Sharpe:        " << std::setprecision(3) << m.sharpe_ratio << "\n";
    out << "Sortino:       " << m.sortino_ratio << "\n";
    out << "Max drawdown:  " << std::setprecision(2) << m.drawdown.max_drawdown_pct << "% ("
        << TimeUtils::formatDate(m.drawdown.peak_date) << " -> "
        << TimeUtils::formatDate(m.drawdown.trough_date) << ")\n";
    out << "Trades:        " << m.total_trades
        << " (won " << m.winning_trades << ", lost " << m.losing_trades << ")\n";
    out << "Win rate:      " << m.win_rate_pct << "%\n";
    out << "Profit factor: " << std::setprecision(3) << m.profit_factor << "\n";
    out << "Expectancy:    " << std::setprecision(2) << m.expectancy << " /trade\n";
    out << "Avg hold:      " << std::setprecision(1) << m.avg_holding_days << " days\n";
    out << "Commission:    " << std::setprecision(2) << result.portfolio_stats.total_commission << "\n";
    out << "---------------------------------------------\n";
    out.unsetf(std::ios::floatfield);
}

} // namespace backtest
} // namespace stratlab
