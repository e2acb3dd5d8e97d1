#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"

namespace stratlab {
namespace backtest {

enum class ExitReason {
    SIGNAL,
    STOP_LOSS,
    TAKE_PROFIT,
    END_OF_DATA
};

std::string toString(ExitReason reason);

// Open holding in one ticker
struct Position {
    std::string ticker;
    Timestamp entry_date = 0;
    double entry_price = 0.0;
    Quantity quantity = 0;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::optional<double> trailing_stop_pct;

    double costBasis() const { return entry_price * static_cast<double>(quantity); }
    double currentValue(double price) const { return price * static_cast<double>(quantity); }
    double unrealizedPnl(double price) const { return (price - entry_price) * static_cast<double>(quantity); }
    double unrealizedPnlPct(double price) const { return (price - entry_price) / entry_price * 100.0; }
};

// Completed round trip
struct Trade {
    std::string ticker;
    Timestamp entry_date = 0;
    Timestamp exit_date = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    Quantity quantity = 0;
    double commission = 0.0;
    ExitReason exit_reason = ExitReason::SIGNAL;

    double pnl() const;
    double pnlPct() const;
    long long holdingDays() const;
};

struct EquityPoint {
    Timestamp date = 0;
    double equity = 0.0;
    double cash = 0.0;
    double positions_value = 0.0;
};

struct PortfolioStatistics {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;          // percent
    double total_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double total_commission = 0.0;
    double avg_holding_days = 0.0;
};

// Cash, open positions, trade log and equity curve of one run.
// At most one position per ticker.
class Portfolio {
public:
    explicit Portfolio(double initial_capital,
                       double commission_rate = 0.001,
                       CommissionAttribution attribution = CommissionAttribution::PER_TRADE);

    // Fails (no state change) when quantity <= 0, the ticker is already open,
    // or price * quantity * (1 + commission_rate) exceeds cash.
    bool openPosition(const std::string& ticker,
                      Timestamp date,
                      double price,
                      Quantity quantity,
                      std::optional<double> stop_loss = std::nullopt,
                      std::optional<double> take_profit = std::nullopt,
                      std::optional<double> trailing_stop_pct = std::nullopt);

    std::optional<Trade> closePosition(const std::string& ticker,
                                       Timestamp date,
                                       double price,
                                       ExitReason reason = ExitReason::SIGNAL);

    // Raises the stop to price * (1 - pct/100); never lowers it.
    void updateTrailingStop(const std::string& ticker, double current_price);

    // STOP_LOSS when low <= stop, else TAKE_PROFIT when close >= target.
    std::optional<ExitReason> checkExitConditions(const std::string& ticker,
                                                  double close_price,
                                                  double low_price) const;

    // Tickers without a price are valued at their entry price.
    double getTotalValue(const std::map<std::string, double>& current_prices) const;
    void recordEquity(Timestamp date, const std::map<std::string, double>& current_prices);

    PortfolioStatistics getStatistics() const;

    bool hasPosition(const std::string& ticker) const { return positions_.count(ticker) > 0; }
    const Position* getPosition(const std::string& ticker) const;

    double getCash() const { return cash_; }
    double getInitialCapital() const { return initial_capital_; }
    double getCommissionRate() const { return commission_rate_; }
    double getTotalCommission() const { return total_commission_; }

    const std::map<std::string, Position>& getPositions() const { return positions_; }
    const std::vector<Trade>& getTrades() const { return trades_; }
    const std::vector<EquityPoint>& getEquityCurve() const { return equity_curve_; }

private:
    double initial_capital_;
    double cash_;
    double commission_rate_;
    CommissionAttribution attribution_;
    double total_commission_ = 0.0;

    std::map<std::string, Position> positions_;
    std::map<std::string, double> entry_commissions_;
    std::vector<Trade> trades_;
    std::vector<EquityPoint> equity_curve_;
};

} // namespace backtest
} // namespace stratlab
