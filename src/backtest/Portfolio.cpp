#include "backtest/Portfolio.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace stratlab {
namespace backtest {

std::string toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::SIGNAL: return "signal";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::END_OF_DATA: return "end_of_data";
    }
    return "signal";
}

double Trade::pnl() const {
    return (exit_price - entry_price) * static_cast<double>(quantity) - commission;
}

double Trade::pnlPct() const {
    return (exit_price - entry_price) / entry_price * 100.0;
}

long long Trade::holdingDays() const {
    return utils::TimeUtils::daysBetween(entry_date, exit_date);
}

Portfolio::Portfolio(double initial_capital, double commission_rate, CommissionAttribution attribution)
    : initial_capital_(initial_capital)
    , cash_(initial_capital)
    , commission_rate_(commission_rate)
    , attribution_(attribution) {
}

bool Portfolio::openPosition(const std::string& ticker,
                             Timestamp date,
                             double price,
                             Quantity quantity,
                             std::optional<double> stop_loss,
                             std::optional<double> take_profit,
                             std::optional<double> trailing_stop_pct) {
    if (quantity <= 0) {
        return false;
    }
    if (hasPosition(ticker)) {
        LOG_DEBUG("{} already open, entry ignored", ticker);
        return false;
    }

    const double cost = price * static_cast<double>(quantity);
    const double commission = cost * commission_rate_;
    const double total_cost = cost + commission;
    if (!(total_cost <= cash_)) {
        LOG_DEBUG("{} entry needs {:.2f}, cash {:.2f}", ticker, total_cost, cash_);
        return false;
    }

    Position position;
    position.ticker = ticker;
    position.entry_date = date;
    position.entry_price = price;
    position.quantity = quantity;
    position.stop_loss = stop_loss;
    position.take_profit = take_profit;
    position.trailing_stop_pct = trailing_stop_pct;

    positions_[ticker] = position;
    entry_commissions_[ticker] = commission;
    cash_ -= total_cost;
    total_commission_ += commission;

    Logger::getInstance().logTrade(ticker, "BUY", price, quantity, 0.0);
    return true;
}

std::optional<Trade> Portfolio::closePosition(const std::string& ticker,
                                              Timestamp date,
                                              double price,
                                              ExitReason reason) {
    auto it = positions_.find(ticker);
    if (it == positions_.end()) {
        return std::nullopt;
    }

    const Position& position = it->second;
    const double proceeds = price * static_cast<double>(position.quantity);
    const double commission = proceeds * commission_rate_;

    Trade trade;
    trade.ticker = ticker;
    trade.entry_date = position.entry_date;
    trade.exit_date = date;
    trade.entry_price = position.entry_price;
    trade.exit_price = price;
    trade.quantity = position.quantity;
    trade.exit_reason = reason;
    if (attribution_ == CommissionAttribution::CUMULATIVE) {
        trade.commission = total_commission_;
    } else {
        trade.commission = entry_commissions_[ticker] + commission;
    }

    cash_ += proceeds - commission;
    total_commission_ += commission;
    trades_.push_back(trade);
    entry_commissions_.erase(ticker);
    positions_.erase(it);

    Logger::getInstance().logTrade(ticker, "SELL", price, trade.quantity, trade.pnl());
    return trade;
}

void Portfolio::updateTrailingStop(const std::string& ticker, double current_price) {
    auto it = positions_.find(ticker);
    if (it == positions_.end()) {
        return;
    }

    Position& position = it->second;
    if (!position.trailing_stop_pct || *position.trailing_stop_pct <= 0.0) {
        return;
    }

    const double stop_price = current_price * (1.0 - *position.trailing_stop_pct / 100.0);
    if (isMissing(stop_price)) {
        return;
    }
    if (!position.stop_loss || stop_price > *position.stop_loss) {
        position.stop_loss = stop_price;
    }
}

std::optional<ExitReason> Portfolio::checkExitConditions(const std::string& ticker,
                                                         double close_price,
                                                         double low_price) const {
    auto it = positions_.find(ticker);
    if (it == positions_.end()) {
        return std::nullopt;
    }

    const Position& position = it->second;
    if (position.stop_loss && low_price <= *position.stop_loss) {
        return ExitReason::STOP_LOSS;
    }
    if (position.take_profit && close_price >= *position.take_profit) {
        return ExitReason::TAKE_PROFIT;
    }
    return std::nullopt;
}

const Position* Portfolio::getPosition(const std::string& ticker) const {
    auto it = positions_.find(ticker);
    return it == positions_.end() ? nullptr : &it->second;
}

double Portfolio::getTotalValue(const std::map<std::string, double>& current_prices) const {
    double positions_value = 0.0;
    for (const auto& [ticker, position] : positions_) {
        auto price_it = current_prices.find(ticker);
        const double price = price_it != current_prices.end() ? price_it->second : position.entry_price;
        positions_value += position.currentValue(price);
    }
    return cash_ + positions_value;
}

void Portfolio::recordEquity(Timestamp date, const std::map<std::string, double>& current_prices) {
    EquityPoint point;
    point.date = date;
    point.equity = getTotalValue(current_prices);
    point.cash = cash_;
    point.positions_value = point.equity - cash_;
    equity_curve_.push_back(point);
}

PortfolioStatistics Portfolio::getStatistics() const {
    PortfolioStatistics stats;
    stats.total_commission = total_commission_;
    if (trades_.empty()) {
        return stats;
    }

    double win_sum = 0.0;
    double loss_sum = 0.0;
    long long holding_sum = 0;
    for (const auto& trade : trades_) {
        const double pnl = trade.pnl();
        stats.total_pnl += pnl;
        holding_sum += trade.holdingDays();
        if (pnl > 0.0) {
            stats.winning_trades++;
            win_sum += pnl;
        } else {
            stats.losing_trades++;
            loss_sum += pnl;
        }
    }

    stats.total_trades = static_cast<int>(trades_.size());
    stats.win_rate = static_cast<double>(stats.winning_trades) / stats.total_trades * 100.0;
    stats.avg_win = stats.winning_trades > 0 ? win_sum / stats.winning_trades : 0.0;
    stats.avg_loss = stats.losing_trades > 0 ? loss_sum / stats.losing_trades : 0.0;
    stats.avg_holding_days = static_cast<double>(holding_sum) / stats.total_trades;
    return stats;
}

} // namespace backtest
} // namespace stratlab
