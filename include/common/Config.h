#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"

namespace stratlab {

class Config {
public:
    static Config& getInstance();

    // Returns false when the file is missing or unreadable; defaults stay in effect.
    bool load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void reset();

    double getInitialCapital() const { return backtest_config_.initial_capital; }
    void setInitialCapital(double v) { backtest_config_.initial_capital = v; }
    double getCommissionRate() const { return backtest_config_.commission_rate; }
    double getSlippageRate() const { return backtest_config_.slippage_rate; }
    double getRiskFreeRate() const { return backtest_config_.risk_free_rate; }

    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }

    std::string getDataDir() const { return data_dir_; }
    std::string getStrategiesDir() const { return strategies_dir_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }

private:
    Config() = default;

    backtest::BacktestConfig backtest_config_;
    std::string data_dir_ = "data";
    std::string strategies_dir_ = "strategies";
    std::string log_dir_ = "logs";
    std::string log_level_ = "info";
};

} // namespace stratlab
