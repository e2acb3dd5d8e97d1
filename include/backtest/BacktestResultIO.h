#pragma once

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"

namespace stratlab {
namespace backtest {

class BacktestResultIO {
public:
    // Dates as YYYY-MM-DD; non-finite numbers as "inf", "-inf" or "nan".
    static nlohmann::json toJson(const BacktestResult& result);

    static bool save(const BacktestResult& result, const std::string& path);

    // Human-readable summary for the console
    static void printSummary(const BacktestResult& result, std::ostream& out);

    static nlohmann::json number(double value);
};

} // namespace backtest
} // namespace stratlab
