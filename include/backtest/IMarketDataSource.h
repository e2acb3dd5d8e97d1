#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace stratlab {
namespace backtest {

// Supplies ordered daily bars for a ticker. Dates are "YYYY-MM-DD"; an empty
// string leaves that side of the range open. Empty result means no data.
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    virtual std::vector<Bar> getHistoricalData(const std::string& ticker,
                                               const std::string& start_date,
                                               const std::string& end_date) = 0;
};

} // namespace backtest
} // namespace stratlab
