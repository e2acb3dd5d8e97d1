#pragma once

#include "common/Types.h"
#include "strategy/Strategy.h"

namespace stratlab {
namespace backtest {

class PositionSizer {
public:
    // Whole shares to buy at `price`. RISK_BASED risks value% of cash over
    // 2 x ATR per share and falls back to PERCENTAGE when ATR is missing or
    // non-positive. Never negative; 0 for a missing or non-positive price.
    static Quantity shares(const strategy::PositionSizing& sizing,
                           double cash,
                           double price,
                           double atr = missingValue());
};

} // namespace backtest
} // namespace stratlab
