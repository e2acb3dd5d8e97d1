#include "backtest/PositionSizer.h"
#include <cmath>

namespace stratlab {
namespace backtest {

namespace {
Quantity wholeShares(double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        return 0;
    }
    return static_cast<Quantity>(std::floor(amount));
}
}

Quantity PositionSizer::shares(const strategy::PositionSizing& sizing,
                               double cash,
                               double price,
                               double atr) {
    if (isMissing(price) || price <= 0.0) {
        return 0;
    }

    const double allocation = cash * (sizing.value / 100.0);

    switch (sizing.method) {
        case strategy::SizingMethod::FIXED:
            return wholeShares(sizing.value / price);

        case strategy::SizingMethod::PERCENTAGE:
            return wholeShares(allocation / price);

        case strategy::SizingMethod::RISK_BASED:
            if (!isMissing(atr) && atr > 0.0) {
                return wholeShares(allocation / (atr * 2.0));
            }
            return wholeShares(allocation / price);
    }
    return 0;
}

} // namespace backtest
} // namespace stratlab
