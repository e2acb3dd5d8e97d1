#pragma once

#include <vector>
#include <string>
#include <optional>
#include "common/Types.h"

namespace stratlab {
namespace analytics {

// Closed set of indicators the rule language can call.
enum class IndicatorKind {
    SMA,
    EMA,
    WMA,
    RSI,
    MACD,
    MACD_SIGNAL,
    MACD_HIST,
    BB_UPPER,
    BB_MIDDLE,
    BB_LOWER,
    ATR,
    STOCH_K,
    STOCH_D,
    ADX,
    OBV,
    VWAP,
    CCI,
    ROC,
    WILLIAMS_R,
    MOMENTUM
};

std::optional<IndicatorKind> indicatorFromName(const std::string& name);
std::string indicatorName(IndicatorKind kind);

// True when the indicator reads a single source column (close by default);
// false when it needs the full OHLCV bar.
bool usesSourceSeries(IndicatorKind kind);

// Every output is aligned to its input. Positions without enough history
// (and any arithmetic on missing input) are NaN.
class TechnicalIndicators {
public:
    static Series sma(const Series& data, int period);

    // Smoothing factor 2/(period+1), seeded by the first observation.
    static Series ema(const Series& data, int period);

    // Linear weights 1..period
    static Series wma(const Series& data, int period);

    // Simple-mean RSI over the trailing window of price changes
    static Series rsi(const Series& data, int period = 14);

    struct MACDResult {
        Series macd;
        Series signal;
        Series histogram;
    };
    static MACDResult macd(const Series& data, int fast = 12, int slow = 26, int signal_period = 9);

    struct BollingerBands {
        Series upper;
        Series middle;
        Series lower;
    };
    static BollingerBands bollingerBands(const Series& data, int period = 20, double std_dev_mult = 2.0);

    static Series trueRange(const std::vector<Bar>& bars);
    static Series atr(const std::vector<Bar>& bars, int period = 14);

    struct StochasticResult {
        Series k;
        Series d;
    };
    static StochasticResult stochastic(const std::vector<Bar>& bars, int k_period = 14, int d_period = 3);

    // DI and DX both smoothed with a rolling mean
    static Series adx(const std::vector<Bar>& bars, int period = 14);

    static Series obv(const std::vector<Bar>& bars);
    static Series vwap(const std::vector<Bar>& bars);
    static Series cci(const std::vector<Bar>& bars, int period = 20);
    static Series roc(const Series& data, int period = 12);
    static Series momentum(const Series& data, int period = 10);
    static Series williamsR(const std::vector<Bar>& bars, int period = 14);

    // Fills the default parameters for omitted arguments, e.g. rsi() -> {14},
    // macd() -> {12, 26, 9}. Moving averages have no default period.
    static std::vector<double> normalizeParams(IndicatorKind kind, const std::vector<double>& params);

    // Single dispatch point over IndicatorKind. `params` must be normalized.
    static Series compute(IndicatorKind kind,
                          const std::vector<Bar>& bars,
                          PriceField source,
                          const std::vector<double>& params);

private:
    static Series rollingMean(const Series& values, int period);
    static Series rollingStd(const Series& values, int period);
    static Series rollingMin(const Series& values, int period);
    static Series rollingMax(const Series& values, int period);
    static Series missingSeries(size_t n);
    static int toPeriod(double value);
};

} // namespace analytics
} // namespace stratlab
