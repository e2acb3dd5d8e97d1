#pragma once

#include <map>
#include <vector>
#include "analytics/TechnicalIndicators.h"

namespace stratlab {
namespace analytics {

// Column identity: indicator kind, source column and normalized parameters.
struct IndicatorKey {
    IndicatorKind kind;
    PriceField source = PriceField::CLOSE;
    std::vector<double> params;

    IndicatorKey(IndicatorKind k, std::vector<double> p, PriceField s = PriceField::CLOSE)
        : kind(k), source(s), params(std::move(p)) {}

    bool operator<(const IndicatorKey& other) const;
    bool operator==(const IndicatorKey& other) const;
};

// Bar sequence plus the indicator columns attached for one run.
class IndicatorFrame {
public:
    IndicatorFrame() = default;
    explicit IndicatorFrame(std::vector<Bar> bars);

    // Bars plus the standard column set: SMA/EMA 10/20/50/100/200, RSI-14,
    // MACD(12,26,9), Bollinger(20,2), ATR-14, Stochastic(14,3), ADX-14,
    // OBV, VWAP, CCI-20, ROC-12, Williams %R-14.
    static IndicatorFrame build(std::vector<Bar> bars);

    const std::vector<Bar>& bars() const { return bars_; }
    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    // Precomputed column, or nullptr.
    const Series* find(const IndicatorKey& key) const;

    // Precomputed column when present, else computed (not cached).
    Series resolve(const IndicatorKey& key) const;

    void attach(const IndicatorKey& key, Series column);
    size_t columnCount() const { return columns_.size(); }

    Series column(PriceField field) const { return extractField(bars_, field); }

private:
    std::vector<Bar> bars_;
    std::map<IndicatorKey, Series> columns_;
};

} // namespace analytics
} // namespace stratlab
