#pragma once

#include <string>
#include <vector>
#include <cmath>
#include <limits>

namespace stratlab {

// Epoch milliseconds (UTC). Daily bars sit at 00:00 UTC of their session date.
using Timestamp = long long;
using Price = double;
using Quantity = long long;

// Per-bar numeric column. Missing values are quiet NaN.
using Series = std::vector<double>;

// Per-bar boolean rule output.
using SignalSeries = std::vector<bool>;

constexpr long long MS_PER_DAY = 86400000LL;

inline double missingValue() {
    return std::numeric_limits<double>::quiet_NaN();
}

inline bool isMissing(double value) {
    return std::isnan(value);
}

struct Bar {
    double open;
    double high;
    double low;
    double close;
    double volume;
    Timestamp timestamp;

    Bar() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Bar(double o, double h, double l, double c, double v, Timestamp t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// OHLCV columns a rule or indicator can read.
enum class PriceField { OPEN, HIGH, LOW, CLOSE, VOLUME };

inline double fieldValue(const Bar& bar, PriceField field) {
    switch (field) {
        case PriceField::OPEN: return bar.open;
        case PriceField::HIGH: return bar.high;
        case PriceField::LOW: return bar.low;
        case PriceField::CLOSE: return bar.close;
        case PriceField::VOLUME: return bar.volume;
    }
    return missingValue();
}

inline Series extractField(const std::vector<Bar>& bars, PriceField field) {
    Series out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        out.push_back(fieldValue(bar, field));
    }
    return out;
}

} // namespace stratlab
