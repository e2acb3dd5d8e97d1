#include "analytics/IndicatorFrame.h"
#include <tuple>

namespace stratlab {
namespace analytics {

bool IndicatorKey::operator<(const IndicatorKey& other) const {
    return std::tie(kind, source, params) < std::tie(other.kind, other.source, other.params);
}

bool IndicatorKey::operator==(const IndicatorKey& other) const {
    return kind == other.kind && source == other.source && params == other.params;
}

IndicatorFrame::IndicatorFrame(std::vector<Bar> bars)
    : bars_(std::move(bars)) {
}

IndicatorFrame IndicatorFrame::build(std::vector<Bar> bars) {
    IndicatorFrame frame(std::move(bars));
    if (frame.empty()) {
        return frame;
    }

    const Series close = frame.column(PriceField::CLOSE);
    const auto& b = frame.bars_;

    for (int period : {10, 20, 50, 100, 200}) {
        const double p = static_cast<double>(period);
        frame.attach({IndicatorKind::SMA, {p}}, TechnicalIndicators::sma(close, period));
        frame.attach({IndicatorKind::EMA, {p}}, TechnicalIndicators::ema(close, period));
    }

    frame.attach({IndicatorKind::RSI, {14}}, TechnicalIndicators::rsi(close, 14));

    auto macd = TechnicalIndicators::macd(close, 12, 26, 9);
    frame.attach({IndicatorKind::MACD, {12, 26, 9}}, std::move(macd.macd));
    frame.attach({IndicatorKind::MACD_SIGNAL, {12, 26, 9}}, std::move(macd.signal));
    frame.attach({IndicatorKind::MACD_HIST, {12, 26, 9}}, std::move(macd.histogram));

    auto bb = TechnicalIndicators::bollingerBands(close, 20, 2.0);
    frame.attach({IndicatorKind::BB_UPPER, {20, 2}}, std::move(bb.upper));
    frame.attach({IndicatorKind::BB_MIDDLE, {20, 2}}, std::move(bb.middle));
    frame.attach({IndicatorKind::BB_LOWER, {20, 2}}, std::move(bb.lower));

    frame.attach({IndicatorKind::ATR, {14}}, TechnicalIndicators::atr(b, 14));

    auto stoch = TechnicalIndicators::stochastic(b, 14, 3);
    frame.attach({IndicatorKind::STOCH_K, {14, 3}}, std::move(stoch.k));
    frame.attach({IndicatorKind::STOCH_D, {14, 3}}, std::move(stoch.d));

    frame.attach({IndicatorKind::ADX, {14}}, TechnicalIndicators::adx(b, 14));
    frame.attach({IndicatorKind::OBV, {}}, TechnicalIndicators::obv(b));
    frame.attach({IndicatorKind::VWAP, {}}, TechnicalIndicators::vwap(b));
    frame.attach({IndicatorKind::CCI, {20}}, TechnicalIndicators::cci(b, 20));
    frame.attach({IndicatorKind::ROC, {12}}, TechnicalIndicators::roc(close, 12));
    frame.attach({IndicatorKind::WILLIAMS_R, {14}}, TechnicalIndicators::williamsR(b, 14));

    return frame;
}

const Series* IndicatorFrame::find(const IndicatorKey& key) const {
    auto it = columns_.find(key);
    return it == columns_.end() ? nullptr : &it->second;
}

Series IndicatorFrame::resolve(const IndicatorKey& key) const {
    if (const Series* cached = find(key)) {
        return *cached;
    }
    return TechnicalIndicators::compute(key.kind, bars_, key.source, key.params);
}

void IndicatorFrame::attach(const IndicatorKey& key, Series column) {
    if (column.size() != bars_.size()) {
        column.resize(bars_.size(), missingValue());
    }
    columns_[key] = std::move(column);
}

} // namespace analytics
} // namespace stratlab
