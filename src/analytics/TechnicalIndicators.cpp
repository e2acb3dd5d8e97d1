#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <map>

namespace stratlab {
namespace analytics {

namespace {

const std::map<std::string, IndicatorKind>& indicatorNames() {
    static const std::map<std::string, IndicatorKind> names = {
        {"sma", IndicatorKind::SMA},
        {"ema", IndicatorKind::EMA},
        {"wma", IndicatorKind::WMA},
        {"rsi", IndicatorKind::RSI},
        {"macd", IndicatorKind::MACD},
        {"macd_signal", IndicatorKind::MACD_SIGNAL},
        {"macd_hist", IndicatorKind::MACD_HIST},
        {"bb_upper", IndicatorKind::BB_UPPER},
        {"bb_middle", IndicatorKind::BB_MIDDLE},
        {"bb_lower", IndicatorKind::BB_LOWER},
        {"atr", IndicatorKind::ATR},
        {"stoch_k", IndicatorKind::STOCH_K},
        {"stoch_d", IndicatorKind::STOCH_D},
        {"adx", IndicatorKind::ADX},
        {"obv", IndicatorKind::OBV},
        {"vwap", IndicatorKind::VWAP},
        {"cci", IndicatorKind::CCI},
        {"roc", IndicatorKind::ROC},
        {"williams_r", IndicatorKind::WILLIAMS_R},
        {"momentum", IndicatorKind::MOMENTUM},
    };
    return names;
}

Series typicalPrice(const std::vector<Bar>& bars) {
    Series tp;
    tp.reserve(bars.size());
    for (const auto& bar : bars) {
        tp.push_back((bar.high + bar.low + bar.close) / 3.0);
    }
    return tp;
}

// Positional defaults; extra arguments beyond the indicator's arity are dropped.
std::vector<double> withDefaults(const std::vector<double>& params,
                                 const std::vector<double>& defaults) {
    std::vector<double> out = defaults;
    for (size_t i = 0; i < params.size() && i < defaults.size(); ++i) {
        out[i] = params[i];
    }
    return out;
}

} // namespace

std::optional<IndicatorKind> indicatorFromName(const std::string& name) {
    const auto& names = indicatorNames();
    auto it = names.find(name);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string indicatorName(IndicatorKind kind) {
    for (const auto& [name, k] : indicatorNames()) {
        if (k == kind) {
            return name;
        }
    }
    return "unknown";
}

bool usesSourceSeries(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::SMA:
        case IndicatorKind::EMA:
        case IndicatorKind::WMA:
        case IndicatorKind::RSI:
        case IndicatorKind::MACD:
        case IndicatorKind::MACD_SIGNAL:
        case IndicatorKind::MACD_HIST:
        case IndicatorKind::BB_UPPER:
        case IndicatorKind::BB_MIDDLE:
        case IndicatorKind::BB_LOWER:
        case IndicatorKind::ROC:
        case IndicatorKind::MOMENTUM:
            return true;
        case IndicatorKind::ATR:
        case IndicatorKind::STOCH_K:
        case IndicatorKind::STOCH_D:
        case IndicatorKind::ADX:
        case IndicatorKind::OBV:
        case IndicatorKind::VWAP:
        case IndicatorKind::CCI:
        case IndicatorKind::WILLIAMS_R:
            return false;
    }
    return false;
}

Series TechnicalIndicators::missingSeries(size_t n) {
    return Series(n, missingValue());
}

int TechnicalIndicators::toPeriod(double value) {
    if (!std::isfinite(value) || value < 1.0 || value > 1e9) {
        return 0;
    }
    return static_cast<int>(value);
}

// ===== Rolling windows =====
// A window containing any missing value yields a missing result.

Series TechnicalIndicators::rollingMean(const Series& values, int period) {
    Series out = missingSeries(values.size());
    if (period < 1) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < values.size(); ++i) {
        double sum = 0.0;
        bool complete = true;
        for (size_t j = i + 1 - p; j <= i; ++j) {
            if (isMissing(values[j])) {
                complete = false;
                break;
            }
            sum += values[j];
        }
        if (complete) {
            out[i] = sum / period;
        }
    }
    return out;
}

// Sample standard deviation (n - 1)
Series TechnicalIndicators::rollingStd(const Series& values, int period) {
    Series out = missingSeries(values.size());
    if (period < 2) return out;

    const Series means = rollingMean(values, period);
    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < values.size(); ++i) {
        if (isMissing(means[i])) continue;
        double sq = 0.0;
        for (size_t j = i + 1 - p; j <= i; ++j) {
            const double d = values[j] - means[i];
            sq += d * d;
        }
        out[i] = std::sqrt(sq / (period - 1));
    }
    return out;
}

Series TechnicalIndicators::rollingMin(const Series& values, int period) {
    Series out = missingSeries(values.size());
    if (period < 1) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < values.size(); ++i) {
        double lowest = values[i + 1 - p];
        bool complete = !isMissing(lowest);
        for (size_t j = i + 2 - p; complete && j <= i; ++j) {
            if (isMissing(values[j])) {
                complete = false;
            } else {
                lowest = std::min(lowest, values[j]);
            }
        }
        if (complete) out[i] = lowest;
    }
    return out;
}

Series TechnicalIndicators::rollingMax(const Series& values, int period) {
    Series out = missingSeries(values.size());
    if (period < 1) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < values.size(); ++i) {
        double highest = values[i + 1 - p];
        bool complete = !isMissing(highest);
        for (size_t j = i + 2 - p; complete && j <= i; ++j) {
            if (isMissing(values[j])) {
                complete = false;
            } else {
                highest = std::max(highest, values[j]);
            }
        }
        if (complete) out[i] = highest;
    }
    return out;
}

// ===== Moving averages =====

Series TechnicalIndicators::sma(const Series& data, int period) {
    return rollingMean(data, period);
}

Series TechnicalIndicators::ema(const Series& data, int period) {
    Series out = missingSeries(data.size());
    if (period < 1 || data.empty()) return out;

    const double alpha = 2.0 / (period + 1.0);
    const double old_wt_factor = 1.0 - alpha;

    // Missing inputs decay the previous weight but keep the last output.
    double weighted = data[0];
    double old_wt = 1.0;
    out[0] = weighted;
    for (size_t i = 1; i < data.size(); ++i) {
        const double cur = data[i];
        const bool is_obs = !isMissing(cur);
        if (!isMissing(weighted)) {
            old_wt *= old_wt_factor;
            if (is_obs) {
                if (weighted != cur) {
                    weighted = (old_wt * weighted + alpha * cur) / (old_wt + alpha);
                }
                old_wt = 1.0;
            }
        } else if (is_obs) {
            weighted = cur;
        }
        out[i] = weighted;
    }
    return out;
}

Series TechnicalIndicators::wma(const Series& data, int period) {
    Series out = missingSeries(data.size());
    if (period < 1) return out;

    const size_t p = static_cast<size_t>(period);
    const double weight_sum = static_cast<double>(period) * (period + 1) / 2.0;
    for (size_t i = p - 1; i < data.size(); ++i) {
        double acc = 0.0;
        bool complete = true;
        for (size_t k = 0; k < p; ++k) {
            const double v = data[i + 1 - p + k];
            if (isMissing(v)) {
                complete = false;
                break;
            }
            acc += v * static_cast<double>(k + 1);
        }
        if (complete) out[i] = acc / weight_sum;
    }
    return out;
}

// ===== Oscillators =====

Series TechnicalIndicators::rsi(const Series& data, int period) {
    const size_t n = data.size();
    Series gains(n, 0.0);
    Series losses(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        const double delta = data[i] - data[i - 1];
        if (isMissing(delta)) {
            // Missing changes count as neither gain nor loss
            continue;
        }
        if (delta > 0) gains[i] = delta;
        if (delta < 0) losses[i] = -delta;
    }

    const Series avg_gain = rollingMean(gains, period);
    const Series avg_loss = rollingMean(losses, period);

    Series out = missingSeries(n);
    for (size_t i = 0; i < n; ++i) {
        const double rs = avg_gain[i] / avg_loss[i];
        out[i] = 100.0 - (100.0 / (1.0 + rs));
    }
    return out;
}

TechnicalIndicators::MACDResult TechnicalIndicators::macd(const Series& data,
                                                          int fast,
                                                          int slow,
                                                          int signal_period) {
    MACDResult result;
    const Series fast_ema = ema(data, fast);
    const Series slow_ema = ema(data, slow);

    result.macd.resize(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        result.macd[i] = fast_ema[i] - slow_ema[i];
    }

    result.signal = ema(result.macd, signal_period);

    result.histogram.resize(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        result.histogram[i] = result.macd[i] - result.signal[i];
    }
    return result;
}

TechnicalIndicators::BollingerBands TechnicalIndicators::bollingerBands(const Series& data,
                                                                        int period,
                                                                        double std_dev_mult) {
    BollingerBands bands;
    bands.middle = sma(data, period);
    const Series stdev = rollingStd(data, period);

    bands.upper.resize(data.size());
    bands.lower.resize(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        bands.upper[i] = bands.middle[i] + stdev[i] * std_dev_mult;
        bands.lower[i] = bands.middle[i] - stdev[i] * std_dev_mult;
    }
    return bands;
}

Series TechnicalIndicators::trueRange(const std::vector<Bar>& bars) {
    Series tr(bars.size(), missingValue());
    for (size_t i = 0; i < bars.size(); ++i) {
        double range = bars[i].high - bars[i].low;
        if (i > 0) {
            const double prev_close = bars[i - 1].close;
            const double high_close = std::abs(bars[i].high - prev_close);
            const double low_close = std::abs(bars[i].low - prev_close);
            // Row-wise max skipping missing terms
            for (double v : {high_close, low_close}) {
                if (isMissing(v)) continue;
                if (isMissing(range) || v > range) range = v;
            }
        }
        tr[i] = range;
    }
    return tr;
}

Series TechnicalIndicators::atr(const std::vector<Bar>& bars, int period) {
    return rollingMean(trueRange(bars), period);
}

TechnicalIndicators::StochasticResult TechnicalIndicators::stochastic(const std::vector<Bar>& bars,
                                                                      int k_period,
                                                                      int d_period) {
    StochasticResult result;
    const Series lowest_low = rollingMin(extractField(bars, PriceField::LOW), k_period);
    const Series highest_high = rollingMax(extractField(bars, PriceField::HIGH), k_period);

    result.k.resize(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        result.k[i] = 100.0 * (bars[i].close - lowest_low[i]) / (highest_high[i] - lowest_low[i]);
    }
    result.d = rollingMean(result.k, d_period);
    return result;
}

Series TechnicalIndicators::adx(const std::vector<Bar>& bars, int period) {
    const size_t n = bars.size();
    Series plus_dm(n, 0.0);
    Series minus_dm(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        const double up = bars[i].high - bars[i - 1].high;
        const double down = -(bars[i].low - bars[i - 1].low);
        if (up > down && up > 0) plus_dm[i] = up;
        if (down > up && down > 0) minus_dm[i] = down;
    }

    const Series atr_values = atr(bars, period);
    const Series plus_avg = rollingMean(plus_dm, period);
    const Series minus_avg = rollingMean(minus_dm, period);

    Series dx(n, missingValue());
    for (size_t i = 0; i < n; ++i) {
        const double plus_di = 100.0 * (plus_avg[i] / atr_values[i]);
        const double minus_di = 100.0 * (minus_avg[i] / atr_values[i]);
        dx[i] = 100.0 * std::abs(plus_di - minus_di) / (plus_di + minus_di);
    }
    return rollingMean(dx, period);
}

Series TechnicalIndicators::cci(const std::vector<Bar>& bars, int period) {
    const Series tp = typicalPrice(bars);
    const Series sma_tp = rollingMean(tp, period);

    Series out = missingSeries(bars.size());
    if (period < 1) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < tp.size(); ++i) {
        if (isMissing(sma_tp[i])) continue;
        double deviation = 0.0;
        for (size_t j = i + 1 - p; j <= i; ++j) {
            deviation += std::abs(tp[j] - sma_tp[i]);
        }
        deviation /= period;
        out[i] = (tp[i] - sma_tp[i]) / (0.015 * deviation);
    }
    return out;
}

Series TechnicalIndicators::roc(const Series& data, int period) {
    Series out = missingSeries(data.size());
    if (period < 1) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p; i < data.size(); ++i) {
        out[i] = ((data[i] - data[i - p]) / data[i - p]) * 100.0;
    }
    return out;
}

Series TechnicalIndicators::momentum(const Series& data, int period) {
    Series out = missingSeries(data.size());
    if (period < 1) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p; i < data.size(); ++i) {
        out[i] = data[i] - data[i - p];
    }
    return out;
}

Series TechnicalIndicators::williamsR(const std::vector<Bar>& bars, int period) {
    const Series highest_high = rollingMax(extractField(bars, PriceField::HIGH), period);
    const Series lowest_low = rollingMin(extractField(bars, PriceField::LOW), period);

    Series out(bars.size(), missingValue());
    for (size_t i = 0; i < bars.size(); ++i) {
        out[i] = -100.0 * (highest_high[i] - bars[i].close) / (highest_high[i] - lowest_low[i]);
    }
    return out;
}

// ===== Volume =====

Series TechnicalIndicators::obv(const std::vector<Bar>& bars) {
    Series out(bars.size(), 0.0);
    double running = 0.0;
    for (size_t i = 1; i < bars.size(); ++i) {
        const double delta = bars[i].close - bars[i - 1].close;
        double term = 0.0;
        if (delta > 0) term = bars[i].volume;
        else if (delta < 0) term = -bars[i].volume;
        if (!isMissing(term)) running += term;
        out[i] = running;
    }
    return out;
}

Series TechnicalIndicators::vwap(const std::vector<Bar>& bars) {
    Series out(bars.size(), missingValue());
    double pv_sum = 0.0;
    double vol_sum = 0.0;
    for (size_t i = 0; i < bars.size(); ++i) {
        const double tp = (bars[i].high + bars[i].low + bars[i].close) / 3.0;
        const double pv = tp * bars[i].volume;
        const bool pv_ok = !isMissing(pv);
        const bool vol_ok = !isMissing(bars[i].volume);
        if (pv_ok) pv_sum += pv;
        if (vol_ok) vol_sum += bars[i].volume;
        if (pv_ok && vol_ok) {
            out[i] = pv_sum / vol_sum;
        }
    }
    return out;
}

// ===== Dispatch =====

std::vector<double> TechnicalIndicators::normalizeParams(IndicatorKind kind,
                                                         const std::vector<double>& params) {
    std::vector<double> out;
    switch (kind) {
        case IndicatorKind::SMA:
        case IndicatorKind::EMA:
        case IndicatorKind::WMA:
            if (!params.empty()) out.push_back(params[0]);
            break;
        case IndicatorKind::RSI:
        case IndicatorKind::ATR:
        case IndicatorKind::ADX:
        case IndicatorKind::WILLIAMS_R:
            out = withDefaults(params, {14});
            break;
        case IndicatorKind::CCI:
            out = withDefaults(params, {20});
            break;
        case IndicatorKind::ROC:
            out = withDefaults(params, {12});
            break;
        case IndicatorKind::MOMENTUM:
            out = withDefaults(params, {10});
            break;
        case IndicatorKind::MACD:
        case IndicatorKind::MACD_SIGNAL:
        case IndicatorKind::MACD_HIST:
            out = withDefaults(params, {12, 26, 9});
            break;
        case IndicatorKind::BB_UPPER:
        case IndicatorKind::BB_MIDDLE:
        case IndicatorKind::BB_LOWER:
            out = withDefaults(params, {20, 2});
            // The multiplier stays fractional; the period is an integer
            out[0] = std::trunc(out[0]);
            return out;
        case IndicatorKind::STOCH_K:
        case IndicatorKind::STOCH_D:
            out = withDefaults(params, {14, 3});
            break;
        case IndicatorKind::OBV:
        case IndicatorKind::VWAP:
            break;
    }
    for (auto& p : out) {
        p = std::trunc(p);
    }
    return out;
}

Series TechnicalIndicators::compute(IndicatorKind kind,
                                    const std::vector<Bar>& bars,
                                    PriceField source,
                                    const std::vector<double>& params) {
    const size_t n = bars.size();
    auto param = [&params](size_t i) -> int {
        return i < params.size() ? toPeriod(params[i]) : 0;
    };

    if (usesSourceSeries(kind)) {
        const Series data = extractField(bars, source);
        switch (kind) {
            case IndicatorKind::SMA:
                return param(0) > 0 ? sma(data, param(0)) : missingSeries(n);
            case IndicatorKind::EMA:
                return param(0) > 0 ? ema(data, param(0)) : missingSeries(n);
            case IndicatorKind::WMA:
                return param(0) > 0 ? wma(data, param(0)) : missingSeries(n);
            case IndicatorKind::RSI:
                return rsi(data, param(0));
            case IndicatorKind::MACD:
                return macd(data, param(0), param(1), param(2)).macd;
            case IndicatorKind::MACD_SIGNAL:
                return macd(data, param(0), param(1), param(2)).signal;
            case IndicatorKind::MACD_HIST:
                return macd(data, param(0), param(1), param(2)).histogram;
            case IndicatorKind::BB_UPPER:
                return bollingerBands(data, param(0), params.size() > 1 ? params[1] : 2.0).upper;
            case IndicatorKind::BB_MIDDLE:
                return bollingerBands(data, param(0), params.size() > 1 ? params[1] : 2.0).middle;
            case IndicatorKind::BB_LOWER:
                return bollingerBands(data, param(0), params.size() > 1 ? params[1] : 2.0).lower;
            case IndicatorKind::ROC:
                return roc(data, param(0));
            case IndicatorKind::MOMENTUM:
                return momentum(data, param(0));
            default:
                break;
        }
        return missingSeries(n);
    }

    switch (kind) {
        case IndicatorKind::ATR:
            return atr(bars, param(0));
        case IndicatorKind::STOCH_K:
            return stochastic(bars, param(0), param(1)).k;
        case IndicatorKind::STOCH_D:
            return stochastic(bars, param(0), param(1)).d;
        case IndicatorKind::ADX:
            return adx(bars, param(0));
        case IndicatorKind::OBV:
            return obv(bars);
        case IndicatorKind::VWAP:
            return vwap(bars);
        case IndicatorKind::CCI:
            return cci(bars, param(0));
        case IndicatorKind::WILLIAMS_R:
            return williamsR(bars, param(0));
        default:
            break;
    }
    return missingSeries(n);
}

} // namespace analytics
} // namespace stratlab
