#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace instflow {
namespace analytics {

double TechnicalIndicators::nan() {
    return std::numeric_limits<double>::quiet_NaN();
}

TechnicalIndicators::Series TechnicalIndicators::diff(const Series& values) {
    Series out(values.size(), nan());
    for (size_t i = 1; i < values.size(); ++i) {
        out[i] = values[i] - values[i - 1];
    }
    return out;
}

TechnicalIndicators::Series TechnicalIndicators::clipLower(const Series& values, double floor) {
    Series out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        out[i] = std::isnan(values[i]) ? values[i] : std::max(values[i], floor);
    }
    return out;
}

TechnicalIndicators::Series TechnicalIndicators::ewm(const Series& values, double alpha) {
    Series out(values.size(), nan());
    const double old_wt_factor = 1.0 - alpha;
    double weighted = nan();
    double old_wt = 1.0;

    for (size_t i = 0; i < values.size(); ++i) {
        const double cur = values[i];
        const bool is_observation = !std::isnan(cur);

        if (std::isnan(weighted)) {
            if (is_observation) {
                weighted = cur;
                old_wt = 1.0;
            }
        } else {
            old_wt *= old_wt_factor;
            if (is_observation) {
                if (weighted != cur) {
                    weighted = (old_wt * weighted + alpha * cur) / (old_wt + alpha);
                }
                old_wt = 1.0;
            }
        }
        out[i] = weighted;
    }
    return out;
}

TechnicalIndicators::Series TechnicalIndicators::wilder(const Series& values, int period) {
    return ewm(values, 1.0 / period);
}

TechnicalIndicators::Series TechnicalIndicators::ema(const Series& values, int span) {
    return ewm(values, 2.0 / (span + 1.0));
}

namespace {
// Applies fn to every complete, NaN-free window ending at i
template<typename Fn>
std::vector<double> rollingApply(const std::vector<double>& values, int window, Fn fn) {
    std::vector<double> out(values.size(), std::numeric_limits<double>::quiet_NaN());
    if (window <= 0) return out;
    const size_t w = static_cast<size_t>(window);
    for (size_t i = w - 1; i < values.size(); ++i) {
        auto first = values.begin() + static_cast<std::ptrdiff_t>(i + 1 - w);
        auto last = values.begin() + static_cast<std::ptrdiff_t>(i + 1);
        if (std::any_of(first, last, [](double v) { return std::isnan(v); })) continue;
        out[i] = fn(first, last);
    }
    return out;
}
}

TechnicalIndicators::Series TechnicalIndicators::rollingMean(const Series& values, int window) {
    return rollingApply(values, window, [](auto first, auto last) {
        double sum = 0.0;
        for (auto it = first; it != last; ++it) sum += *it;
        return sum / static_cast<double>(last - first);
    });
}

TechnicalIndicators::Series TechnicalIndicators::rollingStd(const Series& values, int window) {
    return rollingApply(values, window, [](auto first, auto last) {
        const double n = static_cast<double>(last - first);
        if (n < 2.0) return std::numeric_limits<double>::quiet_NaN();
        double mean = 0.0;
        for (auto it = first; it != last; ++it) mean += *it;
        mean /= n;
        double sq = 0.0;
        for (auto it = first; it != last; ++it) sq += (*it - mean) * (*it - mean);
        return std::sqrt(sq / (n - 1.0));
    });
}

TechnicalIndicators::Series TechnicalIndicators::rollingMin(const Series& values, int window) {
    return rollingApply(values, window, [](auto first, auto last) { return *std::min_element(first, last); });
}

TechnicalIndicators::Series TechnicalIndicators::rollingMax(const Series& values, int window) {
    return rollingApply(values, window, [](auto first, auto last) { return *std::max_element(first, last); });
}

TechnicalIndicators::Series TechnicalIndicators::rsiSeries(const Series& closes, int period) {
    const Series delta = diff(closes);
    Series losses(delta.size());
    for (size_t i = 0; i < delta.size(); ++i) {
        losses[i] = -delta[i];
    }

    const Series avg_gain = wilder(clipLower(delta, 0.0), period);
    const Series avg_loss = wilder(clipLower(losses, 0.0), period);

    Series out(closes.size(), nan());
    for (size_t i = 0; i < closes.size(); ++i) {
        const double ag = avg_gain[i];
        const double al = avg_loss[i];
        if (std::isnan(ag) || std::isnan(al)) continue;
        if (al == 0.0) {
            out[i] = ag > 0.0 ? 100.0 : 50.0;
            continue;
        }
        out[i] = 100.0 - 100.0 / (1.0 + ag / al);
    }
    return out;
}

TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const Series& closes,
    int fast,
    int slow,
    int signal_period
) {
    MACDResult result;
    if (closes.empty()) {
        return result;
    }

    const Series fast_ema = ema(closes, fast);
    const Series slow_ema = ema(closes, slow);
    Series macd_series(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        macd_series[i] = fast_ema[i] - slow_ema[i];
    }
    const Series signal_series = ema(macd_series, signal_period);

    result.macd = macd_series.back();
    result.signal = signal_series.back();
    result.histogram = result.macd - result.signal;
    return result;
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const Series& closes,
    int period,
    double std_dev_mult
) {
    BollingerBands result;
    if (closes.empty()) {
        return result;
    }

    result.middle = lastValue(rollingMean(closes, period));
    const double std_dev = lastValue(rollingStd(closes, period));

    result.upper = result.middle + std_dev * std_dev_mult;
    result.lower = result.middle - std_dev * std_dev_mult;

    double width = result.upper - result.lower;
    if (width == 0.0) {
        width = 1.0;
    }
    result.percent_b = (closes.back() - result.lower) / width;
    return result;
}

double TechnicalIndicators::calculateADX(
    const Series& highs,
    const Series& lows,
    const Series& closes,
    int period
) {
    const size_t n = closes.size();
    if (n == 0 || highs.size() != n || lows.size() != n) {
        return nan();
    }

    const Series plus_dm = clipLower(diff(highs), 0.0);
    Series low_drop = diff(lows);
    for (auto& v : low_drop) v = -v;
    const Series minus_dm = clipLower(low_drop, 0.0);

    // first bar has no previous close: the range alone
    Series tr(n);
    for (size_t i = 0; i < n; ++i) {
        double value = highs[i] - lows[i];
        if (i > 0) {
            value = std::max({value, std::abs(highs[i] - closes[i - 1]), std::abs(lows[i] - closes[i - 1])});
        }
        tr[i] = value;
    }

    const Series atr = wilder(tr, period);
    const Series plus_avg = wilder(plus_dm, period);
    const Series minus_avg = wilder(minus_dm, period);

    Series dx(n, nan());
    for (size_t i = 0; i < n; ++i) {
        const double plus_di = 100.0 * plus_avg[i] / atr[i];
        const double minus_di = 100.0 * minus_avg[i] / atr[i];
        const double sum = plus_di + minus_di;
        if (std::isnan(sum) || sum == 0.0) continue;
        dx[i] = 100.0 * std::abs(plus_di - minus_di) / sum;
    }

    return lastValue(wilder(dx, period));
}

double TechnicalIndicators::calculateStochasticRSI(const Series& rsi, int period) {
    const double lo = lastValue(rollingMin(rsi, period));
    const double hi = lastValue(rollingMax(rsi, period));
    const double range = hi - lo;
    if (std::isnan(range) || range == 0.0) {
        return nan();
    }
    return (rsi.back() - lo) / range;
}

TechnicalIndicators::PivotLevels TechnicalIndicators::calculatePivots(double high, double low, double close) {
    PivotLevels levels;
    levels.pivot = (high + low + close) / 3.0;
    levels.resistance1 = 2.0 * levels.pivot - low;
    levels.support1 = 2.0 * levels.pivot - high;
    levels.resistance2 = levels.pivot + (high - low);
    levels.support2 = levels.pivot - (high - low);
    return levels;
}

double TechnicalIndicators::lastValue(const Series& values) {
    return values.empty() ? nan() : values.back();
}

} // namespace analytics
} // namespace instflow
