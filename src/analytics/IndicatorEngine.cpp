#include "analytics/IndicatorEngine.h"
#include "analytics/SignalClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace instflow {
namespace analytics {

namespace {
bool isUsable(const PriceBar& bar) {
    return std::isfinite(bar.open) && std::isfinite(bar.high) && std::isfinite(bar.low) &&
           std::isfinite(bar.close) && std::isfinite(bar.volume);
}
}

IndicatorEngine::IndicatorEngine(const engine::IndicatorConfig& config)
    : config_(config)
{
    // zero windows would read past the bar series
    config_.min_bars = std::max<size_t>(config_.min_bars, 1);
    config_.swing_window = std::max<size_t>(config_.swing_window, 1);
}

TechnicalSnapshot IndicatorEngine::neutralSnapshot() {
    return TechnicalSnapshot();
}

double IndicatorEngine::roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

TechnicalSnapshot IndicatorEngine::compute(const std::vector<PriceBar>& bars) const {
    try {
        std::vector<double> highs, lows, closes;
        highs.reserve(bars.size());
        lows.reserve(bars.size());
        closes.reserve(bars.size());
        for (const auto& bar : bars) {
            if (!isUsable(bar)) continue;
            highs.push_back(bar.high);
            lows.push_back(bar.low);
            closes.push_back(bar.close);
        }

        const size_t n = closes.size();
        if (n == 0 || n < config_.min_bars) {
            LOG_WARN("Only {} usable bars (need {})", n, config_.min_bars);
            return neutralSnapshot();
        }

        using TI = TechnicalIndicators;
        const double last_close = closes.back();

        const auto rsi_series = TI::rsiSeries(closes, 14);
        const double rsi = TI::lastValue(rsi_series);

        const auto macd = TI::calculateMACD(closes, 12, 26, 9);

        const double ema20 = TI::lastValue(TI::ema(closes, 20));
        const double ema50 = TI::lastValue(TI::ema(closes, 50));

        const auto bands = TI::calculateBollingerBands(closes, 20, 2.0);
        const double adx = TI::calculateADX(highs, lows, closes, 14);

        double stoch = TI::calculateStochasticRSI(rsi_series, 14);
        if (std::isnan(stoch)) {
            stoch = 0.5;
        }

        const auto pivots = TI::calculatePivots(highs.back(), lows.back(), last_close);

        const size_t window = std::min(config_.swing_window, n);
        const double swing_high = *std::max_element(highs.end() - static_cast<std::ptrdiff_t>(window), highs.end());
        const double swing_low = *std::min_element(lows.end() - static_cast<std::ptrdiff_t>(window), lows.end());

        TechnicalSnapshot snap;
        snap.rsi = roundTo(rsi, 1);
        snap.macd = roundTo(macd.macd, 2);
        snap.macd_histogram = roundTo(macd.histogram, 2);
        snap.ema_cross = ema20 > ema50 ? EmaCross::BULLISH : EmaCross::BEARISH;
        if (bands.percent_b > 0.8) snap.bollinger = BollingerLabel::OVERBOUGHT;
        else if (bands.percent_b < 0.2) snap.bollinger = BollingerLabel::OVERSOLD;
        else snap.bollinger = BollingerLabel::MID;
        snap.adx = roundTo(adx, 1);
        snap.stochastic_rsi = roundTo(stoch, 2);
        snap.resistance1 = roundTo(pivots.resistance1, 2);
        snap.support1 = roundTo(pivots.support1, 2);
        snap.resistance2 = roundTo(pivots.resistance2, 2);
        snap.support2 = roundTo(pivots.support2, 2);
        snap.swing_high = roundTo(swing_high, 2);
        snap.swing_low = roundTo(swing_low, 2);
        snap.last_price = roundTo(last_close, 2);

        const size_t spark = std::min(config_.sparkline_length, n);
        for (size_t i = n - spark; i < n; ++i) {
            snap.sparkline.push_back(roundTo(closes[i], 2));
        }
        snap.bar_count = static_cast<int>(n);

        const double exposed[] = {
            snap.rsi, snap.macd, snap.macd_histogram, ema20, ema50, bands.percent_b, snap.adx,
            snap.stochastic_rsi, snap.resistance1, snap.support1, snap.resistance2, snap.support2,
            snap.swing_high, snap.swing_low, snap.last_price
        };
        for (double v : exposed) {
            if (!std::isfinite(v)) {
                LOG_WARN("Indicator not computable over {} bars, using neutral snapshot", n);
                return neutralSnapshot();
            }
        }

        snap.data_ok = true;
        SignalClassifier::applyScore(snap);
        return snap;
    } catch (const std::exception& e) {
        LOG_WARN("Indicator computation failed: {}", e.what());
        return neutralSnapshot();
    }
}

} // namespace analytics
} // namespace instflow
