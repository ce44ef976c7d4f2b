#pragma once

#include <vector>

namespace instflow {
namespace analytics {

// Whole-series indicator math. Undefined points are NaN; a series keeps the
// length of its input so index i always refers to bar i.
class TechnicalIndicators {
public:
    using Series = std::vector<double>;

    // x[i] - x[i-1]; first element undefined
    static Series diff(const Series& values);

    // max(x, floor); NaN stays NaN
    static Series clipLower(const Series& values, double floor);

    // Recursive exponential smoothing avg = a*x + (1-a)*avg_prev, seeded by
    // the first defined value. A NaN after the seed carries the previous
    // average and decays its weight for the next observation.
    static Series ewm(const Series& values, double alpha);

    // Wilder smoothing, alpha = 1/period
    static Series wilder(const Series& values, int period);

    // EMA, alpha = 2/(span+1)
    static Series ema(const Series& values, int span);

    // Full windows only; a NaN inside the window makes the point NaN
    static Series rollingMean(const Series& values, int window);
    static Series rollingStd(const Series& values, int window);     // sample (n-1)
    static Series rollingMin(const Series& values, int window);
    static Series rollingMax(const Series& values, int window);

    // RSI series (Wilder). Zero average loss: 100 with gains, 50 when flat
    static Series rsiSeries(const Series& closes, int period = 14);

    struct MACDResult {
        double macd;        // ema(fast) - ema(slow)
        double signal;      // ema(signal_period) of macd
        double histogram;   // macd - signal

        MACDResult() : macd(0), signal(0), histogram(0) {}
    };
    static MACDResult calculateMACD(const Series& closes, int fast = 12, int slow = 26, int signal_period = 9);

    struct BollingerBands {
        double upper;
        double middle;
        double lower;
        double percent_b;   // position of the last close inside the band

        BollingerBands() : upper(0), middle(0), lower(0), percent_b(0) {}
    };
    static BollingerBands calculateBollingerBands(const Series& closes, int period = 20, double std_dev_mult = 2.0);

    // Latest ADX; +DM/-DM are the clipped high/low differences
    static double calculateADX(const Series& highs, const Series& lows, const Series& closes, int period = 14);

    // Latest (rsi - min) / (max - min) over `period` RSI points; NaN when undefined
    static double calculateStochasticRSI(const Series& rsi, int period = 14);

    struct PivotLevels {
        double pivot;
        double resistance1;
        double support1;
        double resistance2;
        double support2;

        PivotLevels() : pivot(0), resistance1(0), support1(0), resistance2(0), support2(0) {}
    };
    // Classic floor pivots from one bar
    static PivotLevels calculatePivots(double high, double low, double close);

    static double lastValue(const Series& values);

private:
    static double nan();
};

} // namespace analytics
} // namespace instflow
