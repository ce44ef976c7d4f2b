#pragma once

#include "common/Types.h"

namespace instflow {
namespace analytics {

// Rule-based composite score over rounded snapshot values
class SignalClassifier {
public:
    // rsi <40 +2, <55 +1, >70 -2; histogram >0 +2; bullish cross +2;
    // adx >25 +1; stoch <0.3 +1, >0.8 -1
    static int score(double rsi, double macd_histogram, EmaCross ema_cross, double adx, double stochastic_rsi);

    // >=5 STRONG BUY, >=3 BUY, >=0 NEUTRAL, >=-2 CAUTION, else SELL
    static OverallSignal labelFor(int score);

    // Fills composite_score/overall; data_ok=false keeps 0 / N/A
    static void applyScore(TechnicalSnapshot& snapshot);

    static InstitutionalFlow flowSignal(const InstitutionalStock& stock);
};

} // namespace analytics
} // namespace instflow
