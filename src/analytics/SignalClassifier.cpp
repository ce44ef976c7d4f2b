#include "analytics/SignalClassifier.h"

namespace instflow {
namespace analytics {

int SignalClassifier::score(
    double rsi,
    double macd_histogram,
    EmaCross ema_cross,
    double adx,
    double stochastic_rsi
) {
    int sc = 0;

    if (rsi < 40.0) sc += 2;
    else if (rsi < 55.0) sc += 1;
    else if (rsi > 70.0) sc -= 2;

    if (macd_histogram > 0.0) sc += 2;
    if (ema_cross == EmaCross::BULLISH) sc += 2;
    if (adx > 25.0) sc += 1;

    if (stochastic_rsi < 0.3) sc += 1;
    else if (stochastic_rsi > 0.8) sc -= 1;

    return sc;
}

OverallSignal SignalClassifier::labelFor(int score) {
    if (score >= 5) return OverallSignal::STRONG_BUY;
    if (score >= 3) return OverallSignal::BUY;
    if (score >= 0) return OverallSignal::NEUTRAL;
    if (score >= -2) return OverallSignal::CAUTION;
    return OverallSignal::SELL;
}

void SignalClassifier::applyScore(TechnicalSnapshot& snapshot) {
    if (!snapshot.data_ok) {
        snapshot.composite_score = 0;
        snapshot.overall = OverallSignal::NA;
        return;
    }
    snapshot.composite_score = score(snapshot.rsi, snapshot.macd_histogram, snapshot.ema_cross,
                                     snapshot.adx, snapshot.stochastic_rsi);
    snapshot.overall = labelFor(snapshot.composite_score);
}

InstitutionalFlow SignalClassifier::flowSignal(const InstitutionalStock& stock) {
    const bool fii_buy = stock.fii_cash == CashAction::BUY;
    const bool dii_buy = stock.dii_cash == CashAction::BUY;

    InstitutionalFlow flow;
    flow.both_buy = fii_buy && dii_buy;
    flow.fii_only = fii_buy && !dii_buy;
    flow.dii_only = dii_buy && !fii_buy;
    flow.both_sell = stock.fii_cash == CashAction::SELL && stock.dii_cash == CashAction::SELL;

    if (flow.both_buy) flow.signal = FlowSignal::BOTH_BUY;
    else if (flow.fii_only) flow.signal = FlowSignal::FII_BUY;
    else if (flow.dii_only) flow.signal = FlowSignal::DII_BUY;
    else if (flow.both_sell) flow.signal = FlowSignal::BOTH_SELL;
    else if (stock.fii_cash == CashAction::NEUTRAL && stock.dii_cash == CashAction::NEUTRAL) flow.signal = FlowSignal::BULK_BLOCK;
    else flow.signal = FlowSignal::SELL;

    return flow;
}

} // namespace analytics
} // namespace instflow
