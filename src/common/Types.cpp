#include "common/Types.h"

namespace instflow {

const char* toString(DealCategory category) {
    switch (category) {
        case DealCategory::BULK: return "bulk";
        case DealCategory::BLOCK: return "block";
    }
    return "bulk";
}

const char* toString(InvestorClass cls) {
    switch (cls) {
        case InvestorClass::FII: return "FII";
        case InvestorClass::DII: return "DII";
        case InvestorClass::BOTH: return "BOTH";
        case InvestorClass::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* toString(CashAction action) {
    switch (action) {
        case CashAction::BUY: return "buy";
        case CashAction::SELL: return "sell";
        case CashAction::NEUTRAL: return "neutral";
    }
    return "neutral";
}

const char* toString(EmaCross cross) {
    switch (cross) {
        case EmaCross::BULLISH: return "bullish";
        case EmaCross::BEARISH: return "bearish";
        case EmaCross::UNKNOWN: return "unknown";
    }
    return "unknown";
}

const char* toString(BollingerLabel label) {
    switch (label) {
        case BollingerLabel::OVERBOUGHT: return "Overbought";
        case BollingerLabel::MID: return "Mid";
        case BollingerLabel::OVERSOLD: return "Oversold";
        case BollingerLabel::NA: return "N/A";
    }
    return "N/A";
}

const char* toString(OverallSignal signal) {
    switch (signal) {
        case OverallSignal::STRONG_BUY: return "STRONG BUY";
        case OverallSignal::BUY: return "BUY";
        case OverallSignal::NEUTRAL: return "NEUTRAL";
        case OverallSignal::CAUTION: return "CAUTION";
        case OverallSignal::SELL: return "SELL";
        case OverallSignal::NA: return "N/A";
    }
    return "N/A";
}

const char* toString(FlowSignal signal) {
    switch (signal) {
        case FlowSignal::BOTH_BUY: return "BOTH BUY";
        case FlowSignal::FII_BUY: return "FII BUY";
        case FlowSignal::DII_BUY: return "DII BUY";
        case FlowSignal::BOTH_SELL: return "BOTH SELL";
        case FlowSignal::BULK_BLOCK: return "BULK/BLOCK";
        case FlowSignal::SELL: return "SELL";
    }
    return "SELL";
}

int signalRank(OverallSignal signal) {
    switch (signal) {
        case OverallSignal::SELL: return 0;
        case OverallSignal::CAUTION: return 1;
        case OverallSignal::NEUTRAL: return 2;
        case OverallSignal::BUY: return 3;
        case OverallSignal::STRONG_BUY: return 4;
        case OverallSignal::NA: return -1;
    }
    return -1;
}

} // namespace instflow
