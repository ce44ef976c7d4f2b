#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace instflow {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Quantity = double;

// Calendar date (proleptic Gregorian), no time zone
struct Date {
    int year;
    int month;
    int day;

    Date() : year(1970), month(1), day(1) {}
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    bool operator==(const Date& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
};

enum class DealCategory { BULK, BLOCK };

// Investor class already stated by the source (scrape/fallback rows).
// UNKNOWN rows are classified by client-name keywords.
enum class InvestorClass { UNKNOWN, FII, DII, BOTH };

enum class CashAction { BUY, SELL, NEUTRAL };

enum class EmaCross { BULLISH, BEARISH, UNKNOWN };
enum class BollingerLabel { OVERBOUGHT, MID, OVERSOLD, NA };
enum class OverallSignal { STRONG_BUY, BUY, NEUTRAL, CAUTION, SELL, NA };
enum class FlowSignal { BOTH_BUY, FII_BUY, DII_BUY, BOTH_SELL, BULK_BLOCK, SELL };

struct DealRecord {
    std::string symbol;
    std::string company;
    std::string client;
    std::string buy_sell;       // raw provider flag ("BUY", "B", "SELL", ...)
    Quantity quantity = 0.0;
    Price price = 0.0;
    std::string trade_date;     // as reported by the provider
    DealCategory category = DealCategory::BULK;
    InvestorClass declared_class = InvestorClass::UNKNOWN;

    // "B*" means buy, everything else is a sell
    bool isBuy() const { return !buy_sell.empty() && (buy_sell[0] == 'B' || buy_sell[0] == 'b'); }
};

struct InstitutionalStock {
    std::string symbol;         // exchange symbol (RELIANCE)
    std::string ticker;         // price provider symbol (RELIANCE.NS)
    std::string name;
    CashAction fii_cash = CashAction::NEUTRAL;
    CashAction dii_cash = CashAction::NEUTRAL;
};

struct PriceBar {
    long long timestamp;        // epoch seconds
    double open;
    double high;
    double low;
    double close;
    double volume;

    PriceBar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    PriceBar(long long t, double o, double h, double l, double c, double v)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}
};

struct TechnicalSnapshot {
    double rsi = 50.0;
    double macd = 0.0;
    double macd_histogram = 0.0;
    EmaCross ema_cross = EmaCross::UNKNOWN;
    BollingerLabel bollinger = BollingerLabel::NA;
    double adx = 0.0;
    double stochastic_rsi = 0.0;
    double resistance1 = 0.0;
    double support1 = 0.0;
    double resistance2 = 0.0;
    double support2 = 0.0;
    double swing_high = 0.0;
    double swing_low = 0.0;
    double last_price = 0.0;
    int composite_score = 0;
    OverallSignal overall = OverallSignal::NA;
    std::vector<double> sparkline;  // last closes, oldest first
    int bar_count = 0;
    bool data_ok = false;
};

struct InstitutionalFlow {
    FlowSignal signal = FlowSignal::BULK_BLOCK;
    bool both_buy = false;
    bool fii_only = false;
    bool dii_only = false;
    bool both_sell = false;
};

struct EnrichedStock {
    InstitutionalStock stock;
    TechnicalSnapshot technicals;
    InstitutionalFlow flow;
};

struct IndexQuote {
    std::string name;
    std::string ticker;
    double price = 0.0;
    double change_pct = 0.0;
};

struct MarketSummary {
    std::vector<IndexQuote> indices;
};

// Everything one run produces for the reporting layer
struct DashboardDataset {
    std::vector<EnrichedStock> stocks;
    MarketSummary market;
    std::string source_label;
    std::string window_label;
    std::string generated_at;       // exchange local time, "YYYY-MM-DD HH:MM"
};

const char* toString(DealCategory category);
const char* toString(InvestorClass cls);
const char* toString(CashAction action);
const char* toString(EmaCross cross);
const char* toString(BollingerLabel label);
const char* toString(OverallSignal signal);
const char* toString(FlowSignal signal);

// Rank used for monotonic comparisons: SELL=0 .. STRONG_BUY=4, NA=-1
int signalRank(OverallSignal signal);

} // namespace instflow
