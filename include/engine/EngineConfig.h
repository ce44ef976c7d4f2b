#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "common/Types.h"

namespace instflow {
namespace engine {

// Exchange calendar. Holidays are "YYYY-MM-DD" keyed by year and must be
// refreshed every year from the exchange circular.
struct CalendarConfig {
    int utc_offset_minutes = 330;               // IST
    std::string cutoff = "18:30";               // block deal window closes
    int to_date_max_lookback = 10;              // calendar days tried for to_date
    int window_trading_days_back = 5;           // from_date = 5 trading days before to_date
    int window_max_calendar_days = 30;
    std::map<int, std::set<std::string>> holidays;

    CalendarConfig();
};

struct ClassifierConfig {
    std::vector<std::string> fii_keywords;
    std::vector<std::string> dii_keywords;
    bool sort_by_trade_date = false;

    ClassifierConfig();
};

struct NseSourceConfig {
    bool enabled = true;
    std::string home_url = "https://www.nseindia.com/";
    std::string landing_url = "https://www.nseindia.com/market-data/bulk-block-short-selling-deals";
    std::string api_url = "https://www.nseindia.com/api/historicalOR/bulk-block-short-deals";
    std::vector<std::string> categories = {"bulk_deals", "block_deals"};
    std::string user_agent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/121.0.0.0 Safari/537.36";
    long warmup_timeout_seconds = 15;
    long request_timeout_seconds = 30;
    int max_attempts = 3;
    int warmup_pause_ms = 2000;
    int backoff_ms = 3000;                      // empty body / bot block / transport error
    int status_backoff_ms = 2000;               // non-200
    int category_delay_ms = 1500;
};

struct ScrapeSourceConfig {
    bool enabled = true;
    std::string url = "https://munafasutra.com/nse/FIIDII/";
    std::string link_marker = "/nse/stock/";
    std::string buy_keyword = "bought";
    std::string user_agent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/121.0.0.0 Safari/537.36";
    long request_timeout_seconds = 20;
    size_t max_stocks = 20;
};

struct FallbackStock {
    std::string symbol;
    std::string name;
    CashAction fii_cash = CashAction::NEUTRAL;
    CashAction dii_cash = CashAction::NEUTRAL;
};

struct DealSourceConfig {
    NseSourceConfig nse;
    ScrapeSourceConfig scrape;
    std::vector<FallbackStock> fallback_stocks;
    std::string symbol_suffix = ".NS";

    DealSourceConfig();
};

struct IndexSpec {
    std::string name;
    std::string ticker;
};

struct PriceConfig {
    std::string chart_url = "https://query1.finance.yahoo.com/v8/finance/chart/";
    std::string user_agent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36";
    int lookback_days = 185;
    int summary_lookback_days = 7;
    long request_timeout_seconds = 20;
    bool auto_adjust = true;
    int request_delay_ms = 400;                 // politeness throttle between symbols
    int workers = 1;                            // 1 = sequential
    std::vector<IndexSpec> indices = {{"NIFTY 50", "^NSEI"}, {"SENSEX", "^BSESN"}};
};

struct IndicatorConfig {
    size_t min_bars = 25;
    size_t sparkline_length = 7;
    size_t swing_window = 120;
};

// Pause applied to every host after a 429 / 403
struct NetworkConfig {
    int rate_limited_cooldown_ms = 2000;
    int blocked_cooldown_ms = 5000;
};

struct LoggingConfig {
    std::string level = "info";
    std::string dir = "logs";
};

struct EngineConfig {
    CalendarConfig calendar;
    ClassifierConfig classifier;
    DealSourceConfig sources;
    PriceConfig prices;
    IndicatorConfig indicators;
    NetworkConfig network;
    LoggingConfig logging;
};

} // namespace engine
} // namespace instflow
