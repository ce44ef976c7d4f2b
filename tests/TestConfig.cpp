#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>

// Simple manual test runner
int main() {
    using namespace instflow;

    // Setup logger (console only)
    spdlog::set_level(spdlog::level::debug);

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. Get Instance
    Config& config = Config::getInstance();
    config.reset();

    // 2. Built-in defaults
    auto defaults = config.getEngineConfig();
    assert(defaults.calendar.cutoff == "18:30");
    assert(defaults.calendar.utc_offset_minutes == 330);
    assert(defaults.calendar.holidays.count(2026) == 1);
    assert(!defaults.classifier.fii_keywords.empty());
    assert(!defaults.classifier.dii_keywords.empty());
    assert(defaults.sources.fallback_stocks.size() == 20);
    assert(defaults.prices.workers == 1);
    assert(defaults.indicators.min_bars == 25);
    assert(config.getLogLevel() == "info");

    // 3. Shipped config.json (copied next to the test binary by the build)
    std::string config_path = "config/config.json";
    if (std::filesystem::exists(config_path)) {
        std::cout << "[TEST] Found config.json, loading..." << std::endl;
        config.load(config_path);
        auto loaded = config.getEngineConfig();
        std::cout << "FII keywords: " << loaded.classifier.fii_keywords.size() << std::endl;
        std::cout << "DII keywords: " << loaded.classifier.dii_keywords.size() << std::endl;
        assert(loaded.classifier.fii_keywords.size() == defaults.classifier.fii_keywords.size());
        assert(loaded.sources.fallback_stocks.size() == defaults.sources.fallback_stocks.size());
        assert(loaded.calendar.holidays.at(2026).count("2026-01-26") == 1);
        config.reset();
    } else {
        std::cout << "[TEST] config.json not found, skipping file check" << std::endl;
    }

    // 4. Overrides from a parsed document
    config.apply(nlohmann::json::parse(R"({
        "calendar": {"cutoff": "17:45", "window_trading_days_back": 3,
                     "holidays": {"2027": ["2027-01-26", "not-a-date"]}},
        "classifier": {"fii_keywords": ["foreign"], "dii_keywords": [" mf "], "sort_by_trade_date": true},
        "sources": {"symbol_suffix": ".BO",
                    "nse": {"enabled": false, "max_attempts": 5, "categories": ["bulk_deals"]},
                    "scrape": {"max_stocks": 7},
                    "fallback_stocks": [{"symbol": " itc ", "name": "ITC", "fii_cash": "BUY", "dii_cash": "sell"},
                                        {"symbol": "", "name": "dropped"}]},
        "prices": {"workers": 4, "auto_adjust": false,
                   "indices": [{"name": "NIFTY BANK", "ticker": "^NSEBANK"}]},
        "indicators": {"min_bars": 30},
        "network": {"rate_limited_cooldown_ms": 750, "blocked_cooldown_ms": 9000},
        "logging": {"level": "debug"}
    })"));

    auto cfg = config.getEngineConfig();
    assert(cfg.calendar.cutoff == "17:45");
    assert(cfg.calendar.window_trading_days_back == 3);
    assert(cfg.calendar.holidays.size() == 1);
    assert(cfg.calendar.holidays.at(2027).size() == 1);
    assert(cfg.classifier.fii_keywords.size() == 1 && cfg.classifier.fii_keywords[0] == "FOREIGN");
    assert(cfg.classifier.dii_keywords[0] == " MF ");
    assert(cfg.classifier.sort_by_trade_date);
    assert(cfg.sources.symbol_suffix == ".BO");
    assert(!cfg.sources.nse.enabled);
    assert(cfg.sources.nse.max_attempts == 5);
    assert(cfg.sources.nse.categories.size() == 1);
    assert(cfg.sources.scrape.enabled);
    assert(cfg.sources.scrape.max_stocks == 7);
    assert(cfg.sources.fallback_stocks.size() == 1);
    assert(cfg.sources.fallback_stocks[0].symbol == "ITC");
    assert(cfg.sources.fallback_stocks[0].fii_cash == CashAction::BUY);
    assert(cfg.sources.fallback_stocks[0].dii_cash == CashAction::SELL);
    assert(cfg.prices.workers == 4);
    assert(!cfg.prices.auto_adjust);
    assert(cfg.prices.indices.size() == 1 && cfg.prices.indices[0].ticker == "^NSEBANK");
    assert(cfg.indicators.min_bars == 30);
    assert(cfg.network.rate_limited_cooldown_ms == 750);
    assert(cfg.network.blocked_cooldown_ms == 9000);
    assert(config.getLogLevel() == "debug");

    // 5. Invalid values keep the previous setting
    config.apply(nlohmann::json::parse(R"({
        "calendar": {"cutoff": "evening"},
        "sources": {"fallback_stocks": []}
    })"));
    assert(config.getCalendarConfig().cutoff == "17:45");
    assert(config.getDealSourceConfig().fallback_stocks.size() == 1);

    config.apply(nlohmann::json::parse(R"({
        "indicators": {"min_bars": 0, "swing_window": 0, "sparkline_length": -2},
        "network": {"rate_limited_cooldown_ms": -1}
    })"));
    assert(config.getIndicatorConfig().min_bars == 30);
    assert(config.getIndicatorConfig().swing_window == 120);
    assert(config.getIndicatorConfig().sparkline_length == 7);
    assert(config.getEngineConfig().network.rate_limited_cooldown_ms == 750);

    // 6. Environment overrides win over the file
    config.reset();
    setenv("INSTFLOW_PRICE_WORKERS", "3", 1);
    setenv("INSTFLOW_LOG_LEVEL", "WARN", 1);
    config.load("no/such/config.json");
    assert(config.getPriceConfig().workers == 3);
    assert(config.getLogLevel() == "warn");

    setenv("INSTFLOW_PRICE_WORKERS", "0", 1);
    config.load("no/such/config.json");
    assert(config.getPriceConfig().workers == 1);

    setenv("INSTFLOW_PRICE_WORKERS", "many", 1);
    config.load("no/such/config.json");
    assert(config.getPriceConfig().workers == 1);

    unsetenv("INSTFLOW_PRICE_WORKERS");
    unsetenv("INSTFLOW_LOG_LEVEL");

    // 7. Reset restores defaults
    config.reset();
    assert(config.getCalendarConfig().cutoff == "18:30");
    assert(config.getDealSourceConfig().symbol_suffix == ".NS");

    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
