#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/PathUtils.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace instflow {

namespace {
std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? utils::trimCopy(value) : "";
}

CashAction parseCashAction(const std::string& value) {
    const std::string v = utils::toLowerCopy(utils::trimCopy(value));
    if (v == "buy") return CashAction::BUY;
    if (v == "sell") return CashAction::SELL;
    return CashAction::NEUTRAL;
}

std::vector<std::string> upperList(const nlohmann::json& arr) {
    std::vector<std::string> out;
    for (const auto& item : arr) {
        if (!item.is_string()) continue;
        // keywords keep their padding (" MF ") on purpose, only case is folded
        std::string kw = utils::toUpperCopy(item.get<std::string>());
        if (!kw.empty()) out.push_back(kw);
    }
    return out;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    engine_config_ = engine::EngineConfig();
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path(path);
        if (!config_path.is_absolute() && !std::filesystem::exists(config_path)) {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cerr << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Warning: config file not found, using defaults" << std::endl;
            applyEnvironment();
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Warning: config file could not be opened" << std::endl;
            applyEnvironment();
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);

        std::cerr << "Config loaded: holidays=" << engine_config_.calendar.holidays.size()
                  << " years, fii_kw=" << engine_config_.classifier.fii_keywords.size()
                  << ", dii_kw=" << engine_config_.classifier.dii_keywords.size()
                  << ", fallback=" << engine_config_.sources.fallback_stocks.size() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
    applyEnvironment();
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("calendar")) {
        const auto& c = j["calendar"];
        auto& cal = engine_config_.calendar;
        cal.utc_offset_minutes = c.value("utc_offset_minutes", cal.utc_offset_minutes);
        const std::string cutoff = c.value("cutoff", cal.cutoff);
        if (utils::DateUtils::parseClock(cutoff)) {
            cal.cutoff = cutoff;
        } else {
            std::cerr << "Warning: invalid calendar.cutoff '" << cutoff << "', keeping " << cal.cutoff << std::endl;
        }
        cal.to_date_max_lookback = c.value("to_date_max_lookback", cal.to_date_max_lookback);
        cal.window_trading_days_back = c.value("window_trading_days_back", cal.window_trading_days_back);
        cal.window_max_calendar_days = c.value("window_max_calendar_days", cal.window_max_calendar_days);

        if (c.contains("holidays") && c["holidays"].is_object()) {
            cal.holidays.clear();
            for (auto it = c["holidays"].begin(); it != c["holidays"].end(); ++it) {
                const int year = std::stoi(it.key());
                auto& days = cal.holidays[year];
                for (const auto& d : it.value()) {
                    const std::string iso = d.get<std::string>();
                    if (!utils::DateUtils::parseIso(iso)) {
                        std::cerr << "Warning: skipping malformed holiday " << iso << std::endl;
                        continue;
                    }
                    days.insert(iso);
                }
            }
        }
    }

    if (j.contains("classifier")) {
        const auto& c = j["classifier"];
        auto& cls = engine_config_.classifier;
        if (c.contains("fii_keywords")) cls.fii_keywords = upperList(c["fii_keywords"]);
        if (c.contains("dii_keywords")) cls.dii_keywords = upperList(c["dii_keywords"]);
        cls.sort_by_trade_date = c.value("sort_by_trade_date", cls.sort_by_trade_date);
    }

    if (j.contains("sources")) {
        const auto& s = j["sources"];
        auto& src = engine_config_.sources;
        src.symbol_suffix = s.value("symbol_suffix", src.symbol_suffix);

        if (s.contains("nse")) {
            const auto& n = s["nse"];
            auto& nse = src.nse;
            nse.enabled = n.value("enabled", nse.enabled);
            nse.home_url = n.value("home_url", nse.home_url);
            nse.landing_url = n.value("landing_url", nse.landing_url);
            nse.api_url = n.value("api_url", nse.api_url);
            if (n.contains("categories")) {
                nse.categories = n["categories"].get<std::vector<std::string>>();
            }
            nse.user_agent = n.value("user_agent", nse.user_agent);
            nse.warmup_timeout_seconds = n.value("warmup_timeout_seconds", nse.warmup_timeout_seconds);
            nse.request_timeout_seconds = n.value("request_timeout_seconds", nse.request_timeout_seconds);
            nse.max_attempts = n.value("max_attempts", nse.max_attempts);
            nse.warmup_pause_ms = n.value("warmup_pause_ms", nse.warmup_pause_ms);
            nse.backoff_ms = n.value("backoff_ms", nse.backoff_ms);
            nse.status_backoff_ms = n.value("status_backoff_ms", nse.status_backoff_ms);
            nse.category_delay_ms = n.value("category_delay_ms", nse.category_delay_ms);
        }

        if (s.contains("scrape")) {
            const auto& m = s["scrape"];
            auto& scrape = src.scrape;
            scrape.enabled = m.value("enabled", scrape.enabled);
            scrape.url = m.value("url", scrape.url);
            scrape.link_marker = m.value("link_marker", scrape.link_marker);
            scrape.buy_keyword = m.value("buy_keyword", scrape.buy_keyword);
            scrape.user_agent = m.value("user_agent", scrape.user_agent);
            scrape.request_timeout_seconds = m.value("request_timeout_seconds", scrape.request_timeout_seconds);
            scrape.max_stocks = m.value("max_stocks", scrape.max_stocks);
        }

        if (s.contains("fallback_stocks") && s["fallback_stocks"].is_array()) {
            std::vector<engine::FallbackStock> stocks;
            for (const auto& item : s["fallback_stocks"]) {
                engine::FallbackStock fs;
                fs.symbol = utils::toUpperCopy(utils::trimCopy(item.value("symbol", "")));
                fs.name = item.value("name", fs.symbol);
                fs.fii_cash = parseCashAction(item.value("fii_cash", "neutral"));
                fs.dii_cash = parseCashAction(item.value("dii_cash", "neutral"));
                if (!fs.symbol.empty()) stocks.push_back(fs);
            }
            // an empty table would break the "never empty" guarantee
            if (!stocks.empty()) {
                src.fallback_stocks = stocks;
            } else {
                std::cerr << "Warning: sources.fallback_stocks is empty, keeping built-in table" << std::endl;
            }
        }
    }

    if (j.contains("prices")) {
        const auto& p = j["prices"];
        auto& pc = engine_config_.prices;
        pc.chart_url = p.value("chart_url", pc.chart_url);
        pc.user_agent = p.value("user_agent", pc.user_agent);
        pc.lookback_days = p.value("lookback_days", pc.lookback_days);
        pc.summary_lookback_days = p.value("summary_lookback_days", pc.summary_lookback_days);
        pc.request_timeout_seconds = p.value("request_timeout_seconds", pc.request_timeout_seconds);
        pc.auto_adjust = p.value("auto_adjust", pc.auto_adjust);
        pc.request_delay_ms = p.value("request_delay_ms", pc.request_delay_ms);
        pc.workers = p.value("workers", pc.workers);
        if (p.contains("indices") && p["indices"].is_array()) {
            pc.indices.clear();
            for (const auto& idx : p["indices"]) {
                pc.indices.push_back({idx.value("name", ""), idx.value("ticker", "")});
            }
        }
    }

    if (j.contains("indicators")) {
        const auto& i = j["indicators"];
        auto& ic = engine_config_.indicators;
        const int min_bars = i.value("min_bars", static_cast<int>(ic.min_bars));
        const int sparkline = i.value("sparkline_length", static_cast<int>(ic.sparkline_length));
        const int swing = i.value("swing_window", static_cast<int>(ic.swing_window));
        if (min_bars >= 1) {
            ic.min_bars = static_cast<size_t>(min_bars);
        } else {
            std::cerr << "Warning: indicators.min_bars must be >= 1, keeping " << ic.min_bars << std::endl;
        }
        if (sparkline >= 0) {
            ic.sparkline_length = static_cast<size_t>(sparkline);
        } else {
            std::cerr << "Warning: indicators.sparkline_length must be >= 0, keeping " << ic.sparkline_length << std::endl;
        }
        if (swing >= 1) {
            ic.swing_window = static_cast<size_t>(swing);
        } else {
            std::cerr << "Warning: indicators.swing_window must be >= 1, keeping " << ic.swing_window << std::endl;
        }
    }

    if (j.contains("network")) {
        const auto& n = j["network"];
        auto& net = engine_config_.network;
        const int rate_limited = n.value("rate_limited_cooldown_ms", net.rate_limited_cooldown_ms);
        const int blocked = n.value("blocked_cooldown_ms", net.blocked_cooldown_ms);
        if (rate_limited >= 0 && blocked >= 0) {
            net.rate_limited_cooldown_ms = rate_limited;
            net.blocked_cooldown_ms = blocked;
        } else {
            std::cerr << "Warning: negative network cool-down ignored" << std::endl;
        }
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        engine_config_.logging.level = l.value("level", engine_config_.logging.level);
        engine_config_.logging.dir = l.value("dir", engine_config_.logging.dir);
    }
}

void Config::applyEnvironment() {
    const std::string level = readEnvVar("INSTFLOW_LOG_LEVEL");
    if (!level.empty()) {
        engine_config_.logging.level = utils::toLowerCopy(level);
    }

    const std::string workers = readEnvVar("INSTFLOW_PRICE_WORKERS");
    if (!workers.empty()) {
        try {
            engine_config_.prices.workers = std::max(1, std::stoi(workers));
        } catch (const std::exception&) {
            std::cerr << "Warning: INSTFLOW_PRICE_WORKERS is not a number: " << workers << std::endl;
        }
    }
}

} // namespace instflow
