#include "market/YahooPriceHistoryProvider.h"
#include "analytics/IndicatorEngine.h"
#include "common/Logger.h"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <stdexcept>

namespace instflow {
namespace market {

namespace {
constexpr long long kSecondsPerDay = 86400;

double numberAt(const nlohmann::json& arr, size_t i) {
    if (!arr.is_array() || i >= arr.size() || !arr[i].is_number()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return arr[i].get<double>();
}

const nlohmann::json& fieldOf(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json kNull;
    if (!obj.is_object()) return kNull;
    auto it = obj.find(key);
    return it == obj.end() ? kNull : *it;
}

// Symbols such as ^NSEI need escaping in the path
std::string encodeTicker(const std::string& ticker) {
    std::string out;
    for (unsigned char c : ticker) {
        if (std::isalnum(c) || c == '.' || c == '-' || c == '_' || c == '=') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

long long nowEpoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
}

YahooPriceHistoryProvider::YahooPriceHistoryProvider(
    std::shared_ptr<network::IHttpClient> http_client,
    const engine::PriceConfig& config
)
    : http_client_(std::move(http_client))
    , config_(config)
{
}

std::string YahooPriceHistoryProvider::buildChartUrl(
    const std::string& ticker,
    long long start_epoch,
    long long end_epoch
) const {
    return config_.chart_url + encodeTicker(ticker) + "?" + network::buildQueryString({
        {"period1", std::to_string(start_epoch)},
        {"period2", std::to_string(end_epoch)},
        {"interval", "1d"},
        {"events", "history"},
    });
}

std::vector<PriceBar> YahooPriceHistoryProvider::fetchBars(
    const std::string& ticker,
    long long start_epoch,
    long long end_epoch
) {
    const std::map<std::string, std::string> headers = {
        {"User-Agent", config_.user_agent},
        {"Accept", "application/json"},
    };
    auto response = http_client_->get(buildChartUrl(ticker, start_epoch, end_epoch), headers,
                                      config_.request_timeout_seconds);
    if (!response.isSuccess()) {
        throw std::runtime_error("chart " + ticker + " HTTP " + std::to_string(response.status_code));
    }
    return parseChart(response.json(), config_.auto_adjust);
}

std::vector<PriceBar> YahooPriceHistoryProvider::parseChart(const nlohmann::json& payload, bool auto_adjust) {
    const auto& chart = fieldOf(payload, "chart");
    const auto& error = fieldOf(chart, "error");
    if (!error.is_null()) {
        throw std::runtime_error("chart error: " + error.dump());
    }

    const auto& results = fieldOf(chart, "result");
    if (!results.is_array() || results.empty()) {
        throw std::runtime_error("chart has no result");
    }
    const auto& result = results[0];

    const auto& timestamps = fieldOf(result, "timestamp");
    std::vector<PriceBar> bars;
    if (!timestamps.is_array()) {
        return bars;
    }

    const auto& indicators = fieldOf(result, "indicators");
    const auto& quotes = fieldOf(indicators, "quote");
    if (!quotes.is_array() || quotes.empty()) {
        throw std::runtime_error("chart has no quote block");
    }
    const auto& quote = quotes[0];
    const auto& opens = fieldOf(quote, "open");
    const auto& highs = fieldOf(quote, "high");
    const auto& lows = fieldOf(quote, "low");
    const auto& closes = fieldOf(quote, "close");
    const auto& volumes = fieldOf(quote, "volume");

    const nlohmann::json* adjcloses = nullptr;
    const auto& adj_block = fieldOf(indicators, "adjclose");
    if (auto_adjust && adj_block.is_array() && !adj_block.empty()) {
        const auto& values = fieldOf(adj_block[0], "adjclose");
        if (values.is_array()) adjcloses = &values;
    }

    bars.reserve(timestamps.size());
    for (size_t i = 0; i < timestamps.size(); ++i) {
        PriceBar bar;
        bar.timestamp = timestamps[i].is_number() ? timestamps[i].get<long long>() : 0;
        bar.open = numberAt(opens, i);
        bar.high = numberAt(highs, i);
        bar.low = numberAt(lows, i);
        bar.close = numberAt(closes, i);
        bar.volume = numberAt(volumes, i);

        if (adjcloses) {
            const double adj = numberAt(*adjcloses, i);
            const double ratio = adj / bar.close;
            bar.open *= ratio;
            bar.high *= ratio;
            bar.low *= ratio;
            bar.close = adj;
        }
        bars.push_back(bar);
    }
    return bars;
}

MarketSummary YahooPriceHistoryProvider::fetchMarketSummary() {
    LOG_INFO("Fetching benchmark indices");
    MarketSummary summary;
    const long long now = nowEpoch();
    for (const auto& index : config_.indices) {
        summary.indices.push_back(fetchQuote(index, now));
    }
    return summary;
}

IndexQuote YahooPriceHistoryProvider::fetchQuote(const engine::IndexSpec& index, long long now_epoch) {
    IndexQuote quote;
    quote.name = index.name;
    quote.ticker = index.ticker;
    try {
        const long long start = now_epoch - config_.summary_lookback_days * kSecondsPerDay;
        auto bars = fetchBars(index.ticker, start, now_epoch);

        std::vector<double> closes;
        for (const auto& bar : bars) {
            if (std::isfinite(bar.close)) closes.push_back(bar.close);
        }
        if (closes.empty()) {
            throw std::runtime_error("no closes");
        }

        const double last = closes.back();
        quote.price = analytics::IndicatorEngine::roundTo(last, 2);
        if (closes.size() >= 2 && closes[closes.size() - 2] != 0.0) {
            const double prev = closes[closes.size() - 2];
            quote.change_pct = analytics::IndicatorEngine::roundTo((last - prev) / prev * 100.0, 2);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Market summary {} failed: {}", index.ticker, e.what());
        quote.price = 0.0;
        quote.change_pct = 0.0;
    }
    return quote;
}

} // namespace market
} // namespace instflow
