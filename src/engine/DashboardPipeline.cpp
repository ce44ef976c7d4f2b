#include "engine/DashboardPipeline.h"
#include "analytics/SignalClassifier.h"
#include "calendar/TradingCalendar.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include "deals/NseDealSource.h"
#include "deals/ScrapeDealSource.h"
#include "deals/StaticDealSource.h"
#include "market/YahooPriceHistoryProvider.h"
#include "network/CurlHttpClient.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <thread>

namespace instflow {
namespace engine {

namespace {
constexpr long long kSecondsPerDay = 86400;

long long nowEpoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string formatLocal(const utils::LocalDateTime& t) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", t.minute_of_day / 60, t.minute_of_day % 60);
    return utils::DateUtils::formatIso(t.date) + " " + buf;
}
}

DashboardPipeline::DashboardPipeline(
    const EngineConfig& config,
    std::shared_ptr<deals::DealSourceChain> deal_chain,
    std::shared_ptr<market::IPriceHistoryProvider> price_provider,
    std::string window_label
)
    : config_(config)
    , deal_chain_(std::move(deal_chain))
    , price_provider_(std::move(price_provider))
    , window_label_(std::move(window_label))
    , classifier_(config.classifier, config.sources.symbol_suffix)
    , indicator_engine_(config.indicators)
{
}

std::unique_ptr<DashboardPipeline> DashboardPipeline::createDefault(const EngineConfig& config) {
    auto limiter = std::make_shared<network::RateLimiter>();
    limiter->setMinInterval(network::CurlHttpClient::hostOf(config.prices.chart_url),
                            std::chrono::milliseconds(config.prices.request_delay_ms));
    limiter->setCooldowns(std::chrono::milliseconds(config.network.rate_limited_cooldown_ms),
                          std::chrono::milliseconds(config.network.blocked_cooldown_ms));

    // NSE keeps its own cookie session
    auto nse_client = std::make_shared<network::CurlHttpClient>(limiter);
    auto web_client = std::make_shared<network::CurlHttpClient>(limiter);

    calendar::TradingCalendar calendar(config.calendar);
    const auto window = calendar.currentWindow(calendar.exchangeNow());

    std::vector<std::shared_ptr<deals::IDealSource>> sources;
    if (config.sources.nse.enabled) {
        sources.push_back(std::make_shared<deals::NseDealSource>(
            nse_client, config.sources.nse, [window]() { return window; }));
    }
    if (config.sources.scrape.enabled) {
        sources.push_back(std::make_shared<deals::ScrapeDealSource>(web_client, config.sources.scrape));
    }
    auto chain = std::make_shared<deals::DealSourceChain>(
        sources, std::make_shared<deals::StaticDealSource>(config.sources.fallback_stocks));

    auto prices = std::make_shared<market::YahooPriceHistoryProvider>(web_client, config.prices);

    return std::make_unique<DashboardPipeline>(config, chain, prices, window ? window->label : "");
}

DashboardDataset DashboardPipeline::build() {
    DashboardDataset dataset;
    dataset.window_label = window_label_;
    dataset.generated_at = formatLocal(utils::DateUtils::now(config_.calendar.utc_offset_minutes));

    try {
        auto batch = deal_chain_->fetchDeals();
        dataset.source_label = batch.source_label;

        const auto stocks = classifier_.classify(batch.deals);
        LOG_INFO("Source: '{}' - {} stocks", dataset.source_label, stocks.size());

        dataset.market = price_provider_->fetchMarketSummary();
        dataset.stocks = enrichAll(stocks);
    } catch (const std::exception& e) {
        LOG_ERROR("Dashboard build failed: {}", e.what());
    }
    return dataset;
}

EnrichedStock DashboardPipeline::enrich(
    const InstitutionalStock& stock,
    long long start_epoch,
    long long end_epoch
) const {
    EnrichedStock enriched;
    enriched.stock = stock;
    enriched.flow = analytics::SignalClassifier::flowSignal(stock);

    LOG_INFO("Indicators {}", stock.ticker);
    try {
        const auto bars = price_provider_->fetchBars(stock.ticker, start_epoch, end_epoch);
        enriched.technicals = indicator_engine_.compute(bars);
    } catch (const std::exception& e) {
        LOG_WARN("{}: {}", stock.ticker, e.what());
        enriched.technicals = analytics::IndicatorEngine::neutralSnapshot();
    }

    Logger::getInstance().logSignal(stock.symbol, toString(enriched.flow.signal),
                                    toString(enriched.technicals.overall),
                                    enriched.technicals.composite_score,
                                    enriched.technicals.last_price);
    return enriched;
}

std::vector<EnrichedStock> DashboardPipeline::enrichAll(const std::vector<InstitutionalStock>& stocks) const {
    const long long end = nowEpoch();
    const long long start = end - static_cast<long long>(config_.prices.lookback_days) * kSecondsPerDay;

    std::vector<EnrichedStock> out(stocks.size());
    const size_t workers = std::min(stocks.size(), static_cast<size_t>(std::max(1, config_.prices.workers)));

    if (workers <= 1) {
        for (size_t i = 0; i < stocks.size(); ++i) {
            out[i] = enrich(stocks[i], start, end);
        }
        return out;
    }

    // each slot is written by exactly one worker, so input order is kept
    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&]() {
            for (size_t i = next.fetch_add(1); i < stocks.size(); i = next.fetch_add(1)) {
                out[i] = enrich(stocks[i], start, end);
            }
        });
    }
    for (auto& t : pool) {
        t.join();
    }
    return out;
}

} // namespace engine
} // namespace instflow
