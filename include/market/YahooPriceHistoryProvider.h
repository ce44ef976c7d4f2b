#pragma once

#include "market/IPriceHistoryProvider.h"
#include "engine/EngineConfig.h"
#include "network/IHttpClient.h"

#include <memory>
#include <nlohmann/json.hpp>

namespace instflow {
namespace market {

// Yahoo Finance v8 chart endpoint
class YahooPriceHistoryProvider : public IPriceHistoryProvider {
public:
    YahooPriceHistoryProvider(std::shared_ptr<network::IHttpClient> http_client, const engine::PriceConfig& config);

    std::vector<PriceBar> fetchBars(const std::string& ticker, long long start_epoch, long long end_epoch) override;
    MarketSummary fetchMarketSummary() override;

    // chart.result[0] flattened to bars. Nulls become NaN. With auto_adjust
    // and adjclose present, OHLC are scaled by adjclose/close.
    static std::vector<PriceBar> parseChart(const nlohmann::json& payload, bool auto_adjust);

    std::string buildChartUrl(const std::string& ticker, long long start_epoch, long long end_epoch) const;

private:
    std::shared_ptr<network::IHttpClient> http_client_;
    engine::PriceConfig config_;

    IndexQuote fetchQuote(const engine::IndexSpec& index, long long now_epoch);
};

} // namespace market
} // namespace instflow
