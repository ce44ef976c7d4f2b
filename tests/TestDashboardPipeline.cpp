#include "engine/DashboardPipeline.h"
#include "engine/DatasetJson.h"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace instflow;

namespace {
class ListSource : public deals::IDealSource {
public:
    std::string name() const override { return "Test Deals"; }

    std::optional<deals::DealBatch> fetch() override {
        deals::DealBatch batch;
        batch.source_label = "Test Deals";
        batch.deals = {
            deal("RELIANCE", "HDFC MUTUAL FUND", "BUY"),
            deal("RELIANCE", "MORGAN STANLEY ASIA", "BUY"),
            deal("TCS", "GOLDMAN SACHS SINGAPORE", "SELL"),
            deal("INFY", "SBI MUTUAL FUND", "SELL"),
            deal("INFY", "NOMURA SINGAPORE", "SELL"),
            deal("WIPRO", "RAJESH KUMAR SHAH", "BUY"),
        };
        return batch;
    }

private:
    static DealRecord deal(const std::string& symbol, const std::string& client, const std::string& side) {
        DealRecord d;
        d.symbol = symbol;
        d.company = symbol + " Ltd";
        d.client = client;
        d.buy_sell = side;
        return d;
    }
};

class StubPrices : public market::IPriceHistoryProvider {
public:
    std::vector<PriceBar> fetchBars(const std::string& ticker, long long start_epoch, long long end_epoch) override {
        ++calls;
        assert(start_epoch < end_epoch);
        if (ticker == "TCS.NS") {
            throw std::runtime_error("HTTP 404");
        }
        const int count = ticker == "INFY.NS" ? 10 : 30;
        std::vector<PriceBar> bars;
        for (int i = 0; i < count; ++i) {
            const double close = 100.0 + i * 30.0 / 29.0;
            bars.emplace_back(start_epoch + i * 86400LL, close, close + 1.0, close - 1.0, close, 1000.0);
        }
        return bars;
    }

    MarketSummary fetchMarketSummary() override {
        MarketSummary summary;
        summary.indices.push_back({"NIFTY 50", "^NSEI", 22000.5, 0.42});
        return summary;
    }

    std::atomic<int> calls{0};
};

DashboardDataset runPipeline(int workers, std::shared_ptr<StubPrices> prices) {
    engine::EngineConfig config;
    config.prices.workers = workers;
    auto chain = std::make_shared<deals::DealSourceChain>(
        std::vector<std::shared_ptr<deals::IDealSource>>{std::make_shared<ListSource>()}, nullptr);
    engine::DashboardPipeline pipeline(config, chain, prices, "10-02-2026 → 17-02-2026");
    return pipeline.build();
}

void checkDataset(const DashboardDataset& dataset) {
    assert(dataset.source_label == "Test Deals");
    assert(dataset.window_label == "10-02-2026 → 17-02-2026");
    assert(dataset.generated_at.size() == 16);
    assert(dataset.market.indices.size() == 1);

    assert(dataset.stocks.size() == 4);
    assert(dataset.stocks[0].stock.symbol == "RELIANCE");
    assert(dataset.stocks[1].stock.symbol == "TCS");
    assert(dataset.stocks[2].stock.symbol == "INFY");
    assert(dataset.stocks[3].stock.symbol == "WIPRO");

    const auto& reliance = dataset.stocks[0];
    assert(reliance.stock.ticker == "RELIANCE.NS");
    assert(reliance.flow.signal == FlowSignal::BOTH_BUY);
    assert(reliance.technicals.data_ok);
    assert(reliance.technicals.bar_count == 30);
    assert(reliance.technicals.overall == OverallSignal::BUY);

    const auto& tcs = dataset.stocks[1];
    assert(tcs.flow.signal == FlowSignal::SELL);
    assert(!tcs.technicals.data_ok);
    assert(tcs.technicals.overall == OverallSignal::NA);

    const auto& infy = dataset.stocks[2];
    assert(infy.flow.signal == FlowSignal::BOTH_SELL);
    assert(!infy.technicals.data_ok);
    assert(infy.technicals.rsi == 50.0);

    assert(dataset.stocks[3].flow.signal == FlowSignal::BULK_BLOCK);
}
}

int main() {
    std::cout << "[TEST] Starting DashboardPipeline Test..." << std::endl;

    // 1. Sequential
    {
        auto prices = std::make_shared<StubPrices>();
        auto dataset = runPipeline(1, prices);
        checkDataset(dataset);
        assert(prices->calls == 4);
    }

    // 2. Worker pool keeps input order
    {
        auto prices = std::make_shared<StubPrices>();
        auto dataset = runPipeline(3, prices);
        checkDataset(dataset);
        assert(prices->calls == 4);
    }

    // 3. Output document
    {
        auto dataset = runPipeline(2, std::make_shared<StubPrices>());
        nlohmann::json j = dataset;
        assert(j["source"] == "Test Deals");
        assert(j["date_range"] == "10-02-2026 → 17-02-2026");
        assert(j.contains("generated_at"));
        assert(j["market"]["indices"].size() == 1);
        assert(j["market"]["indices"][0]["ticker"] == "^NSEI");
        assert(j["market"]["indices"][0]["change_pct"] == 0.42);
        assert(j["stocks"].size() == 4);

        const auto& first = j["stocks"][0];
        assert(first["symbol"] == "RELIANCE");
        assert(first["ticker"] == "RELIANCE.NS");
        assert(first["name"] == "RELIANCE Ltd");
        assert(first["fii_cash"] == "buy");
        assert(first["dii_cash"] == "buy");
        assert(first["inst_signal"]["signal"] == "BOTH BUY");
        assert(first["inst_signal"]["both_buy"] == true);

        const auto& tech = first["technicals"];
        for (const char* key : {"rsi", "macd", "macd_hist", "ema_cross", "bb_label", "adx", "stoch_rsi",
                                "resist1", "support1", "resist2", "support2", "swing_high", "swing_low",
                                "last_price", "score", "overall", "sparkline", "bar_count", "data_ok"}) {
            assert(tech.contains(key));
        }
        assert(tech["overall"] == "BUY");
        assert(tech["ema_cross"] == "bullish");
        assert(tech["sparkline"].size() == 7);

        const auto& failed = j["stocks"][1]["technicals"];
        assert(failed["data_ok"] == false);
        assert(failed["overall"] == "N/A");
        assert(failed["bb_label"] == "N/A");
        assert(failed["sparkline"].empty());
    }

    std::cout << "[TEST] DashboardPipeline Test PASSED!" << std::endl;
    return 0;
}
