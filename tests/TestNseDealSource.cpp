#include "deals/NseDealSource.h"
#include "FakeHttpClient.h"

#include <cassert>
#include <iostream>
#include <memory>

using namespace instflow;
using namespace instflow::deals;
using instflow::testing::FakeHttpClient;

namespace {
const char* kBulkBody = R"({"data":[
    {"BD_SYMBOL":"RELIANCE","BD_SCRIP_NAME":"Reliance Industries","BD_CLIENT_NAME":"HDFC MUTUAL FUND","BD_BUY_SELL":"BUY","BD_QTY_TRD":100,"BD_TP_WATP":2450},
    {"BD_SYMBOL":"TCS","BD_SCRIP_NAME":"TCS Ltd","BD_CLIENT_NAME":"MORGAN STANLEY ASIA","BD_BUY_SELL":"SELL","BD_QTY_TRD":50,"BD_TP_WATP":3900}
]})";

const char* kBlockBody = R"({"data":[
    {"BD_SYMBOL":"INFY","BD_SCRIP_NAME":"Infosys","BD_CLIENT_NAME":"SBI MUTUAL FUND","BD_BUY_SELL":"BUY","BD_QTY_TRD":10,"BD_TP_WATP":1500}
]})";

engine::NseSourceConfig fastConfig() {
    engine::NseSourceConfig config;
    config.warmup_pause_ms = 0;
    config.backoff_ms = 0;
    config.status_backoff_ms = 0;
    config.category_delay_ms = 0;
    return config;
}

calendar::TradingWindow sampleWindow() {
    calendar::TradingWindow window;
    window.from = Date(2026, 2, 10);
    window.to = Date(2026, 2, 17);
    window.trading_days = 6;
    window.label = "10-02-2026 → 17-02-2026";
    return window;
}

NseDealSource::WindowProvider fixedWindow() {
    return []() -> std::optional<calendar::TradingWindow> { return sampleWindow(); };
}

// API rules are registered before the landing pages: the home URL is a
// prefix of every other NSE URL and the first matching rule wins.
void scriptLandingPages(FakeHttpClient& http) {
    http.respond("market-data/bulk-block-short-selling-deals", 200, "<html>deals</html>", "text/html");
    http.respond("https://www.nseindia.com/", 200, "<html>home</html>", "text/html");
}
}

int main() {
    std::cout << "[TEST] Starting NseDealSource Test..." << std::endl;

    const auto config = fastConfig();

    // 1. Warm-up, bot block retry, both categories merged
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->respond("optionType=bulk_deals", 200, kBulkBody, "application/json");
        http->respond("optionType=block_deals", 200, "  <html>Access Denied</html>", "text/html");
        http->respond("optionType=block_deals", 200, kBlockBody, "application/json");
        scriptLandingPages(*http);
        http->cookies = {"nsit", "nseappid"};

        NseDealSource source(http, config, fixedWindow());
        assert(source.name() == "NSE Bulk Deals API");

        auto batch = source.fetch();
        assert(batch.has_value());
        assert(batch->source_label == "NSE Bulk Deals API");
        assert(batch->deals.size() == 3);
        assert(batch->deals[0].symbol == "RELIANCE");
        assert(batch->deals[0].category == DealCategory::BULK);
        assert(batch->deals[2].symbol == "INFY");
        assert(batch->deals[2].category == DealCategory::BLOCK);

        assert(http->calls.size() == 5);
        assert(http->calls[0].url == config.home_url);
        assert(http->calls[0].timeout_seconds == config.warmup_timeout_seconds);
        assert(http->calls[1].url == config.landing_url);
        assert(http->calls[2].url.find("optionType=bulk_deals") != std::string::npos);
        assert(http->calls[2].url.find("from=10-02-2026&to=17-02-2026") != std::string::npos);
        assert(http->calls[2].timeout_seconds == config.request_timeout_seconds);
        assert(http->calls[2].headers.at("Referer") == config.home_url);
        assert(http->calls[2].headers.at("User-Agent") == config.user_agent);
        assert(http->callsMatching("optionType=block_deals") == 2);

        assert(source.lastWindow().has_value());
        assert(source.lastWindow()->to == Date(2026, 2, 17));
    }

    // 2. Category URL layout
    {
        auto http = std::make_shared<FakeHttpClient>();
        NseDealSource source(http, config, fixedWindow());
        const std::string url = source.buildCategoryUrl("block_deals", sampleWindow());
        assert(url == config.api_url + "?optionType=block_deals&from=10-02-2026&to=17-02-2026");
    }

    // 3. No window: nothing is requested
    {
        auto http = std::make_shared<FakeHttpClient>();
        NseDealSource source(http, config, []() -> std::optional<calendar::TradingWindow> {
            return std::nullopt;
        });
        assert(!source.fetch().has_value());
        assert(http->calls.empty());
        assert(!source.lastWindow().has_value());
    }

    // 4. Persistent HTTP errors exhaust the attempts of every category
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->respond("optionType=", 503, "Service Unavailable");
        scriptLandingPages(*http);

        NseDealSource source(http, config, fixedWindow());
        assert(!source.fetch().has_value());
        assert(http->callsMatching("optionType=bulk_deals") == static_cast<size_t>(config.max_attempts));
        assert(http->callsMatching("optionType=block_deals") == static_cast<size_t>(config.max_attempts));
    }

    // 5. Tables without a client column abandon the source
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->respond("optionType=", 200, R"([{"BD_SYMBOL":"RELIANCE","BD_QTY_TRD":10}])", "application/json");
        scriptLandingPages(*http);

        NseDealSource source(http, config, fixedWindow());
        assert(!source.fetch().has_value());
        assert(http->callsMatching("optionType=") == 2);
    }

    // 6. Transport error and empty body are retried
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->fail("optionType=bulk_deals", "Connection reset by peer");
        http->respond("optionType=bulk_deals", 200, "");
        http->respond("optionType=bulk_deals", 200, kBulkBody, "application/json");
        http->respond("optionType=block_deals", 200, R"({"data":[]})", "application/json");
        scriptLandingPages(*http);

        NseDealSource source(http, config, fixedWindow());
        auto batch = source.fetch();
        assert(batch.has_value());
        assert(batch->deals.size() == 2);
        assert(http->callsMatching("optionType=bulk_deals") == 3);
        assert(http->callsMatching("optionType=block_deals") == 1);
    }

    // 7. Valid but empty payloads fall through
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->respond("optionType=", 200, R"({"data":[]})", "application/json");
        scriptLandingPages(*http);

        NseDealSource source(http, config, fixedWindow());
        assert(!source.fetch().has_value());
    }

    // 8. Warm-up failures do not stop the data requests
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->respond("optionType=bulk_deals", 200, kBulkBody, "application/json");
        http->respond("optionType=block_deals", 200, kBlockBody, "application/json");
        http->fail("https://www.nseindia.com/", "Could not resolve host");

        NseDealSource source(http, config, fixedWindow());
        auto batch = source.fetch();
        assert(batch && batch->deals.size() == 3);
    }

    std::cout << "[TEST] NseDealSource Test PASSED!" << std::endl;
    return 0;
}
