#include "deals/ScrapeDealSource.h"
#include "FakeHttpClient.h"

#include <cassert>
#include <iostream>
#include <memory>

using namespace instflow;
using namespace instflow::deals;
using instflow::testing::FakeHttpClient;

namespace {
const char* kPage = R"(<html><body>
<h1>FII DII activity</h1>
<p><a href="/nse/stock/ORPHAN">Not in a table</a></p>
<table>
  <tr><th>Stock</th><th>Action</th></tr>
  <tr><td><a href="/nse/stock/reliance">Reliance  Industries</a></td><td>FIIs <b>Bought</b> 2 lakh shares</td></tr>
  <tr><td><a href="https://munafasutra.com/nse/stock/TCS/">Tata Consultancy</a></td><td>Sold 1 lakh shares</td></tr>
  <tr><td><a href="/nse/stock/EMPTY"></a></td><td>bought</td></tr>
  <tr><td><a href="/nse/news/INFY">Infosys news</a></td><td>bought</td></tr>
  <tr><td><a href="/nse/stock/SBIN?ref=fii">State Bank</a></td><td>bought</td></tr>
</table>
</body></html>)";
}

int main() {
    std::cout << "[TEST] Starting ScrapeDealSource Test..." << std::endl;

    engine::ScrapeSourceConfig config;

    // 1. Table rows become records declared for both investor classes
    {
        auto deals = ScrapeDealSource::parseHtml(kPage, config);
        assert(deals.size() == 3);

        assert(deals[0].symbol == "RELIANCE");
        assert(deals[0].company == "Reliance Industries");
        assert(deals[0].buy_sell == "BUY");
        assert(deals[0].declared_class == InvestorClass::BOTH);
        assert(deals[0].client == "FII/DII");

        assert(deals[1].symbol == "TCS");
        assert(deals[1].company == "Tata Consultancy");
        assert(deals[1].buy_sell == "SELL");
        assert(!deals[1].isBuy());

        assert(deals[2].symbol == "SBIN");
        assert(deals[2].isBuy());
    }

    // 2. Record cap
    {
        engine::ScrapeSourceConfig capped = config;
        capped.max_stocks = 2;
        auto deals = ScrapeDealSource::parseHtml(kPage, capped);
        assert(deals.size() == 2);
        assert(deals[1].symbol == "TCS");
    }

    // 3. Garbage input yields nothing
    {
        assert(ScrapeDealSource::parseHtml("", config).empty());
        assert(ScrapeDealSource::parseHtml("<p>maintenance</p>", config).empty());
    }

    // 4. fetch() outcomes
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->respond("munafasutra.com", 200, kPage, "text/html");
        ScrapeDealSource source(http, config);
        auto batch = source.fetch();
        assert(batch.has_value());
        assert(batch->source_label == "MunafaSutra");
        assert(batch->deals.size() == 3);
        assert(http->calls.size() == 1);
        assert(http->calls[0].url == config.url);
        assert(http->calls[0].timeout_seconds == config.request_timeout_seconds);
    }
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->respond("munafasutra.com", 500, kPage, "text/html");
        ScrapeDealSource source(http, config);
        assert(!source.fetch().has_value());
    }
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->respond("munafasutra.com", 200, "<html><body>nothing today</body></html>", "text/html");
        ScrapeDealSource source(http, config);
        assert(!source.fetch().has_value());
    }
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->fail("munafasutra.com", "Operation timed out");
        ScrapeDealSource source(http, config);
        assert(!source.fetch().has_value());
    }

    std::cout << "[TEST] ScrapeDealSource Test PASSED!" << std::endl;
    return 0;
}
