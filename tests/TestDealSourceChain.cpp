#include "deals/DealSourceChain.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace instflow;
using namespace instflow::deals;

namespace {
enum class Behaviour { NOTHING, EMPTY, THROW, DEALS };

class StubSource : public IDealSource {
public:
    StubSource(std::string label, Behaviour behaviour) : label_(std::move(label)), behaviour_(behaviour) {}

    std::string name() const override { return label_; }

    std::optional<DealBatch> fetch() override {
        ++calls;
        switch (behaviour_) {
            case Behaviour::NOTHING:
                return std::nullopt;
            case Behaviour::EMPTY:
                return DealBatch{{}, label_};
            case Behaviour::THROW:
                throw std::runtime_error("boom");
            case Behaviour::DEALS:
                break;
        }
        DealRecord deal;
        deal.symbol = "RELIANCE";
        deal.client = "HDFC MUTUAL FUND";
        deal.buy_sell = "BUY";
        return DealBatch{{deal}, label_};
    }

    int calls = 0;

private:
    std::string label_;
    Behaviour behaviour_;
};

std::shared_ptr<StaticDealSource> smallFallback() {
    return std::make_shared<StaticDealSource>(std::vector<engine::FallbackStock>{
        {"POWERGRID", "Power Grid Corp", CashAction::BUY, CashAction::BUY},
        {"BSE", "BSE Limited", CashAction::SELL, CashAction::NEUTRAL},
    });
}
}

int main() {
    std::cout << "[TEST] Starting DealSourceChain Test..." << std::endl;

    // 1. First non-empty batch wins, later providers untouched
    {
        auto a = std::make_shared<StubSource>("A", Behaviour::NOTHING);
        auto b = std::make_shared<StubSource>("B", Behaviour::DEALS);
        auto c = std::make_shared<StubSource>("C", Behaviour::DEALS);
        DealSourceChain chain({a, b, c}, smallFallback());
        assert(chain.size() == 3);

        auto batch = chain.fetchDeals();
        assert(batch.source_label == "B");
        assert(batch.deals.size() == 1);
        assert(a->calls == 1 && b->calls == 1 && c->calls == 0);
    }

    // 2. Empty batches and exceptions fall through
    {
        auto a = std::make_shared<StubSource>("A", Behaviour::EMPTY);
        auto b = std::make_shared<StubSource>("B", Behaviour::THROW);
        auto c = std::make_shared<StubSource>("C", Behaviour::DEALS);
        DealSourceChain chain({a, b, c}, smallFallback());
        auto batch = chain.fetchDeals();
        assert(batch.source_label == "C");
        assert(b->calls == 1);
    }

    // 3. Everything fails: static list answers
    {
        auto a = std::make_shared<StubSource>("A", Behaviour::THROW);
        auto b = std::make_shared<StubSource>("B", Behaviour::NOTHING);
        DealSourceChain chain({a, b}, smallFallback());
        auto batch = chain.fetchDeals();
        assert(batch.source_label == StaticDealSource::kLabel);
        assert(batch.deals.size() == 4);

        assert(batch.deals[0].symbol == "POWERGRID");
        assert(batch.deals[0].declared_class == InvestorClass::FII);
        assert(batch.deals[0].buy_sell == "BUY");
        assert(batch.deals[1].declared_class == InvestorClass::DII);

        assert(batch.deals[2].buy_sell == "SELL");
        assert(batch.deals[3].symbol == "BSE");
        assert(batch.deals[3].buy_sell.empty());
        assert(batch.deals[3].company == "BSE Limited");
    }

    // 4. No providers, no explicit fallback: built-in table
    {
        DealSourceChain chain({}, nullptr);
        auto batch = chain.fetchDeals();
        assert(batch.source_label == StaticDealSource::kLabel);
        assert(batch.deals.size() == 2 * engine::DealSourceConfig().fallback_stocks.size());
    }

    // 5. Empty static list still produces the built-in table
    {
        StaticDealSource source(std::vector<engine::FallbackStock>{});
        auto batch = source.fetch();
        assert(batch.has_value());
        assert(!batch->deals.empty());
    }

    std::cout << "[TEST] DealSourceChain Test PASSED!" << std::endl;
    return 0;
}
