#include "deals/StaticDealSource.h"
#include "common/Logger.h"

namespace instflow {
namespace deals {

namespace {
DealRecord declared(const engine::FallbackStock& stock, InvestorClass cls, CashAction action) {
    DealRecord deal;
    deal.symbol = stock.symbol;
    deal.company = stock.name.empty() ? stock.symbol : stock.name;
    deal.client = toString(cls);
    // NEUTRAL leaves the slot untouched; see InstitutionalClassifier
    deal.buy_sell = action == CashAction::BUY ? "BUY" : (action == CashAction::SELL ? "SELL" : "");
    deal.category = DealCategory::BULK;
    deal.declared_class = cls;
    return deal;
}
}

StaticDealSource::StaticDealSource(std::vector<engine::FallbackStock> stocks)
    : stocks_(std::move(stocks))
{
    if (stocks_.empty()) {
        stocks_ = engine::DealSourceConfig().fallback_stocks;
    }
}

std::optional<DealBatch> StaticDealSource::fetch() {
    LOG_WARN("[Source 3] Hardcoded fallback stocks");
    return batch();
}

DealBatch StaticDealSource::batch() const {
    DealBatch out;
    out.source_label = kLabel;
    out.deals.reserve(stocks_.size() * 2);
    for (const auto& stock : stocks_) {
        out.deals.push_back(declared(stock, InvestorClass::FII, stock.fii_cash));
        out.deals.push_back(declared(stock, InvestorClass::DII, stock.dii_cash));
    }
    return out;
}

} // namespace deals
} // namespace instflow
