#include "deals/DealSourceChain.h"
#include "common/Logger.h"

namespace instflow {
namespace deals {

DealSourceChain::DealSourceChain(
    std::vector<std::shared_ptr<IDealSource>> sources,
    std::shared_ptr<StaticDealSource> fallback
)
    : sources_(std::move(sources))
    , fallback_(fallback ? std::move(fallback)
                         : std::make_shared<StaticDealSource>(std::vector<engine::FallbackStock>{}))
{
}

DealBatch DealSourceChain::fetchDeals() {
    for (const auto& source : sources_) {
        if (!source) continue;
        try {
            auto batch = source->fetch();
            if (batch && !batch->deals.empty()) {
                if (batch->source_label.empty()) {
                    batch->source_label = source->name();
                }
                LOG_INFO("Deal source: {} ({} deals)", batch->source_label, batch->deals.size());
                return *batch;
            }
            LOG_WARN("{} returned nothing, trying next source", source->name());
        } catch (const std::exception& e) {
            LOG_WARN("{} failed: {}", source->name(), e.what());
        }
    }

    auto fallback = fallback_->fetch();
    DealBatch batch = fallback ? *fallback : fallback_->batch();
    LOG_WARN("All deal sources exhausted, using {} ({} deals)", batch.source_label, batch.deals.size());
    return batch;
}

} // namespace deals
} // namespace instflow
