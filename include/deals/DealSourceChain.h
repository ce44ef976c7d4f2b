#pragma once

#include "deals/IDealSource.h"
#include "deals/StaticDealSource.h"

#include <memory>
#include <vector>

namespace instflow {
namespace deals {

// Providers in priority order; the first non-empty batch wins and the
// static list answers when every provider comes back empty.
class DealSourceChain {
public:
    DealSourceChain(std::vector<std::shared_ptr<IDealSource>> sources, std::shared_ptr<StaticDealSource> fallback);

    // Never returns an empty deal list
    DealBatch fetchDeals();

    size_t size() const { return sources_.size(); }

private:
    std::vector<std::shared_ptr<IDealSource>> sources_;
    std::shared_ptr<StaticDealSource> fallback_;
};

} // namespace deals
} // namespace instflow
