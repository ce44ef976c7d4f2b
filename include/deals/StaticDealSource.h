#pragma once

#include "deals/IDealSource.h"
#include "engine/EngineConfig.h"

namespace instflow {
namespace deals {

// Last resort: hand-maintained list of institutionally active stocks
class StaticDealSource : public IDealSource {
public:
    static constexpr const char* kLabel = "Fallback (Known Institutional Stocks)";

    explicit StaticDealSource(std::vector<engine::FallbackStock> stocks);

    std::string name() const override { return kLabel; }

    // Never empty: one FII and one DII record per configured stock
    std::optional<DealBatch> fetch() override;

    DealBatch batch() const;

private:
    std::vector<engine::FallbackStock> stocks_;
};

} // namespace deals
} // namespace instflow
