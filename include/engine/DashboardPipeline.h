#pragma once

#include "analytics/IndicatorEngine.h"
#include "analytics/InstitutionalClassifier.h"
#include "common/Types.h"
#include "deals/DealSourceChain.h"
#include "engine/EngineConfig.h"
#include "market/IPriceHistoryProvider.h"

#include <memory>
#include <string>

namespace instflow {
namespace engine {

// Deals -> classification -> per-security prices, indicators and signals
class DashboardPipeline {
public:
    DashboardPipeline(
        const EngineConfig& config,
        std::shared_ptr<deals::DealSourceChain> deal_chain,
        std::shared_ptr<market::IPriceHistoryProvider> price_provider,
        std::string window_label = ""
    );

    // Wires curl clients, the trading calendar and the three deal sources
    static std::unique_ptr<DashboardPipeline> createDefault(const EngineConfig& config);

    // Never throws; a security whose prices fail keeps a neutral snapshot
    DashboardDataset build();

    EnrichedStock enrich(const InstitutionalStock& stock, long long start_epoch, long long end_epoch) const;

private:
    EngineConfig config_;
    std::shared_ptr<deals::DealSourceChain> deal_chain_;
    std::shared_ptr<market::IPriceHistoryProvider> price_provider_;
    std::string window_label_;
    analytics::InstitutionalClassifier classifier_;
    analytics::IndicatorEngine indicator_engine_;

    std::vector<EnrichedStock> enrichAll(const std::vector<InstitutionalStock>& stocks) const;
};

} // namespace engine
} // namespace instflow
