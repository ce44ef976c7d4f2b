#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <vector>

namespace instflow {
namespace analytics {

// Daily bars -> rounded, scored TechnicalSnapshot
class IndicatorEngine {
public:
    explicit IndicatorEngine(const engine::IndicatorConfig& config = engine::IndicatorConfig());

    // Bars with non-finite OHLCV are dropped first. Fewer than min_bars
    // usable bars, or any exposed value not computable, gives the neutral
    // snapshot. Never throws.
    TechnicalSnapshot compute(const std::vector<PriceBar>& bars) const;

    static TechnicalSnapshot neutralSnapshot();

    static double roundTo(double value, int decimals);

private:
    engine::IndicatorConfig config_;
};

} // namespace analytics
} // namespace instflow
