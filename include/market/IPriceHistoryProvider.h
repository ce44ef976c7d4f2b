#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace instflow {
namespace market {

class IPriceHistoryProvider {
public:
    virtual ~IPriceHistoryProvider() = default;

    // Daily bars in [start, end] (epoch seconds), oldest first.
    // Throws std::runtime_error when the provider cannot answer.
    virtual std::vector<PriceBar> fetchBars(const std::string& ticker, long long start_epoch, long long end_epoch) = 0;

    // Benchmark quotes; failed indices report zeros
    virtual MarketSummary fetchMarketSummary() = 0;
};

} // namespace market
} // namespace instflow
