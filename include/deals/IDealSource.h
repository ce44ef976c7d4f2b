#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>

namespace instflow {
namespace deals {

struct DealBatch {
    std::vector<DealRecord> deals;
    std::string source_label;
};

// One provider in the deal-source chain. fetch() never throws: failures are
// logged and reported as an empty optional.
class IDealSource {
public:
    virtual ~IDealSource() = default;

    virtual std::string name() const = 0;
    virtual std::optional<DealBatch> fetch() = 0;
};

} // namespace deals
} // namespace instflow
