#pragma once

#include "common/Types.h"
#include <nlohmann/json.hpp>

namespace instflow {

// Output contract consumed by the report renderer
void to_json(nlohmann::json& j, const InstitutionalStock& stock);
void to_json(nlohmann::json& j, const TechnicalSnapshot& snapshot);
void to_json(nlohmann::json& j, const InstitutionalFlow& flow);
void to_json(nlohmann::json& j, const EnrichedStock& enriched);
void to_json(nlohmann::json& j, const IndexQuote& quote);
void to_json(nlohmann::json& j, const MarketSummary& summary);
void to_json(nlohmann::json& j, const DashboardDataset& dataset);

} // namespace instflow
