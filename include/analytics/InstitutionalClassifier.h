#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <string>
#include <vector>

namespace instflow {
namespace analytics {

// Folds deal records into per-symbol FII/DII cash actions
class InstitutionalClassifier {
public:
    InstitutionalClassifier(const engine::ClassifierConfig& config, const std::string& symbol_suffix = ".NS");

    // Case-insensitive substring match against the keyword tables
    bool isFii(const std::string& client) const;
    bool isDii(const std::string& client) const;

    // One entry per symbol in order of first appearance. Later deals
    // overwrite earlier ones slot by slot; unmatched deals keep the symbol
    // with untouched (neutral) slots.
    std::vector<InstitutionalStock> classify(const std::vector<DealRecord>& deals) const;

    // Sort key for provider trade dates (ISO, DD-MM-YYYY, DD-MMM-YYYY);
    // unknown formats sort last
    static long long tradeDateKey(const std::string& trade_date);

private:
    std::vector<std::string> fii_keywords_;
    std::vector<std::string> dii_keywords_;
    std::string symbol_suffix_;
    bool sort_by_trade_date_;

    static bool matchesAny(const std::string& upper_client, const std::vector<std::string>& keywords);
};

} // namespace analytics
} // namespace instflow
