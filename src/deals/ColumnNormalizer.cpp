#include "deals/ColumnNormalizer.h"
#include "common/StringUtils.h"

#include <map>
#include <set>
#include <utility>

namespace instflow {
namespace deals {

namespace {
const std::map<std::string, std::string>& exactTable() {
    static const std::map<std::string, std::string> kExact = {
        {"BD_SYMBOL", columns::kSymbol},
        {"BD_SCRIP_NAME", columns::kCompany},
        {"BD_CLIENT_NAME", columns::kClient},
        {"BD_BUY_SELL", columns::kBuySell},
        {"BD_QTY_TRD", columns::kQty},
        {"BD_DT_DATE", columns::kDate},
        {"BD_DT_ORDER", columns::kOrderDate},
        {"BD_TP_WATP", columns::kPrice},
        {"BD_REMARKS", columns::kRemarks},
        // block deal and older report variants
        {"SCRIP_NAME", columns::kCompany},
        {"CLIENT_NAME", columns::kClient},
        {"BUY_SELL", columns::kBuySell},
        {"QTY_TRD", columns::kQty},
        {"TRADE_DATE", columns::kDate},
        {"TRADE_PRICE", columns::kPrice},
        // CSV download headers
        {"SECURITY NAME", columns::kCompany},
        {"BUY/SELL", columns::kBuySell},
        {"QUANTITY TRADED", columns::kQty},
        // canonical names map to themselves
        {columns::kSymbol, columns::kSymbol},
        {columns::kCompany, columns::kCompany},
        {columns::kClient, columns::kClient},
        {columns::kBuySell, columns::kBuySell},
        {columns::kQty, columns::kQty},
        {columns::kDate, columns::kDate},
        {columns::kOrderDate, columns::kOrderDate},
        {columns::kPrice, columns::kPrice},
        {columns::kRemarks, columns::kRemarks},
    };
    return kExact;
}

// Substring rules, first applicable wins. CLIENT comes before anything that
// could also match "NAME".
const std::vector<std::pair<std::string, std::string>>& fuzzyRules() {
    static const std::vector<std::pair<std::string, std::string>> kRules = {
        {"CLIENT", columns::kClient},
        {"PARTY", columns::kClient},
        {"SYMBOL", columns::kSymbol},
        {"SCRIP_NAME", columns::kCompany},
        {"COMP", columns::kCompany},
        {"BUY_SELL", columns::kBuySell},
        {"QTY", columns::kQty},
        {"PRICE", columns::kPrice},
    };
    return kRules;
}
}

std::vector<std::string> ColumnNormalizer::normalize(const std::vector<std::string>& headers) {
    std::vector<std::string> out;
    out.reserve(headers.size());
    std::set<std::string> claimed;

    for (const auto& raw : headers) {
        const std::string trimmed = utils::trimCopy(raw);
        const std::string upper = utils::toUpperCopy(trimmed);
        std::string result = trimmed;

        auto exact = exactTable().find(upper);
        if (exact != exactTable().end()) {
            if (claimed.insert(exact->second).second) {
                result = exact->second;
            }
        } else {
            for (const auto& [needle, target] : fuzzyRules()) {
                if (utils::contains(upper, needle) && claimed.count(target) == 0) {
                    claimed.insert(target);
                    result = target;
                    break;
                }
            }
        }
        out.push_back(result);
    }
    return out;
}

int ColumnNormalizer::indexOf(const std::vector<std::string>& columns, const std::string& name) {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace deals
} // namespace instflow
