#include "analytics/InstitutionalClassifier.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <set>

namespace instflow {
namespace analytics {

namespace {
int monthFromName(const std::string& name) {
    static const char* kMonths[] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                    "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
    const std::string upper = utils::toUpperCopy(name.substr(0, 3));
    for (int i = 0; i < 12; ++i) {
        if (upper == kMonths[i]) return i + 1;
    }
    return 0;
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}
}

InstitutionalClassifier::InstitutionalClassifier(
    const engine::ClassifierConfig& config,
    const std::string& symbol_suffix
)
    : symbol_suffix_(symbol_suffix)
    , sort_by_trade_date_(config.sort_by_trade_date)
{
    for (const auto& kw : config.fii_keywords) {
        if (!kw.empty()) fii_keywords_.push_back(utils::toUpperCopy(kw));
    }
    for (const auto& kw : config.dii_keywords) {
        if (!kw.empty()) dii_keywords_.push_back(utils::toUpperCopy(kw));
    }
}

bool InstitutionalClassifier::matchesAny(const std::string& upper_client, const std::vector<std::string>& keywords) {
    return std::any_of(keywords.begin(), keywords.end(),
                       [&](const std::string& kw) { return utils::contains(upper_client, kw); });
}

bool InstitutionalClassifier::isFii(const std::string& client) const {
    return matchesAny(utils::toUpperCopy(utils::trimCopy(client)), fii_keywords_);
}

bool InstitutionalClassifier::isDii(const std::string& client) const {
    return matchesAny(utils::toUpperCopy(utils::trimCopy(client)), dii_keywords_);
}

long long InstitutionalClassifier::tradeDateKey(const std::string& trade_date) {
    const std::string text = utils::trimCopy(trade_date);
    if (auto iso = utils::DateUtils::parseIso(text.substr(0, 10))) {
        return utils::DateUtils::toDays(*iso);
    }

    // DD-MM-YYYY or DD-MMM-YYYY (also with '/' or ' ')
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == '-' || c == '/' || c == ' ') {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(current);

    if (parts.size() >= 3 && allDigits(parts[0]) && parts[0].size() <= 2 &&
        allDigits(parts[2]) && parts[2].size() == 4) {
        int month = 0;
        if (allDigits(parts[1])) {
            if (parts[1].size() <= 2) month = std::stoi(parts[1]);
        } else {
            month = monthFromName(parts[1]);
        }
        if (month < 1 || month > 12) {
            return std::numeric_limits<long long>::max();
        }
        const std::string iso = parts[2] + "-" + (month < 10 ? "0" : "") + std::to_string(month) + "-" +
                                (parts[0].size() == 1 ? "0" : "") + parts[0];
        if (auto date = utils::DateUtils::parseIso(iso)) {
            return utils::DateUtils::toDays(*date);
        }
    }
    return std::numeric_limits<long long>::max();
}

std::vector<InstitutionalStock> InstitutionalClassifier::classify(const std::vector<DealRecord>& deals) const {
    std::vector<const DealRecord*> ordered;
    ordered.reserve(deals.size());
    for (const auto& d : deals) ordered.push_back(&d);

    if (sort_by_trade_date_) {
        std::stable_sort(ordered.begin(), ordered.end(), [](const DealRecord* a, const DealRecord* b) {
            return tradeDateKey(a->trade_date) < tradeDateKey(b->trade_date);
        });
    }

    std::vector<InstitutionalStock> stocks;
    std::map<std::string, size_t> index_by_symbol;
    int matched = 0;
    std::vector<std::string> sample_clients;
    std::set<std::string> seen_clients;

    for (const DealRecord* deal : ordered) {
        const std::string symbol = utils::toUpperCopy(utils::trimCopy(deal->symbol));
        if (symbol.empty()) continue;

        auto it = index_by_symbol.find(symbol);
        if (it == index_by_symbol.end()) {
            InstitutionalStock stock;
            stock.symbol = symbol;
            stock.ticker = symbol + symbol_suffix_;
            stock.name = deal->company.empty() ? symbol : deal->company;
            it = index_by_symbol.emplace(symbol, stocks.size()).first;
            stocks.push_back(stock);
        }
        InstitutionalStock& stock = stocks[it->second];

        bool fii = false;
        bool dii = false;
        if (deal->declared_class != InvestorClass::UNKNOWN) {
            fii = deal->declared_class == InvestorClass::FII || deal->declared_class == InvestorClass::BOTH;
            dii = deal->declared_class == InvestorClass::DII || deal->declared_class == InvestorClass::BOTH;
            // declared records without a side carry no action
            if (utils::trimCopy(deal->buy_sell).empty()) continue;
        } else {
            const std::string client = utils::toUpperCopy(utils::trimCopy(deal->client));
            fii = matchesAny(client, fii_keywords_);
            dii = matchesAny(client, dii_keywords_);
            if (!fii && !dii) {
                if (sample_clients.size() < 10 && seen_clients.insert(client).second) {
                    sample_clients.push_back(client);
                }
                continue;
            }
        }

        ++matched;
        const CashAction action = deal->isBuy() ? CashAction::BUY : CashAction::SELL;
        if (fii) stock.fii_cash = action;
        if (dii) stock.dii_cash = action;
    }

    LOG_INFO("Rows={} matched={} unique={}", deals.size(), matched, stocks.size());
    if (matched == 0 && !sample_clients.empty()) {
        std::string joined;
        for (const auto& c : sample_clients) {
            if (!joined.empty()) joined += " | ";
            joined += c;
        }
        LOG_INFO("Sample clients: {}", joined);
    }
    return stocks;
}

} // namespace analytics
} // namespace instflow
