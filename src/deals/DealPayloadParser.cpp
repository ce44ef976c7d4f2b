#include "deals/DealPayloadParser.h"
#include "deals/ColumnNormalizer.h"
#include "common/StringUtils.h"

#include <stdexcept>

namespace instflow {
namespace deals {

namespace {
const std::vector<std::string> kListKeys = {
    "data", "Data", "results", "bulkDeals", "blockDeals",
    "deals", "bulkDealData", "blockDealData", "records"
};

std::string cellText(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

RawTable fromObjects(const nlohmann::json& list) {
    RawTable table;
    for (const auto& item : list) {
        if (!item.is_object()) continue;
        for (auto it = item.begin(); it != item.end(); ++it) {
            if (ColumnNormalizer::indexOf(table.columns, it.key()) < 0) {
                table.columns.push_back(it.key());
            }
        }
    }
    for (const auto& item : list) {
        if (!item.is_object()) continue;
        std::vector<std::string> row(table.columns.size());
        for (size_t i = 0; i < table.columns.size(); ++i) {
            auto it = item.find(table.columns[i]);
            if (it != item.end()) row[i] = cellText(*it);
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

RawTable fromMatrix(const nlohmann::json& columns, const nlohmann::json& data) {
    RawTable table;
    for (const auto& c : columns) {
        table.columns.push_back(cellText(c));
    }
    for (const auto& item : data) {
        if (!item.is_array()) continue;
        std::vector<std::string> row(table.columns.size());
        for (size_t i = 0; i < table.columns.size() && i < item.size(); ++i) {
            row[i] = cellText(item[i]);
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

bool looksLikeJson(const std::string& body) {
    for (char c : body) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        return c == '[' || c == '{';
    }
    return false;
}
}

RawTable DealPayloadParser::parse(const std::string& body, const std::string& content_type) {
    const std::string type = utils::toLowerCopy(content_type);
    bool as_json = utils::contains(type, "json");
    if (!as_json && !utils::contains(type, "csv")) {
        as_json = looksLikeJson(body);
    }

    if (as_json) {
        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error(std::string("JSON parse error: ") + e.what());
        }
        return parseJson(payload);
    }
    return parseCsv(body);
}

RawTable DealPayloadParser::parseJson(const nlohmann::json& payload) {
    if (payload.is_array()) {
        if (!payload.empty() && payload[0].is_object()) {
            return fromObjects(payload);
        }
        return RawTable{};
    }

    if (!payload.is_object()) {
        return RawTable{};
    }

    for (const auto& key : kListKeys) {
        auto it = payload.find(key);
        if (it == payload.end() || !it->is_array() || it->empty()) continue;

        const nlohmann::json* cols = nullptr;
        if (payload.contains("columns")) cols = &payload["columns"];
        else if (payload.contains("Columns")) cols = &payload["Columns"];

        if (cols && cols->is_array() && !(*it)[0].is_object()) {
            return fromMatrix(*cols, *it);
        }
        return fromObjects(*it);
    }

    if (payload.contains("columns") && payload.contains("data") &&
        payload["columns"].is_array() && payload["data"].is_array()) {
        return fromMatrix(payload["columns"], payload["data"]);
    }
    return RawTable{};
}

RawTable DealPayloadParser::parseCsv(const std::string& text) {
    RawTable table;
    bool header_done = false;

    for (std::string& line : utils::splitCsvRecords(text)) {
        if (!header_done && line.size() >= 3 &&
            static_cast<unsigned char>(line[0]) == 0xEF &&
            static_cast<unsigned char>(line[1]) == 0xBB &&
            static_cast<unsigned char>(line[2]) == 0xBF) {
            line.erase(0, 3);
        }
        if (utils::trimCopy(line).empty()) continue;

        auto cells = utils::splitCsvRecord(line);
        if (!header_done) {
            table.columns = std::move(cells);
            header_done = true;
            continue;
        }
        cells.resize(table.columns.size());
        table.rows.push_back(std::move(cells));
    }

    if (!header_done) {
        throw std::runtime_error("CSV payload has no header");
    }
    return table;
}

std::optional<std::vector<DealRecord>> DealPayloadParser::toDeals(const RawTable& table, DealCategory category) {
    const auto cols = ColumnNormalizer::normalize(table.columns);
    const int client_idx = ColumnNormalizer::indexOf(cols, columns::kClient);
    if (client_idx < 0) {
        return std::nullopt;
    }
    const int symbol_idx = ColumnNormalizer::indexOf(cols, columns::kSymbol);
    const int company_idx = ColumnNormalizer::indexOf(cols, columns::kCompany);
    const int side_idx = ColumnNormalizer::indexOf(cols, columns::kBuySell);
    const int qty_idx = ColumnNormalizer::indexOf(cols, columns::kQty);
    const int price_idx = ColumnNormalizer::indexOf(cols, columns::kPrice);
    const int date_idx = ColumnNormalizer::indexOf(cols, columns::kDate);

    auto cell = [](const std::vector<std::string>& row, int idx) -> std::string {
        if (idx < 0 || static_cast<size_t>(idx) >= row.size()) return "";
        return utils::trimCopy(row[idx]);
    };

    std::vector<DealRecord> deals;
    for (const auto& row : table.rows) {
        DealRecord deal;
        deal.symbol = utils::toUpperCopy(cell(row, symbol_idx));
        deal.client = cell(row, client_idx);
        if (deal.symbol.empty() || deal.client.empty()) {
            continue;
        }
        deal.company = cell(row, company_idx);
        if (deal.company.empty()) deal.company = deal.symbol;
        deal.buy_sell = utils::toUpperCopy(cell(row, side_idx));
        deal.quantity = utils::parseLooseNumber(cell(row, qty_idx)).value_or(0.0);
        deal.price = utils::parseLooseNumber(cell(row, price_idx)).value_or(0.0);
        deal.trade_date = cell(row, date_idx);
        deal.category = category;
        deals.push_back(std::move(deal));
    }
    return deals;
}

} // namespace deals
} // namespace instflow
