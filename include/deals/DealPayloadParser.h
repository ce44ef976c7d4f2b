#pragma once

#include "common/Types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace instflow {
namespace deals {

// Provider payload flattened to header + string cells
struct RawTable {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    bool empty() const { return rows.empty(); }
};

class DealPayloadParser {
public:
    // JSON when the content type says so or the body starts with '[' / '{',
    // CSV otherwise. Throws std::runtime_error on malformed input.
    static RawTable parse(const std::string& body, const std::string& content_type = "");

    // Accepted shapes: list of objects; object holding a list under one of
    // the known keys; {"columns": [...], "data": [[...]]}. Unknown shapes
    // give an empty table.
    static RawTable parseJson(const nlohmann::json& payload);

    static RawTable parseCsv(const std::string& text);

    // Rows with an empty symbol or client are dropped. nullopt when the
    // table has no CLIENT column after normalization.
    static std::optional<std::vector<DealRecord>> toDeals(const RawTable& table, DealCategory category);
};

} // namespace deals
} // namespace instflow
