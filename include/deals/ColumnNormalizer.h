#pragma once

#include <string>
#include <vector>

namespace instflow {
namespace deals {

namespace columns {
constexpr const char* kSymbol = "SYMBOL";
constexpr const char* kCompany = "COMPANY";
constexpr const char* kClient = "CLIENT";
constexpr const char* kBuySell = "BUYSELL";
constexpr const char* kQty = "QTY";
constexpr const char* kDate = "DATE";
constexpr const char* kOrderDate = "ORDER_DATE";
constexpr const char* kPrice = "PRICE";
constexpr const char* kRemarks = "REMARKS";
}

// Maps provider headers (BD_CLIENT_NAME, CLIENT_NAME, "Client Name", ...) onto
// the canonical column set. Each canonical name is claimed by at most one
// header, in header order; unmatched headers are kept trimmed.
// normalize(normalize(h)) == normalize(h).
class ColumnNormalizer {
public:
    static std::vector<std::string> normalize(const std::vector<std::string>& headers);

    // Index of the first column with this name, -1 when absent
    static int indexOf(const std::vector<std::string>& columns, const std::string& name);
};

} // namespace deals
} // namespace instflow
