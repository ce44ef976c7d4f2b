#include "deals/ColumnNormalizer.h"
#include <cassert>
#include <iostream>

using namespace instflow::deals;

namespace {
using Headers = std::vector<std::string>;

void assertIdempotent(const Headers& headers) {
    const auto once = ColumnNormalizer::normalize(headers);
    const auto twice = ColumnNormalizer::normalize(once);
    assert(once == twice);
}
}

int main() {
    std::cout << "[TEST] Starting ColumnNormalizer Test..." << std::endl;

    // 1. NSE API bulk deal headers
    {
        Headers h = {"BD_DT_DATE", "BD_SYMBOL", "BD_SCRIP_NAME", "BD_CLIENT_NAME",
                     "BD_BUY_SELL", "BD_QTY_TRD", "BD_TP_WATP", "BD_REMARKS", "BD_DT_ORDER"};
        Headers expected = {"DATE", "SYMBOL", "COMPANY", "CLIENT",
                            "BUYSELL", "QTY", "PRICE", "REMARKS", "ORDER_DATE"};
        assert(ColumnNormalizer::normalize(h) == expected);
    }

    // 2. Block deal variant, trimmed and case-folded
    {
        Headers h = {" symbol ", "scrip_name", "Client_Name", "buy_sell", "QTY_TRD", "TRADE_PRICE", "trade_date"};
        Headers expected = {"SYMBOL", "COMPANY", "CLIENT", "BUYSELL", "QTY", "PRICE", "DATE"};
        assert(ColumnNormalizer::normalize(h) == expected);
    }

    // 3. Fuzzy rules, CLIENT before name-like matches
    {
        Headers h = {"Party Name", "Stock Symbol", "Company Name", "Traded Qty", "Avg Price", "Note"};
        Headers expected = {"CLIENT", "SYMBOL", "COMPANY", "QTY", "PRICE", "Note"};
        assert(ColumnNormalizer::normalize(h) == expected);
    }

    // 4. Each target claimed once
    {
        Headers h = {"BD_CLIENT_NAME", "CLIENT_NAME", "Client Category"};
        auto out = ColumnNormalizer::normalize(h);
        assert(out[0] == "CLIENT");
        assert(out[1] == "CLIENT_NAME");
        assert(out[2] == "Client Category");
        assert(ColumnNormalizer::indexOf(out, "CLIENT") == 0);
    }

    // 5. Fuzzy falls through to the next rule when a target is taken
    {
        Headers h = {"CLIENT", "CLIENT_PRICE"};
        auto out = ColumnNormalizer::normalize(h);
        assert(out[1] == "PRICE");
    }

    // 6. CSV download headers
    {
        Headers h = {"Date", "Symbol", "Security Name", "Client Name", "Buy/Sell",
                     "Quantity Traded", "Trade Price / Wght. Avg. Price", "Remarks"};
        Headers expected = {"DATE", "SYMBOL", "COMPANY", "CLIENT", "BUYSELL", "QTY", "PRICE", "REMARKS"};
        assert(ColumnNormalizer::normalize(h) == expected);
    }

    // 7. No client column
    {
        Headers h = {"BD_SYMBOL", "BD_QTY_TRD"};
        assert(ColumnNormalizer::indexOf(ColumnNormalizer::normalize(h), "CLIENT") == -1);
    }

    // 8. Idempotence
    assertIdempotent({"BD_SYMBOL", "BD_CLIENT_NAME", "BD_BUY_SELL"});
    assertIdempotent({"Client Category", "BD_CLIENT_NAME", "symbol", "SYMBOL"});
    assertIdempotent({"Party", "CLIENT_NAME", "comp", "Company", "x"});
    assertIdempotent({"CLIENT", "CLIENT_PRICE", "PRICE"});
    assertIdempotent({});

    std::cout << "[TEST] ColumnNormalizer Test PASSED!" << std::endl;
    return 0;
}
