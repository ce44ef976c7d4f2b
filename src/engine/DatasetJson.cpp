#include "engine/DatasetJson.h"

namespace instflow {

void to_json(nlohmann::json& j, const InstitutionalStock& stock) {
    j = nlohmann::json{
        {"symbol", stock.symbol},
        {"ticker", stock.ticker},
        {"name", stock.name},
        {"fii_cash", toString(stock.fii_cash)},
        {"dii_cash", toString(stock.dii_cash)},
    };
}

void to_json(nlohmann::json& j, const TechnicalSnapshot& snapshot) {
    j = nlohmann::json{
        {"rsi", snapshot.rsi},
        {"macd", snapshot.macd},
        {"macd_hist", snapshot.macd_histogram},
        {"ema_cross", toString(snapshot.ema_cross)},
        {"bb_label", toString(snapshot.bollinger)},
        {"adx", snapshot.adx},
        {"stoch_rsi", snapshot.stochastic_rsi},
        {"resist1", snapshot.resistance1},
        {"support1", snapshot.support1},
        {"resist2", snapshot.resistance2},
        {"support2", snapshot.support2},
        {"swing_high", snapshot.swing_high},
        {"swing_low", snapshot.swing_low},
        {"last_price", snapshot.last_price},
        {"score", snapshot.composite_score},
        {"overall", toString(snapshot.overall)},
        {"sparkline", snapshot.sparkline},
        {"bar_count", snapshot.bar_count},
        {"data_ok", snapshot.data_ok},
    };
}

void to_json(nlohmann::json& j, const InstitutionalFlow& flow) {
    j = nlohmann::json{
        {"signal", toString(flow.signal)},
        {"both_buy", flow.both_buy},
        {"fii_only", flow.fii_only},
        {"dii_only", flow.dii_only},
        {"both_sell", flow.both_sell},
    };
}

void to_json(nlohmann::json& j, const EnrichedStock& enriched) {
    j = enriched.stock;
    j["technicals"] = enriched.technicals;
    j["inst_signal"] = enriched.flow;
}

void to_json(nlohmann::json& j, const IndexQuote& quote) {
    j = nlohmann::json{
        {"name", quote.name},
        {"ticker", quote.ticker},
        {"price", quote.price},
        {"change_pct", quote.change_pct},
    };
}

void to_json(nlohmann::json& j, const MarketSummary& summary) {
    j = nlohmann::json{{"indices", summary.indices}};
}

void to_json(nlohmann::json& j, const DashboardDataset& dataset) {
    j = nlohmann::json{
        {"source", dataset.source_label},
        {"date_range", dataset.window_label},
        {"generated_at", dataset.generated_at},
        {"market", dataset.market},
        {"stocks", dataset.stocks},
    };
}

} // namespace instflow
