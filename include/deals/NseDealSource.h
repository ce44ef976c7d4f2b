#pragma once

#include "deals/IDealSource.h"
#include "deals/DealPayloadParser.h"
#include "calendar/TradingCalendar.h"
#include "engine/EngineConfig.h"
#include "network/IHttpClient.h"

#include <functional>
#include <map>
#include <memory>

namespace instflow {
namespace deals {

// NSE historical bulk/block deal API. Needs a warmed-up cookie session:
// the landing pages are fetched on the same client before any data request.
class NseDealSource : public IDealSource {
public:
    using WindowProvider = std::function<std::optional<calendar::TradingWindow>()>;

    static constexpr const char* kLabel = "NSE Bulk Deals API";

    NseDealSource(
        std::shared_ptr<network::IHttpClient> http_client,
        const engine::NseSourceConfig& config,
        WindowProvider window_provider
    );

    std::string name() const override { return kLabel; }
    std::optional<DealBatch> fetch() override;

    // Window used by the last fetch() (empty before the first call)
    const std::optional<calendar::TradingWindow>& lastWindow() const { return last_window_; }

    std::string buildCategoryUrl(const std::string& category, const calendar::TradingWindow& window) const;

private:
    std::shared_ptr<network::IHttpClient> http_client_;
    engine::NseSourceConfig config_;
    WindowProvider window_provider_;
    std::optional<calendar::TradingWindow> last_window_;

    void warmUp();
    std::optional<RawTable> fetchCategory(const std::string& category, const std::string& url);
    std::map<std::string, std::string> browserHeaders() const;
};

} // namespace deals
} // namespace instflow
