#pragma once

#include "deals/IDealSource.h"
#include "engine/EngineConfig.h"
#include "network/IHttpClient.h"

#include <memory>

namespace instflow {
namespace deals {

// MunafaSutra FII/DII activity page. Each stock link yields one record whose
// side applies to both FII and DII.
class ScrapeDealSource : public IDealSource {
public:
    static constexpr const char* kLabel = "MunafaSutra";

    ScrapeDealSource(std::shared_ptr<network::IHttpClient> http_client, const engine::ScrapeSourceConfig& config);

    std::string name() const override { return kLabel; }
    std::optional<DealBatch> fetch() override;

    // At most config.max_stocks records, in document order
    static std::vector<DealRecord> parseHtml(const std::string& html, const engine::ScrapeSourceConfig& config);

private:
    std::shared_ptr<network::IHttpClient> http_client_;
    engine::ScrapeSourceConfig config_;
};

} // namespace deals
} // namespace instflow
