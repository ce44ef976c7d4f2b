#include "deals/NseDealSource.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <chrono>
#include <thread>

namespace instflow {
namespace deals {

namespace {
void pause(int ms) {
    if (ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

std::string previewOf(const std::string& body, size_t limit) {
    std::string preview = body.substr(0, limit);
    for (auto& c : preview) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    return preview;
}

DealCategory categoryOf(const std::string& option_type) {
    return utils::contains(utils::toLowerCopy(option_type), "block") ? DealCategory::BLOCK : DealCategory::BULK;
}
}

NseDealSource::NseDealSource(
    std::shared_ptr<network::IHttpClient> http_client,
    const engine::NseSourceConfig& config,
    WindowProvider window_provider
)
    : http_client_(std::move(http_client))
    , config_(config)
    , window_provider_(std::move(window_provider))
{
}

std::optional<DealBatch> NseDealSource::fetch() {
    LOG_INFO("[Source 1] NSE bulk/block deals API");
    try {
        last_window_ = window_provider_ ? window_provider_() : std::nullopt;
        if (!last_window_) {
            LOG_WARN("No disclosure window available, skipping NSE");
            return std::nullopt;
        }
        LOG_INFO("Range: {}", last_window_->label);

        warmUp();

        std::vector<DealRecord> all_deals;
        size_t usable_tables = 0;
        size_t fetched_tables = 0;

        for (size_t i = 0; i < config_.categories.size(); ++i) {
            const auto& category = config_.categories[i];
            if (i > 0) {
                pause(config_.category_delay_ms);
            }

            const std::string url = buildCategoryUrl(category, *last_window_);
            auto table = fetchCategory(category, url);
            if (!table) {
                LOG_WARN("[{}] failed, skipping", category);
                continue;
            }
            if (table->empty()) {
                LOG_INFO("[{}] No data in range", category);
                continue;
            }
            ++fetched_tables;
            LOG_INFO("[{}] raw columns: {}", category, joinNames(table->columns));

            auto deals = DealPayloadParser::toDeals(*table, categoryOf(category));
            if (!deals) {
                LOG_WARN("[{}] CLIENT column missing after normalization", category);
                continue;
            }
            ++usable_tables;
            LOG_INFO("[{}] {} rows, {} deals kept", category, table->rows.size(), deals->size());
            all_deals.insert(all_deals.end(), deals->begin(), deals->end());
        }

        if (fetched_tables > 0 && usable_tables == 0) {
            LOG_WARN("No usable NSE table (schema mismatch), abandoning source");
            return std::nullopt;
        }
        if (all_deals.empty()) {
            LOG_WARN("No data from any deal category, falling back");
            return std::nullopt;
        }

        DealBatch batch;
        batch.deals = std::move(all_deals);
        batch.source_label = kLabel;
        LOG_INFO("NSE: {} deals from {} table(s)", batch.deals.size(), usable_tables);
        return batch;
    } catch (const std::exception& e) {
        LOG_WARN("NSE error: {}", e.what());
        return std::nullopt;
    }
}

std::string NseDealSource::buildCategoryUrl(const std::string& category, const calendar::TradingWindow& window) const {
    return config_.api_url + "?" + network::buildQueryString({
        {"optionType", category},
        {"from", utils::DateUtils::formatExchange(window.from)},
        {"to", utils::DateUtils::formatExchange(window.to)},
    });
}

void NseDealSource::warmUp() {
    const auto headers = browserHeaders();
    for (const auto& url : {config_.home_url, config_.landing_url}) {
        if (url.empty()) continue;
        try {
            auto response = http_client_->get(url, headers, config_.warmup_timeout_seconds);
            LOG_INFO("Warm-up {} HTTP {} cookies=[{}]", url, response.status_code,
                     joinNames(http_client_->cookieNames()));
        } catch (const std::exception& e) {
            LOG_WARN("Warm-up {} failed: {}", url, e.what());
        }
        pause(config_.warmup_pause_ms);
    }
}

std::optional<RawTable> NseDealSource::fetchCategory(const std::string& category, const std::string& url) {
    LOG_INFO("Fetching {}: {}", category, url);
    const auto headers = browserHeaders();

    for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        try {
            auto response = http_client_->get(url, headers, config_.request_timeout_seconds);
            const std::string preview = previewOf(response.body, 200);
            LOG_INFO("[{}] attempt {} HTTP {} | {} bytes | {}", category, attempt,
                     response.status_code, response.body.size(), preview.substr(0, 60));

            if (response.body.empty()) {
                LOG_WARN("[{}] Empty body", category);
                pause(config_.backoff_ms);
                continue;
            }
            if (utils::startsWith(utils::trimCopy(preview), "<")) {
                LOG_WARN("[{}] HTML returned (bot block)", category);
                pause(config_.backoff_ms);
                continue;
            }
            if (response.status_code != 200) {
                LOG_WARN("[{}] HTTP {}", category, response.status_code);
                pause(config_.status_backoff_ms);
                continue;
            }

            auto table = DealPayloadParser::parse(response.body, response.contentType());
            LOG_INFO("[{}] payload parsed", category);
            return table;
        } catch (const std::exception& e) {
            LOG_WARN("[{}] attempt {} error: {}", category, attempt, e.what());
            pause(config_.backoff_ms);
        }
    }
    return std::nullopt;
}

std::map<std::string, std::string> NseDealSource::browserHeaders() const {
    return {
        {"User-Agent", config_.user_agent},
        {"Accept", "application/json, text/plain, */*"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"Connection", "keep-alive"},
        {"Referer", config_.home_url},
        {"X-Requested-With", "XMLHttpRequest"},
        {"sec-fetch-dest", "empty"},
        {"sec-fetch-mode", "cors"},
        {"sec-fetch-site", "same-origin"},
    };
}

} // namespace deals
} // namespace instflow
