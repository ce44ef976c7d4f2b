#include "deals/ScrapeDealSource.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <memory>

namespace instflow {
namespace deals {

namespace {
struct DocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

bool isElement(const xmlNode* node, const char* tag) {
    return node && node->type == XML_ELEMENT_NODE &&
           xmlStrcasecmp(node->name, reinterpret_cast<const xmlChar*>(tag)) == 0;
}

std::string attribute(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string out(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return out;
}

// Text nodes below `node`, each trimmed, joined by single spaces
void collectText(const xmlNode* node, std::string& out) {
    for (const xmlNode* child = node->children; child; child = child->next) {
        if (child->type == XML_TEXT_NODE && child->content) {
            const std::string piece = utils::trimCopy(reinterpret_cast<const char*>(child->content));
            if (piece.empty()) continue;
            if (!out.empty()) out += ' ';
            out += piece;
        } else if (child->type == XML_ELEMENT_NODE) {
            collectText(child, out);
        }
    }
}

std::string textOf(const xmlNode* node) {
    std::string out;
    collectText(node, out);
    return utils::collapseWhitespace(out);
}

void collectCells(const xmlNode* node, std::vector<const xmlNode*>& cells) {
    for (const xmlNode* child = node->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        if (isElement(child, "td")) {
            cells.push_back(child);
        }
        collectCells(child, cells);
    }
}

const xmlNode* enclosingRow(const xmlNode* node) {
    for (const xmlNode* p = node->parent; p; p = p->parent) {
        if (isElement(p, "tr")) return p;
    }
    return nullptr;
}

std::string lastPathSegment(std::string href) {
    const auto cut = href.find_first_of("?#");
    if (cut != std::string::npos) href.erase(cut);
    while (!href.empty() && href.back() == '/') href.pop_back();
    const auto slash = href.rfind('/');
    return slash == std::string::npos ? href : href.substr(slash + 1);
}

void collectLinks(const xmlNode* node, const engine::ScrapeSourceConfig& config, std::vector<DealRecord>& out) {
    for (const xmlNode* child = node; child; child = child->next) {
        if (out.size() >= config.max_stocks) return;
        if (child->type != XML_ELEMENT_NODE) continue;

        if (isElement(child, "a")) {
            const std::string href = attribute(child, "href");
            if (utils::contains(href, config.link_marker)) {
                const std::string symbol = utils::toUpperCopy(utils::trimCopy(lastPathSegment(href)));
                const std::string name = textOf(child);
                const xmlNode* row = symbol.empty() || name.empty() ? nullptr : enclosingRow(child);
                if (row) {
                    std::vector<const xmlNode*> cells;
                    collectCells(row, cells);
                    std::string row_text;
                    for (const auto* cell : cells) {
                        if (!row_text.empty()) row_text += ' ';
                        row_text += utils::toLowerCopy(textOf(cell));
                    }

                    DealRecord deal;
                    deal.symbol = symbol;
                    deal.company = name;
                    deal.client = "FII/DII";
                    deal.buy_sell = utils::contains(row_text, config.buy_keyword) ? "BUY" : "SELL";
                    deal.category = DealCategory::BULK;
                    deal.declared_class = InvestorClass::BOTH;
                    out.push_back(std::move(deal));
                }
            }
        }
        collectLinks(child->children, config, out);
    }
}
}

ScrapeDealSource::ScrapeDealSource(
    std::shared_ptr<network::IHttpClient> http_client,
    const engine::ScrapeSourceConfig& config
)
    : http_client_(std::move(http_client))
    , config_(config)
{
}

std::optional<DealBatch> ScrapeDealSource::fetch() {
    LOG_INFO("[Source 2] MunafaSutra scraper");
    try {
        const std::map<std::string, std::string> headers = {
            {"User-Agent", config_.user_agent},
            {"Accept-Language", "en-US,en;q=0.9"},
            {"Accept", "text/html,application/xhtml+xml,*/*;q=0.8"},
        };
        auto response = http_client_->get(config_.url, headers, config_.request_timeout_seconds);
        if (!response.isSuccess()) {
            LOG_WARN("MunafaSutra HTTP {}", response.status_code);
            return std::nullopt;
        }

        auto deals = parseHtml(response.body, config_);
        LOG_INFO("MunafaSutra: {} stocks", deals.size());
        if (deals.empty()) {
            return std::nullopt;
        }

        DealBatch batch;
        batch.deals = std::move(deals);
        batch.source_label = kLabel;
        return batch;
    } catch (const std::exception& e) {
        LOG_WARN("MunafaSutra: {}", e.what());
        return std::nullopt;
    }
}

std::vector<DealRecord> ScrapeDealSource::parseHtml(const std::string& html, const engine::ScrapeSourceConfig& config) {
    std::vector<DealRecord> deals;
    if (html.empty() || config.max_stocks == 0) {
        return deals;
    }

    std::unique_ptr<xmlDoc, DocDeleter> doc(htmlReadMemory(
        html.data(), static_cast<int>(html.size()), config.url.c_str(), "UTF-8",
        HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
    if (!doc) {
        LOG_WARN("MunafaSutra: HTML could not be parsed");
        return deals;
    }

    collectLinks(xmlDocGetRootElement(doc.get()), config, deals);
    return deals;
}

} // namespace deals
} // namespace instflow
