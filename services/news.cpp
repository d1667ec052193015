#include "news.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

JsonFeedNews::JsonFeedNews(std::string feedUrl, int maxItems, int timeoutMs)
    : feedUrl_(std::move(feedUrl)), maxItems_(maxItems), timeoutMs_(timeoutMs) {}

std::vector<NewsItem> JsonFeedNews::parseFeed(const nlohmann::json& feed, int maxItems) {
    std::vector<NewsItem> out;
    if (!feed.is_object() || !feed.contains("items") || !feed["items"].is_array()) return out;

    for (const auto& item : feed["items"]) {
        if (static_cast<int>(out.size()) >= maxItems) break;

        NewsItem n;
        n.title = item.value("title", "");
        if (n.title.empty()) continue;

        n.url = item.value("url", item.value("external_url", ""));
        const auto tags = item.value("tags", nlohmann::json::array());
        if (!tags.empty() && tags[0].is_string()) n.category = tags[0].get<std::string>();

        out.push_back(std::move(n));
    }
    return out;
}

std::vector<NewsItem> JsonFeedNews::headlines() {
    if (feedUrl_.empty()) {
        LOG_TRACE("News", "No feed configured");
        return {};
    }

    auto resp = cpr::Get(cpr::Url{ feedUrl_ }, cpr::Timeout{ timeoutMs_ });
    if (resp.status_code != 200) {
        throw std::runtime_error("news feed returned " + std::to_string(resp.status_code));
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("news feed is not JSON");
    }
    return parseFeed(j, maxItems_);
}
