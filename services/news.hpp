#pragma once
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

struct NewsItem {
    std::string title;
    std::string category = "News";
    std::string url;
};

class NewsFetcher {
public:
    virtual ~NewsFetcher() = default;
    virtual std::vector<NewsItem> headlines() = 0;
};

/// NewsFetcher reading a JSON Feed (https://jsonfeed.org) document.
/// The first tag of an item becomes its category.
class JsonFeedNews : public NewsFetcher {
public:
    JsonFeedNews(std::string feedUrl, int maxItems = 10, int timeoutMs = 5000);

    // Empty when no feed is configured; throws on transport failure
    std::vector<NewsItem> headlines() override;

    static std::vector<NewsItem> parseFeed(const nlohmann::json& feed, int maxItems);

private:
    std::string feedUrl_;
    int maxItems_;
    int timeoutMs_;
};
