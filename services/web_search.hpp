#pragma once
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

struct SearchHit {
    std::string title;
    std::string body;       // snippet
    std::string url;
};

class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    // Throws on transport failure; an empty list means no hits
    virtual std::vector<SearchHit> search(const std::string& query, int maxResults) = 0;
};

/// SearchBackend over the DuckDuckGo instant answer API.
/// The abstract (when present) comes first, then related topics.
class DuckDuckGoSearch : public SearchBackend {
public:
    explicit DuckDuckGoSearch(std::string url = "https://api.duckduckgo.com/",
                              int timeoutMs = 5000);

    std::vector<SearchHit> search(const std::string& query, int maxResults) override;

    static std::vector<SearchHit> parseResponse(const nlohmann::json& j, int maxResults);

private:
    std::string url_;
    int timeoutMs_;
};
