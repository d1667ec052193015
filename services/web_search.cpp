#include "web_search.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

DuckDuckGoSearch::DuckDuckGoSearch(std::string url, int timeoutMs)
    : url_(std::move(url)), timeoutMs_(timeoutMs) {}

// "Title - rest of the text" → "Title"
static std::string topicTitle(const std::string& text) {
    auto dash = text.find(" - ");
    return dash == std::string::npos ? text : text.substr(0, dash);
}

static void collectTopics(const nlohmann::json& topics,
                          std::vector<SearchHit>& out,
                          std::size_t limit) {
    if (!topics.is_array()) return;

    for (const auto& t : topics) {
        if (out.size() >= limit) return;

        // Category groups nest their own topic list
        if (t.contains("Topics")) {
            collectTopics(t["Topics"], out, limit);
            continue;
        }

        const std::string text = t.value("Text", "");
        const std::string url  = t.value("FirstURL", "");
        if (text.empty() || url.empty()) continue;
        out.push_back({ topicTitle(text), text, url });
    }
}

std::vector<SearchHit> DuckDuckGoSearch::parseResponse(const nlohmann::json& j, int maxResults) {
    std::vector<SearchHit> hits;
    if (!j.is_object() || maxResults <= 0) return hits;

    const auto limit = static_cast<std::size_t>(maxResults);

    const std::string abstract = j.value("AbstractText", "");
    if (!abstract.empty()) {
        hits.push_back({ j.value("Heading", ""), abstract, j.value("AbstractURL", "") });
    }

    collectTopics(j.value("Results", nlohmann::json::array()), hits, limit);
    collectTopics(j.value("RelatedTopics", nlohmann::json::array()), hits, limit);

    if (hits.size() > limit) hits.resize(limit);
    return hits;
}

std::vector<SearchHit> DuckDuckGoSearch::search(const std::string& query, int maxResults) {
    LOG_DEBUG("Search", "query=\"" + query + "\"");

    auto resp = cpr::Get(
        cpr::Url{ url_ },
        cpr::Parameters{ {"q", query},
                         {"format", "json"},
                         {"no_html", "1"},
                         {"skip_disambig", "1"} },
        cpr::Timeout{ timeoutMs_ }
    );

    if (resp.status_code != 200) {
        throw std::runtime_error("search returned " + std::to_string(resp.status_code) +
                                 (resp.error ? " (" + resp.error.message + ")" : ""));
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("search response is not JSON");
    }

    auto hits = parseResponse(j, maxResults);
    LOG_TRACE("Search", std::to_string(hits.size()) + " hits");
    return hits;
}
