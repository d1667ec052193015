#include "actions_web.hpp"
#include "action_helpers.hpp"
#include "error_manager.hpp"
#include "services/web_search.hpp"

static constexpr std::size_t kShownResults = 3;
static constexpr std::size_t kSnippetBytes = 200;

// ------------------------------------------------------------
// [Search] top results with shortened snippets
// ------------------------------------------------------------
ActionResult actWebSearch(ActionContext& ctx, const nlohmann::json& params) {
    const std::string query = trim(paramString(params, "query"));

    if (query.empty()) {
        return ErrorManager::report("ERR_SEARCH_NO_QUERY");
    }
    if (!ctx.search) {
        return ErrorManager::report("ERR_SEARCH_UNAVAILABLE");
    }

    std::vector<SearchHit> hits;
    try {
        hits = ctx.search->search(query, ctx.searchMaxResults);
    } catch (const std::exception& e) {
        return ErrorManager::report("ERR_SEARCH_FAILED", e.what());
    }

    if (hits.empty()) {
        return actionOk("No results found for '" + query + "'");
    }

    nlohmann::json results = nlohmann::json::array();
    for (std::size_t i = 0; i < hits.size() && i < kShownResults; ++i) {
        results.push_back({
            {"title", hits[i].title},
            {"body", truncateUtf8(hits[i].body, kSnippetBytes)},
            {"url", hits[i].url}
        });
    }

    return actionOk("Found " + std::to_string(hits.size()) + " results for '" + query + "'", {
        {"query", query},
        {"results", results}
    });
}
