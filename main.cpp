#include "actions/action_dispatcher.hpp"
#include "bootstrap_config.hpp"
#include "devices/device_resolver.hpp"
#include "devices/home_assistant_backend.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "model/model_lifecycle.hpp"
#include "model/ollama_backend.hpp"
#include "resources.hpp"
#include "services/news.hpp"
#include "services/weather.hpp"
#include "services/web_search.hpp"
#include "store/record_store.hpp"
#include "system_snapshot.hpp"
#include "timers.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

// ------------------------------------------------------------
// Console helpers
// ------------------------------------------------------------
static void printResult(const ActionResult& result) {
    std::cout << (result.success ? "[OK] " : "[FAIL] ") << result.message << "\n";
    if (!result.data.is_null()) {
        std::cout << result.data.dump(2) << "\n";
    }
}

static void printHelp() {
    std::cout << "Actions (usage: <action> [json parameters]):\n";
    for (const auto& name : ActionDispatcher::catalog()) {
        std::cout << "  " << name << "\n";
    }
    std::cout << "Model: model load | model use | model unload | model status\n"
              << "quit / exit to leave\n";
}

static void handleModelCommand(ResourceLifecycleManager& lifecycle, const std::string& sub) {
    if (sub == "load") {
        if (lifecycle.ensureLoaded()) {
            std::cout << "[OK] " << lifecycle.resourceName() << " loaded\n";
        } else {
            std::cout << "[FAIL] " << ErrorManager::format("ERR_MODEL_LOAD_FAILED",
                                                           lifecycle.resourceName()) << "\n";
        }
    }
    else if (sub == "use") {
        lifecycle.markUsed();
        std::cout << "[OK] " << lifecycle.resourceName() << " is "
                  << toString(lifecycle.state()) << "\n";
    }
    else if (sub == "unload") {
        lifecycle.unload("manual");
        std::cout << "[OK] " << lifecycle.resourceName() << " unloaded\n";
    }
    else if (sub == "status" || sub.empty()) {
        const ResourceStatus st = lifecycle.status();
        nlohmann::json j = {
            {"model", lifecycle.resourceName()},
            {"state", toString(st.state)},
            {"is_loaded", st.isLoaded},
            {"is_running", st.isRunning},
            {"idle_seconds", st.idleSeconds ? nlohmann::json(*st.idleSeconds) : nlohmann::json(nullptr)}
        };
        std::cout << j.dump(2) << "\n";
    }
    else {
        std::cout << "[FAIL] Unknown model command: " << sub << "\n";
    }
}

// ============================================================
// Main entry point
// ============================================================
int main() {
    initLogger("lia.log");
    LOG_PHASE("Startup begin", true);

    const nlohmann::json config = bootstrap_config::initAll(getResourcePath());

    // --- Collaborators (constructed once, passed explicitly) ---
    TimerRegistry timers;

    HomeAssistantBackend deviceBackend(HomeAssistantSettings::fromConfig(config));
    DeviceResolver devices(deviceBackend);

    const auto storage = config.value("storage", nlohmann::json::object());
    JsonRecordStore records(resolveResourceFile(storage.value("records_file", "records.json")));

    const auto searchCfg = config.value("search", nlohmann::json::object());
    DuckDuckGoSearch search(searchCfg.value("url", "https://api.duckduckgo.com/"));

    OpenMeteoWeather weather(WeatherSettings::fromConfig(config));

    const auto newsCfg = config.value("news", nlohmann::json::object());
    JsonFeedNews news(newsCfg.value("feed_url", ""), newsCfg.value("max_items", 10));

    SnapshotSources sources;
    sources.timers   = &timers;
    sources.tasks    = &records;
    sources.calendar = &records;
    sources.devices  = &devices;
    sources.weather  = &weather;
    sources.news     = &news;
    SystemSnapshotAggregator snapshot(sources);

    ActionContext ctx{ timers };
    ctx.devices          = &devices;
    ctx.tasks            = &records;
    ctx.calendar         = &records;
    ctx.search           = &search;
    ctx.snapshot         = &snapshot;
    ctx.searchMaxResults = searchCfg.value("max_results", 5);
    ActionDispatcher dispatcher(ctx);

    OllamaBackend modelBackend(config.value("ollama_url", "http://127.0.0.1:11434"));
    ResourceLifecycleManager lifecycle(modelBackend, LifecycleSettings::fromConfig(config));

    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        line = line.substr(first);

        if (line == "quit" || line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }
        if (line == "help") {
            printHelp();
            continue;
        }

        const auto space = line.find(' ');
        const std::string name = line.substr(0, space);
        const std::string rest = space == std::string::npos ? "" : line.substr(space + 1);

        if (name == "model") {
            const auto sub = rest.substr(0, rest.find(' '));
            handleModelCommand(lifecycle, sub);
            continue;
        }

        nlohmann::json params = nlohmann::json::object();
        if (rest.find_first_not_of(" \t") != std::string::npos) {
            params = nlohmann::json::parse(rest, nullptr, false);
            if (params.is_discarded()) {
                std::cout << "[FAIL] Parameters must be a JSON object\n";
                continue;
            }
        }

        LOG_TRACE("Console", "Dispatching action: " + name);
        printResult(dispatcher.dispatch(name, params));
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    lifecycle.unload("shutdown");
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}
