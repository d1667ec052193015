#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace bootstrap_config {

// ----------------- helpers -----------------
bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // int vs float is not a type mismatch worth resetting
            continue;
        } else if (cfg[key].type() != defVal.type()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultAssistant() {
    return {
        {"log_level", "debug"},

        {"ollama_url", "http://127.0.0.1:11434"},
        {"responder_model", "qwen3:1.7b"},
        {"responder_keep_alive", "5m"},
        {"responder_timeout_seconds", 300},
        {"watchdog_interval_ms", 10000},

        {"home_assistant", {
            {"url", "http://homeassistant.local:8123"},
            {"token", ""},
            {"timeout_ms", 5000}
        }},

        {"weather", {
            {"latitude", 36.7538},
            {"longitude", 3.0588},
            {"temperature_unit", "fahrenheit"}
        }},

        {"news", {
            {"feed_url", ""},
            {"max_items", 10}
        }},

        {"search", {
            {"url", "https://api.duckduckgo.com/"},
            {"max_results", 5}
        }},

        {"storage", {
            {"records_file", "records.json"}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            std::ofstream(path) << outConfig.dump(2);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid (" + e.what() + ") → reset to defaults");
        LOG_PHASE(name + " load", false);

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    }
}

// ----------------- entry -----------------
nlohmann::json initAll(const fs::path& resourceDir) {
    beginPhaseGroup();

    std::error_code ec;
    fs::create_directories(resourceDir, ec);
    if (ec) {
        LOG_ERROR("Config", "Could not create " + resourceDir.string() + ": " + ec.message());
    }

    // assistant_config.json
    nlohmann::json assistantCfg;
    loadConfig(resourceDir / ASSISTANT_CONFIG_FILE, defaultAssistant(),
               assistantCfg, "Assistant config");
    setLogLevel(parseLogLevel(assistantCfg.value("log_level", "debug")));

    // errors.json (catalog overrides)
    nlohmann::json errorsCfg;
    fs::path errPath = resourceDir / ERRORS_FILE;
    loadConfig(errPath, ErrorManager::defaults(), errorsCfg, "Errors config");
    LOG_PHASE("Error catalog load", ErrorManager::load(errPath.string()));

    endPhaseGroup();
    return assistantCfg;
}

} // namespace bootstrap_config
