#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>

// ------------------------------------------------------------
// Catalog storage
// ------------------------------------------------------------
static std::mutex g_errorsMutex;
static nlohmann::json g_root;   // empty until first use

static nlohmann::json& rootLocked() {
    if (g_root.is_null()) g_root = ErrorManager::defaults();
    return g_root;
}

nlohmann::json ErrorManager::defaults() {
    return {
        {"ERR_UNKNOWN_ACTION", {
            {"user", "Unknown function"},
            {"debug", "Action name not present in the dispatch table."}
        }},
        {"ERR_ACTION_EXCEPTION", {
            {"user", "Error"},
            {"debug", "Handler threw while executing an action."}
        }},
        {"ERR_INVALID_PARAMS", {
            {"user", "Invalid parameters"},
            {"debug", "Action parameters were not a JSON object."}
        }},
        {"ERR_TIMER_INVALID_DURATION", {
            {"user", "Invalid duration"},
            {"debug", "Duration phrase parsed to zero seconds."}
        }},
        {"ERR_ALARM_NO_TIME", {
            {"user", "No alarm time provided"},
            {"debug", "set_alarm called without a time parameter."}
        }},
        {"ERR_ALARM_FAILED", {
            {"user", "Failed to set alarm"},
            {"debug", "Record store rejected the alarm insert."}
        }},
        {"ERR_TASKS_UNAVAILABLE", {
            {"user", "Task manager not available"},
            {"debug", "No task store was injected into the dispatcher."}
        }},
        {"ERR_TASK_NO_TEXT", {
            {"user", "No task text provided"},
            {"debug", "add_task called with empty text."}
        }},
        {"ERR_TASK_FAILED", {
            {"user", "Failed to add task"},
            {"debug", "Record store rejected the task insert."}
        }},
        {"ERR_CALENDAR_UNAVAILABLE", {
            {"user", "Calendar manager not available"},
            {"debug", "No calendar store was injected into the dispatcher."}
        }},
        {"ERR_CALENDAR_FAILED", {
            {"user", "Failed to create event"},
            {"debug", "Record store rejected the event insert."}
        }},
        {"ERR_SEARCH_NO_QUERY", {
            {"user", "No search query provided"},
            {"debug", "web_search called with empty query."}
        }},
        {"ERR_SEARCH_UNAVAILABLE", {
            {"user", "Search backend not available"},
            {"debug", "No search backend was injected into the dispatcher."}
        }},
        {"ERR_SEARCH_FAILED", {
            {"user", "Search failed"},
            {"debug", "Search backend threw."}
        }},
        {"ERR_DEVICES_UNAVAILABLE", {
            {"user", "Device control not available"},
            {"debug", "No device resolver was injected into the dispatcher."}
        }},
        {"ERR_DEVICES_NONE_FOUND", {
            {"user", "No smart devices found"},
            {"debug", "Discovery returned an empty device list."}
        }},
        {"ERR_DEVICE_NOT_FOUND", {
            {"user", "Device '{}' not found"},
            {"debug", "No device matched after one forced rediscovery."}
        }},
        {"ERR_DEVICE_CONTROL_FAILED", {
            {"user", "Failed to control any devices"},
            {"debug", "Every device in the batch reported failure."}
        }},
        {"ERR_LIGHT_CONTROL", {
            {"user", "Light control failed"},
            {"debug", "Device backend threw outside of a per-device sequence."}
        }},
        {"ERR_MODEL_LOAD_FAILED", {
            {"user", "Could not load the responder model"},
            {"debug", "Model backend load request failed."}
        }}
    };
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json loaded;
        in >> loaded;

        nlohmann::json overrides = loaded;
        if (loaded.contains("errors") && loaded["errors"].is_object()) {
            overrides = loaded["errors"];
        }
        if (!overrides.is_object()) {
            LOG_ERROR("ErrorManager", path + " is not an object");
            return false;
        }

        std::lock_guard<std::mutex> lock(g_errorsMutex);
        auto& root = rootLocked();
        for (auto& [key, val] : overrides.items()) {
            if (!val.is_object() ||
                (val.contains("user") && !val["user"].is_string()) ||
                (val.contains("debug") && !val["debug"].is_string())) {
                LOG_ERROR("ErrorManager", "Ignoring malformed entry for " + key);
                continue;
            }
            root[key] = val;
        }
        LOG_DEBUG("ErrorManager", "Loaded " + std::to_string(overrides.size()) +
                                  " codes from " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    const auto& root = rootLocked();
    if (root.contains(code) && root[code].contains("user") &&
        root[code]["user"].is_string()) {
        return root[code]["user"].get<std::string>();
    }
    return "Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    const auto& root = rootLocked();
    if (root.contains(code) && root[code].contains("debug") &&
        root[code]["debug"].is_string()) {
        return root[code]["debug"].get<std::string>();
    }
    return "No debug message for code: " + code;
}

std::string ErrorManager::format(const std::string& code, const std::string& detail) {
    std::string text = getUserMessage(code);
    auto slot = text.find("{}");
    if (slot != std::string::npos) {
        text.replace(slot, 2, detail);
    } else if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

ActionResult ErrorManager::report(const std::string& code, const std::string& detail) {
    ActionResult result;
    result.success   = false;
    result.message   = format(code, detail);
    result.data      = nullptr;
    result.errorCode = code;

    LOG_ERROR("Action", code + " -> " + getDebugMessage(code) +
                        (detail.empty() ? "" : " (" + detail + ")"));
    return result;
}
