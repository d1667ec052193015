#include "action_dispatcher.hpp"
#include "actions_lights.hpp"
#include "actions_planner.hpp"
#include "actions_system.hpp"
#include "actions_timers.hpp"
#include "actions_web.hpp"

#include "error_manager.hpp"
#include "logger.hpp"

const std::vector<std::string>& ActionDispatcher::catalog() {
    static const std::vector<std::string> names = {
        "control_light",
        "set_timer",
        "set_alarm",
        "create_calendar_event",
        "add_task",
        "web_search",
        "get_system_info"
    };
    return names;
}

// ------------------------------------------------------------
// Action Registration
// ------------------------------------------------------------
ActionDispatcher::ActionDispatcher(ActionContext context)
    : ctx_(context) {
    table_ = {
        // --- Devices ---
        {"control_light",         actControlLight},

        // --- Timers ---
        {"set_timer",             actSetTimer},

        // --- Planner ---
        {"set_alarm",             actSetAlarm},
        {"create_calendar_event", actCreateCalendarEvent},
        {"add_task",              actAddTask},

        // --- Web ---
        {"web_search",            actWebSearch},

        // --- Status ---
        {"get_system_info",       actGetSystemInfo}
    };

    for (const auto& name : catalog()) {
        if (!table_.count(name)) {
            LOG_ERROR("Dispatch", "No handler registered for \"" + name + "\"");
        }
    }
    LOG_PHASE("Action table (" + std::to_string(table_.size()) + " actions)",
              table_.size() == catalog().size());
}

bool ActionDispatcher::hasAction(const std::string& actionName) const {
    return table_.count(actionName) > 0;
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
ActionResult ActionDispatcher::dispatch(const ActionRequest& request) {
    return dispatch(request.actionName, request.parameters);
}

ActionResult ActionDispatcher::dispatch(const std::string& actionName,
                                        const nlohmann::json& parameters) {
    auto it = table_.find(actionName);
    if (it == table_.end()) {
        LOG_DEBUG("Dispatch", "Unknown action: \"" + actionName + "\"");
        return ErrorManager::report("ERR_UNKNOWN_ACTION", actionName);
    }

    try {
        nlohmann::json params = parameters.is_null() ? nlohmann::json::object() : parameters;
        if (!params.is_object()) {
            return ErrorManager::report("ERR_INVALID_PARAMS",
                                        actionName + " expects an object, got " + params.type_name());
        }

        // Parameters may carry raw bytes that are not valid UTF-8
        LOG_DEBUG("Dispatch", "action=\"" + actionName + "\" params=" +
                              params.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

        ActionResult result = it->second(ctx_, params);
        LOG_TRACE("Dispatch", actionName + " -> " + (result.success ? "ok" : "failed") +
                              " \"" + result.message + "\"");
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch", "Exception in action \"" + actionName + "\": " + e.what());
        return ErrorManager::report("ERR_ACTION_EXCEPTION", e.what());
    }
}
