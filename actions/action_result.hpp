#pragma once
#include <string>
#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// ActionResult: uniform return envelope for every action
// ------------------------------------------------------------
struct ActionResult {
    bool success = false;       // true if the action took effect
    std::string message;        // user-facing text
    nlohmann::json data;        // structured payload (null when absent)
    std::string errorCode;      // ErrorManager key, "ERR_NONE" on success
};

// ------------------------------------------------------------
// ActionRequest: action name + loosely typed parameters
// ------------------------------------------------------------
struct ActionRequest {
    std::string actionName;
    nlohmann::json parameters = nlohmann::json::object();
};

inline ActionResult actionOk(const std::string& message,
                             nlohmann::json data = nullptr) {
    return { true, message, std::move(data), "ERR_NONE" };
}
