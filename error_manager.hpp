#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "actions/action_result.hpp"

// ------------------------------------------------------------
// ErrorManager
// Error code → { "user": ..., "debug": ... } catalog.
// A "{}" in the user text is replaced by the detail, otherwise
// the detail is appended as ": <detail>".
// ------------------------------------------------------------
namespace ErrorManager {
    // Built-in catalog (also written out as errors.json by bootstrap)
    nlohmann::json defaults();

    // Merge overrides from errors.json (accepts {"errors": {...}} or a flat object)
    bool load(const std::string& path);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // User text with the detail spliced in
    std::string format(const std::string& code, const std::string& detail = "");

    // Build a failed ActionResult and log the debug message
    ActionResult report(const std::string& code, const std::string& detail = "");
}
