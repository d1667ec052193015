#include "actions_timers.hpp"
#include "action_helpers.hpp"
#include "error_manager.hpp"
#include "timers.hpp"

// ------------------------------------------------------------
// [Timer] duration is free text ("10 minutes") or a bare number of minutes
// ------------------------------------------------------------
ActionResult actSetTimer(ActionContext& ctx, const nlohmann::json& params) {
    const std::string duration = trim(paramString(params, "duration"));
    std::string label = trim(paramString(params, "label", "Timer"));
    if (label.empty()) label = "Timer";

    auto timer = ctx.timers.setTimer(label, duration);
    if (!timer) {
        return ErrorManager::report("ERR_TIMER_INVALID_DURATION", duration);
    }

    return actionOk("Timer '" + label + "' set for " + duration, {
        {"label", label},
        {"duration", duration},
        {"seconds", timer->durationSeconds}
    });
}
