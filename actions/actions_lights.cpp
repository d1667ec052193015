#include "actions_lights.hpp"
#include "action_helpers.hpp"
#include "devices/device_resolver.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

// ------------------------------------------------------------
// [Lights] Resolve the phrase, run the command on every match
// ------------------------------------------------------------
ActionResult actControlLight(ActionContext& ctx, const nlohmann::json& params) {
    if (!ctx.devices) {
        return ErrorManager::report("ERR_DEVICES_UNAVAILABLE");
    }

    LightCommand command;
    command.action     = toLower(trim(paramString(params, "action", "toggle")));
    command.brightness = optionalInt(params, "brightness");
    command.color      = optionalString(params, "color");
    if (command.color) command.color = toLower(trim(*command.color));
    if (command.action.empty()) command.action = "toggle";

    std::string deviceName = trim(paramString(params, "device_name", "light"));
    if (deviceName.empty()) deviceName = "light";

    try {
        ResolveOutcome resolved = ctx.devices->resolveTargets(deviceName);
        if (!resolved.errorCode.empty()) {
            const bool named = resolved.errorCode == "ERR_DEVICE_NOT_FOUND";
            return ErrorManager::report(resolved.errorCode, named ? deviceName : "");
        }

        BatchOutcome batch = ctx.devices->applyToAll(resolved.devices, command);
        if (batch.successes.empty()) {
            return ErrorManager::report("ERR_DEVICE_CONTROL_FAILED");
        }

        LOG_DEBUG("Lights", std::to_string(batch.successes.size()) + "/" +
                            std::to_string(batch.targets.size()) + " devices handled");

        return actionOk(joinStrings(batch.successes, ", "), {
            {"device", deviceName},
            {"action", command.action},
            {"targets", batch.targets}
        });
    } catch (const std::exception& e) {
        return ErrorManager::report("ERR_LIGHT_CONTROL", e.what());
    }
}
