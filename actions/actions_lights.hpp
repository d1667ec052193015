#pragma once
#include "action_dispatcher.hpp"

// control_light: on / off / dim / toggle / color on a fuzzy device phrase
ActionResult actControlLight(ActionContext& ctx, const nlohmann::json& params);
