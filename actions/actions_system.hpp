#pragma once
#include "action_dispatcher.hpp"

ActionResult actGetSystemInfo(ActionContext& ctx, const nlohmann::json& params);
