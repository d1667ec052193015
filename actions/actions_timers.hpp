#pragma once
#include "action_dispatcher.hpp"

ActionResult actSetTimer(ActionContext& ctx, const nlohmann::json& params);
