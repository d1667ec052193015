#pragma once
#include "action_dispatcher.hpp"

ActionResult actWebSearch(ActionContext& ctx, const nlohmann::json& params);
