#pragma once
#include "action_dispatcher.hpp"

// Alarms, calendar events and tasks (record store backed)
ActionResult actSetAlarm(ActionContext& ctx, const nlohmann::json& params);
ActionResult actCreateCalendarEvent(ActionContext& ctx, const nlohmann::json& params);
ActionResult actAddTask(ActionContext& ctx, const nlohmann::json& params);
