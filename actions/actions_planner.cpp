#include "actions_planner.hpp"
#include "action_helpers.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "store/record_store.hpp"
#include "time_parse.hpp"

// ------------------------------------------------------------
// [Alarm] time is normalized to HH:MM when it looks like a clock time
// ------------------------------------------------------------
ActionResult actSetAlarm(ActionContext& ctx, const nlohmann::json& params) {
    const std::string timeText = trim(paramString(params, "time"));
    std::string label = trim(paramString(params, "label", "Alarm"));
    if (label.empty()) label = "Alarm";

    if (timeText.empty()) {
        return ErrorManager::report("ERR_ALARM_NO_TIME");
    }
    if (!ctx.tasks) {
        return ErrorManager::report("ERR_TASKS_UNAVAILABLE");
    }

    const std::string normalized = timeparse::normalizeTime(timeText);
    auto alarm = ctx.tasks->addAlarm(normalized, label);
    if (!alarm) {
        return ErrorManager::report("ERR_ALARM_FAILED");
    }

    std::string message = "Alarm set for " + normalized;
    if (label != "Alarm") message += " (" + label + ")";

    return actionOk(message, {
        {"id", alarm->id},
        {"time", alarm->time},
        {"label", alarm->label}
    });
}

// ------------------------------------------------------------
// [Calendar] start = date + time, end = start + duration minutes
// ------------------------------------------------------------
ActionResult actCreateCalendarEvent(ActionContext& ctx, const nlohmann::json& params) {
    if (!ctx.calendar) {
        return ErrorManager::report("ERR_CALENDAR_UNAVAILABLE");
    }

    std::string title = trim(paramString(params, "title", "Event"));
    if (title.empty()) title = "Event";
    const std::string dateText = trim(paramString(params, "date", "today"));
    const std::string timeText = trim(paramString(params, "time", "09:00"));
    const int duration         = paramInt(params, "duration", 60);

    const std::string day   = timeparse::parseDate(dateText);
    const std::string clock = timeText.empty() ? "09:00" : timeparse::normalizeTime(timeText);
    const std::string start = day + " " + clock + ":00";

    // Unparseable clock text leaves a zero-length event
    const std::string end = timeparse::addMinutes(start, duration).value_or(start);

    LOG_DEBUG("Calendar", "\"" + title + "\" " + start + " -> " + end);

    auto event = ctx.calendar->addEvent(title, start, end);
    if (!event) {
        return ErrorManager::report("ERR_CALENDAR_FAILED");
    }

    std::string message = "Created event '" + title + "' on " + dateText;
    if (!timeText.empty()) message += " at " + timeText;

    return actionOk(message, *event);
}

// ------------------------------------------------------------
// [Tasks]
// ------------------------------------------------------------
ActionResult actAddTask(ActionContext& ctx, const nlohmann::json& params) {
    const std::string text = trim(paramString(params, "text"));

    if (text.empty()) {
        return ErrorManager::report("ERR_TASK_NO_TEXT");
    }
    if (!ctx.tasks) {
        return ErrorManager::report("ERR_TASKS_UNAVAILABLE");
    }

    auto task = ctx.tasks->addTask(text);
    if (!task) {
        return ErrorManager::report("ERR_TASK_FAILED");
    }
    return actionOk("Added task: " + text, *task);
}
