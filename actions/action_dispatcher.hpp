#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "action_result.hpp"

class TimerRegistry;
class DeviceResolver;
class TaskStore;
class CalendarStore;
class SearchBackend;
class SystemSnapshotAggregator;

// ------------------------------------------------------------
// ActionContext: the collaborators handlers may touch.
// Only the timer registry is mandatory; a null collaborator
// makes the actions that need it report "not available".
// ------------------------------------------------------------
struct ActionContext {
    TimerRegistry& timers;
    DeviceResolver* devices = nullptr;
    TaskStore* tasks = nullptr;
    CalendarStore* calendar = nullptr;
    SearchBackend* search = nullptr;
    SystemSnapshotAggregator* snapshot = nullptr;
    int searchMaxResults = 5;
};

// ------------------------------------------------------------
// Function pointer type for actions
// ------------------------------------------------------------
using ActionFunc = ActionResult(*)(ActionContext& ctx, const nlohmann::json& params);

/// ActionDispatcher
/// Fixed table from action name to handler. dispatch() never throws:
/// unknown names, bad parameters and handler exceptions all come back
/// as a failed ActionResult.
class ActionDispatcher {
public:
    explicit ActionDispatcher(ActionContext context);

    ActionResult dispatch(const std::string& actionName, const nlohmann::json& parameters);
    ActionResult dispatch(const ActionRequest& request);

    bool hasAction(const std::string& actionName) const;

    // Every action name the assistant understands, in catalog order
    static const std::vector<std::string>& catalog();

private:
    ActionContext ctx_;
    std::unordered_map<std::string, ActionFunc> table_;
};
