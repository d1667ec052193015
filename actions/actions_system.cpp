#include "actions_system.hpp"
#include "system_snapshot.hpp"

// ------------------------------------------------------------
// [System] aggregate status, always succeeds
// ------------------------------------------------------------
ActionResult actGetSystemInfo(ActionContext& ctx, const nlohmann::json&) {
    if (ctx.snapshot) {
        return actionOk("System info retrieved", ctx.snapshot->snapshot());
    }

    SnapshotSources sources;
    sources.timers   = &ctx.timers;
    sources.tasks    = ctx.tasks;
    sources.calendar = ctx.calendar;
    sources.devices  = ctx.devices;

    SystemSnapshotAggregator local(sources);
    return actionOk("System info retrieved", local.snapshot());
}
