#include <gtest/gtest.h>

#include "actions/action_dispatcher.hpp"
#include "actions/action_helpers.hpp"
#include "devices/device_resolver.hpp"
#include "fakes.hpp"
#include "time_parse.hpp"
#include "timers.hpp"

using nlohmann::json;

class DispatcherTest : public ::testing::Test {
protected:
    DispatcherTest()
        : backend({
              makeDevice("light.office_lamp", "Office Lamp", true),
              makeDevice("light.office_ceiling", "Office Ceiling", false),
              makeDevice("light.kitchen", "Kitchen Light", false),
          }),
          resolver(backend) {}

    ActionDispatcher makeDispatcher() {
        ActionContext ctx{ timers };
        ctx.devices  = &resolver;
        ctx.tasks    = &store;
        ctx.calendar = &store;
        ctx.search   = &search;
        return ActionDispatcher(ctx);
    }

    TimerRegistry timers;
    FakeDeviceBackend backend;
    DeviceResolver resolver;
    FakeRecordStore store;
    FakeSearch search;
};

// ------------------------------------------------------------
// Envelope
// ------------------------------------------------------------
TEST_F(DispatcherTest, UnknownActionSaysSo) {
    auto d = makeDispatcher();
    auto r = d.dispatch("fly_to_moon", json::object());

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Unknown function: fly_to_moon");
    EXPECT_TRUE(r.data.is_null());
    EXPECT_EQ(r.errorCode, "ERR_UNKNOWN_ACTION");
}

TEST_F(DispatcherTest, CatalogIsFullyRegistered) {
    auto d = makeDispatcher();
    EXPECT_EQ(ActionDispatcher::catalog().size(), 7u);
    for (const auto& name : ActionDispatcher::catalog()) {
        EXPECT_TRUE(d.hasAction(name)) << name;
    }
}

TEST_F(DispatcherTest, NonObjectParametersRejected) {
    auto d = makeDispatcher();
    auto r = d.dispatch("add_task", json::array({"milk"}));

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_INVALID_PARAMS");
    EXPECT_EQ(store.addTaskCalls, 0);
}

TEST_F(DispatcherTest, NullParametersActAsEmpty) {
    auto d = makeDispatcher();
    auto r = d.dispatch("get_system_info", nullptr);
    EXPECT_TRUE(r.success);
}

TEST_F(DispatcherTest, HandlerExceptionBecomesFailure) {
    store.throwOnAdd = true;
    auto d = makeDispatcher();

    auto r = d.dispatch("add_task", {{"text", "Buy milk"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Error: disk full");
    EXPECT_TRUE(r.data.is_null());
}

TEST_F(DispatcherTest, InvalidUtf8ParameterDoesNotEscape) {
    auto d = makeDispatcher();

    ActionResult r;
    EXPECT_NO_THROW(r = d.dispatch("add_task", {{"text", "buy \xff milk"}}));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(store.addTaskCalls, 1);
}

TEST_F(DispatcherTest, RequestOverload) {
    auto d = makeDispatcher();
    ActionRequest req{ "add_task", {{"text", "Call mom"}} };
    EXPECT_TRUE(d.dispatch(req).success);
}

// ------------------------------------------------------------
// Lights
// ------------------------------------------------------------
TEST_F(DispatcherTest, LightsOffInRoom) {
    auto d = makeDispatcher();
    auto r = d.dispatch("control_light", {{"action", "off"}, {"device_name", "office"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Turned off Office Lamp, Turned off Office Ceiling");
    EXPECT_EQ(r.data["device"], "office");
    EXPECT_EQ(r.data["action"], "off");
    EXPECT_EQ(r.data["targets"], json::array({"Office Lamp", "Office Ceiling"}));
}

TEST_F(DispatcherTest, LightsDefaultToToggleEverything) {
    auto d = makeDispatcher();
    auto r = d.dispatch("control_light", json::object());

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.data["action"], "toggle");
    EXPECT_EQ(r.data["targets"].size(), 3u);
}

TEST_F(DispatcherTest, LightsPartialFailureNamesOnlySuccesses) {
    backend.failing.insert("light.office_ceiling");
    auto d = makeDispatcher();

    auto r = d.dispatch("control_light", {{"action", "on"}, {"device_name", "office"}});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Turned on Office Lamp");
}

TEST_F(DispatcherTest, LightsAllFail) {
    backend.failing = {"light.office_lamp", "light.office_ceiling"};
    auto d = makeDispatcher();

    auto r = d.dispatch("control_light", {{"action", "on"}, {"device_name", "office"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Failed to control any devices");
}

TEST_F(DispatcherTest, LightsUnknownDevice) {
    auto d = makeDispatcher();
    auto r = d.dispatch("control_light", {{"action", "on"}, {"device_name", "attic"}});

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Device 'attic' not found");
    EXPECT_EQ(backend.discoverCalls.load(), 2);
}

TEST_F(DispatcherTest, LightsDimAcceptsStringBrightness) {
    auto d = makeDispatcher();
    auto r = d.dispatch("control_light",
                        {{"action", "dim"}, {"device_name", "kitchen"}, {"brightness", "40"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Set brightness to 40% for Kitchen Light");
}

TEST_F(DispatcherTest, LightsColor) {
    auto d = makeDispatcher();
    auto r = d.dispatch("control_light",
                        {{"action", "on"}, {"device_name", "kitchen"}, {"color", "Red"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Set color to red for Kitchen Light");
}

TEST_F(DispatcherTest, LightsDiscoveryFailure) {
    backend.throwOnDiscover = true;
    auto d = makeDispatcher();

    auto r = d.dispatch("control_light", {{"action", "on"}, {"device_name", "kitchen"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Light control failed: network unreachable");
}

TEST_F(DispatcherTest, LightsWithoutResolver) {
    ActionContext ctx{ timers };
    ActionDispatcher d(ctx);

    auto r = d.dispatch("control_light", {{"action", "on"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_DEVICES_UNAVAILABLE");
}

// ------------------------------------------------------------
// Timers
// ------------------------------------------------------------
TEST_F(DispatcherTest, TimerSet) {
    auto d = makeDispatcher();
    auto r = d.dispatch("set_timer", {{"duration", "10 minutes"}, {"label", "Tea"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Timer 'Tea' set for 10 minutes");
    EXPECT_EQ(r.data["seconds"], 600);
    EXPECT_EQ(r.data["label"], "Tea");

    auto active = timers.listActive();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].label, "Tea");
}

TEST_F(DispatcherTest, TimerNumericDurationIsMinutes) {
    auto d = makeDispatcher();
    auto r = d.dispatch("set_timer", {{"duration", 5}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.data["seconds"], 300);
    EXPECT_EQ(r.data["label"], "Timer");
}

TEST_F(DispatcherTest, TimerInvalidDuration) {
    auto d = makeDispatcher();
    auto r = d.dispatch("set_timer", {{"duration", "soon"}});

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Invalid duration: soon");
    EXPECT_TRUE(timers.listActive().empty());
}

// ------------------------------------------------------------
// Planner
// ------------------------------------------------------------
TEST_F(DispatcherTest, AlarmDefaultLabel) {
    auto d = makeDispatcher();
    auto r = d.dispatch("set_alarm", {{"time", "7am"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Alarm set for 07:00");
    EXPECT_EQ(r.data["time"], "07:00");
    EXPECT_EQ(r.data["label"], "Alarm");
    EXPECT_FALSE(r.data["id"].get<std::string>().empty());
}

TEST_F(DispatcherTest, AlarmCustomLabel) {
    auto d = makeDispatcher();
    auto r = d.dispatch("set_alarm", {{"time", "6:45 pm"}, {"label", "Gym"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Alarm set for 18:45 (Gym)");
}

TEST_F(DispatcherTest, AlarmNeedsTime) {
    auto d = makeDispatcher();
    auto r = d.dispatch("set_alarm", json::object());

    EXPECT_FALSE(r.success);
    EXPECT_TRUE(store.alarms.empty());
}

TEST_F(DispatcherTest, CalendarEventComputesEnd) {
    auto d = makeDispatcher();
    auto r = d.dispatch("create_calendar_event",
                        {{"title", "Dentist"}, {"date", "2030-05-01"}, {"time", "3pm"}, {"duration", 30}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Created event 'Dentist' on 2030-05-01 at 3pm");
    ASSERT_EQ(store.events.size(), 1u);
    EXPECT_EQ(store.events[0].start_time, "2030-05-01 15:00:00");
    EXPECT_EQ(store.events[0].end_time, "2030-05-01 15:30:00");
    EXPECT_EQ(r.data["title"], "Dentist");
}

TEST_F(DispatcherTest, CalendarEventDefaults) {
    auto d = makeDispatcher();
    auto r = d.dispatch("create_calendar_event", json::object());

    ASSERT_TRUE(r.success);
    const std::string today = timeparse::formatDate(timeparse::localToday());
    ASSERT_EQ(store.events.size(), 1u);
    EXPECT_EQ(store.events[0].title, "Event");
    EXPECT_EQ(store.events[0].start_time, today + " 09:00:00");
    EXPECT_EQ(store.events[0].end_time, today + " 10:00:00");
    EXPECT_EQ(r.message, "Created event 'Event' on today at 09:00");
}

TEST_F(DispatcherTest, CalendarUnparseableTimeGivesZeroLength) {
    auto d = makeDispatcher();
    auto r = d.dispatch("create_calendar_event", {{"date", "2030-05-01"}, {"time", "noon"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(store.events[0].start_time, store.events[0].end_time);
}

TEST_F(DispatcherTest, CalendarStoreRejects) {
    store.rejectWrites = true;
    auto d = makeDispatcher();

    auto r = d.dispatch("create_calendar_event", {{"title", "Dentist"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Failed to create event");
}

TEST_F(DispatcherTest, TaskAdded) {
    auto d = makeDispatcher();
    auto r = d.dispatch("add_task", {{"text", "Buy milk"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Added task: Buy milk");
    EXPECT_EQ(r.data["text"], "Buy milk");
    EXPECT_EQ(r.data["completed"], false);
}

TEST_F(DispatcherTest, EmptyTaskNeverReachesStore) {
    auto d = makeDispatcher();
    auto r = d.dispatch("add_task", {{"text", "   "}});

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "No task text provided");
    EXPECT_EQ(store.addTaskCalls, 0);
}

TEST_F(DispatcherTest, TaskWithoutStore) {
    ActionContext ctx{ timers };
    ActionDispatcher d(ctx);

    auto r = d.dispatch("add_task", {{"text", "Buy milk"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Task manager not available");
}

// ------------------------------------------------------------
// Search
// ------------------------------------------------------------
TEST_F(DispatcherTest, SearchKeepsTopThree) {
    for (int i = 0; i < 5; ++i) {
        search.hits.push_back({ "Title " + std::to_string(i), std::string(500, 'x'),
                                "https://example.com/" + std::to_string(i) });
    }
    auto d = makeDispatcher();
    auto r = d.dispatch("web_search", {{"query", "cats"}});

    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.message, "Found 5 results for 'cats'");
    EXPECT_EQ(r.data["query"], "cats");
    ASSERT_EQ(r.data["results"].size(), 3u);
    EXPECT_EQ(r.data["results"][0]["body"].get<std::string>().size(), 200u);
    EXPECT_EQ(r.data["results"][2]["url"], "https://example.com/2");
}

TEST_F(DispatcherTest, SearchNoHitsIsStillSuccess) {
    auto d = makeDispatcher();
    auto r = d.dispatch("web_search", {{"query", "zzqx"}});

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "No results found for 'zzqx'");
    EXPECT_TRUE(r.data.is_null());
}

TEST_F(DispatcherTest, SearchFailure) {
    search.throwOnSearch = true;
    auto d = makeDispatcher();

    auto r = d.dispatch("web_search", {{"query", "cats"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "Search failed: rate limited");
}

TEST_F(DispatcherTest, SearchNeedsQuery) {
    auto d = makeDispatcher();
    auto r = d.dispatch("web_search", json::object());

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "No search query provided");
    EXPECT_TRUE(search.lastQuery.empty());
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
TEST(ActionHelpers, LooseParameterTypes) {
    json p = {{"n", "42"}, {"f", 7.9}, {"s", 12}, {"bad", "abc"}, {"nil", nullptr}};

    EXPECT_EQ(optionalInt(p, "n"), 42);
    EXPECT_EQ(optionalInt(p, "f"), 7);
    EXPECT_FALSE(optionalInt(p, "bad").has_value());
    EXPECT_FALSE(optionalInt(p, "nil").has_value());
    EXPECT_EQ(paramInt(p, "missing", 60), 60);

    EXPECT_EQ(paramString(p, "s"), "12");
    EXPECT_EQ(paramString(p, "nil", "fallback"), "fallback");
}

TEST(ActionHelpers, TruncateKeepsUtf8Whole) {
    const std::string text = "caf\xC3\xA9";   // "café", é is two bytes
    EXPECT_EQ(truncateUtf8(text, 4), "caf");
    EXPECT_EQ(truncateUtf8(text, 5), text);
    EXPECT_EQ(truncateUtf8("hello", 3), "hel");
}

TEST(ActionHelpers, TrimAndJoin) {
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(joinStrings({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(toLower("OfFiCe"), "office");
}
