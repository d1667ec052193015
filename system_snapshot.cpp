#include "system_snapshot.hpp"
#include "logger.hpp"
#include "time_parse.hpp"
#include "timers.hpp"
#include "devices/device_resolver.hpp"
#include "services/news.hpp"
#include "services/weather.hpp"
#include "store/record_store.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

using nlohmann::json;

static constexpr std::size_t kSnapshotNewsItems = 5;

static std::string nowString() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

// Runs one collector; a throwing collaborator yields the fallback value
template <typename Fn>
static json collectOr(const char* field, json fallback, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        LOG_ERROR("Snapshot", std::string(field) + " unavailable: " + e.what());
        return fallback;
    }
}

SystemSnapshotAggregator::SystemSnapshotAggregator(SnapshotSources sources)
    : sources_(sources) {}

// ------------------------------------------------------------
// Aggregate
// ------------------------------------------------------------
json SystemSnapshotAggregator::snapshot() {
    json info;
    info["current_time"]   = nowString();
    info["timers"]         = collectOr("timers",   json::array(), [this] { return collectTimers(); });
    info["alarms"]         = collectOr("alarms",   json::array(), [this] { return collectAlarms(); });
    info["calendar_today"] = collectOr("calendar", json::array(), [this] { return collectCalendarToday(); });
    info["tasks"]          = collectOr("tasks",    json::array(), [this] { return collectTasks(); });
    info["smart_devices"]  = collectOr("devices",  json::array(), [this] { return collectDevices(); });
    info["weather"]        = collectOr("weather",  json(nullptr), [this] { return collectWeather(); });
    info["news"]           = collectOr("news",     json::array(), [this] { return collectNews(); });

    LOG_TRACE("Snapshot", "collected " + std::to_string(info["timers"].size()) + " timers, " +
                          std::to_string(info["smart_devices"].size()) + " devices");
    return info;
}

// ------------------------------------------------------------
// Fields
// ------------------------------------------------------------
json SystemSnapshotAggregator::collectTimers() {
    json out = json::array();
    if (!sources_.timers) return out;

    // listActive() drops expired timers
    for (const auto& t : sources_.timers->listActive()) {
        out.push_back({ {"label", t.label}, {"remaining", t.remaining} });
    }
    return out;
}

json SystemSnapshotAggregator::collectAlarms() {
    json out = json::array();
    if (!sources_.tasks) return out;

    for (const auto& a : sources_.tasks->listAlarms()) {
        out.push_back({ {"time", a.time}, {"label", a.label} });
    }
    return out;
}

json SystemSnapshotAggregator::collectCalendarToday() {
    json out = json::array();
    if (!sources_.calendar) return out;

    const std::string today = timeparse::formatDate(timeparse::localToday());
    for (const auto& ev : sources_.calendar->eventsOn(today)) {
        out.push_back({ {"title", ev.title}, {"time", ev.start_time} });
    }
    return out;
}

json SystemSnapshotAggregator::collectTasks() {
    json out = json::array();
    if (!sources_.tasks) return out;

    for (const auto& t : sources_.tasks->listTasks()) {
        out.push_back({ {"text", t.text}, {"completed", t.completed} });
    }
    return out;
}

json SystemSnapshotAggregator::collectDevices() {
    json out = json::array();
    if (!sources_.devices) return out;

    // Cached view only, a status query never triggers discovery
    for (const auto& d : sources_.devices->cachedDevices()) {
        std::string type = "switch";
        if (d.capabilities.colorCapable)  type = "color_light";
        else if (d.capabilities.dimmable) type = "dimmable_light";

        out.push_back({ {"name", d.displayName}, {"is_on", d.isOn}, {"type", type} });
    }
    return out;
}

json SystemSnapshotAggregator::collectWeather() {
    if (!sources_.weather) return nullptr;

    auto report = sources_.weather->current();
    if (!report) return nullptr;

    return {
        {"temp", report->temp},
        {"condition", report->condition},
        {"high", report->high},
        {"low", report->low}
    };
}

json SystemSnapshotAggregator::collectNews() {
    json out = json::array();
    if (!sources_.news) return out;

    for (const auto& item : sources_.news->headlines()) {
        if (out.size() >= kSnapshotNewsItems) break;
        out.push_back({ {"title", item.title}, {"category", item.category}, {"url", item.url} });
    }
    return out;
}
