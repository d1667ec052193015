#pragma once
#include <nlohmann/json.hpp>

class TimerRegistry;
class TaskStore;
class CalendarStore;
class DeviceResolver;
class WeatherFetcher;
class NewsFetcher;

// Collaborators the snapshot reads from. Null pointers are skipped.
struct SnapshotSources {
    TimerRegistry* timers = nullptr;
    TaskStore* tasks = nullptr;
    CalendarStore* calendar = nullptr;
    DeviceResolver* devices = nullptr;
    WeatherFetcher* weather = nullptr;
    NewsFetcher* news = nullptr;
};

/// SystemSnapshotAggregator
/// One read-only view of everything the assistant knows right now.
/// Each field is collected on its own: a collaborator that throws or
/// is missing leaves its field empty (array) or null (weather).
class SystemSnapshotAggregator {
public:
    explicit SystemSnapshotAggregator(SnapshotSources sources);

    nlohmann::json snapshot();

private:
    nlohmann::json collectTimers();
    nlohmann::json collectAlarms();
    nlohmann::json collectCalendarToday();
    nlohmann::json collectTasks();
    nlohmann::json collectDevices();
    nlohmann::json collectWeather();
    nlohmann::json collectNews();

    SnapshotSources sources_;
};
