#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// Records
// ------------------------------------------------------------
struct TaskRecord {
    std::string id;
    std::string text;
    bool completed = false;
    std::string created_at;     // "YYYY-MM-DD HH:MM:SS"
};

struct AlarmRecord {
    std::string id;
    std::string time;           // "HH:MM"
    std::string label;
    bool enabled = true;
};

struct EventRecord {
    std::string id;
    std::string title;
    std::string start_time;     // "YYYY-MM-DD HH:MM:SS"
    std::string end_time;
    std::string category = "WORK";
    std::string description;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TaskRecord, id, text, completed, created_at)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AlarmRecord, id, time, label, enabled)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(EventRecord, id, title, start_time, end_time, category, description)

// ------------------------------------------------------------
// Collaborator interfaces
// ------------------------------------------------------------
class TaskStore {
public:
    virtual ~TaskStore() = default;

    virtual std::optional<TaskRecord> addTask(const std::string& text) = 0;
    virtual std::vector<TaskRecord> listTasks() = 0;
    virtual bool setTaskCompleted(const std::string& id, bool completed) = 0;
    virtual bool deleteTask(const std::string& id) = 0;

    virtual std::optional<AlarmRecord> addAlarm(const std::string& time, const std::string& label) = 0;
    virtual std::vector<AlarmRecord> listAlarms() = 0;
    virtual bool deleteAlarm(const std::string& id) = 0;
};

class CalendarStore {
public:
    virtual ~CalendarStore() = default;

    virtual std::optional<EventRecord> addEvent(const std::string& title,
                                                const std::string& start,
                                                const std::string& end,
                                                const std::string& category = "WORK",
                                                const std::string& description = "") = 0;
    // Events starting on date (YYYY-MM-DD), ordered by start time
    virtual std::vector<EventRecord> eventsOn(const std::string& date) = 0;
    virtual bool deleteEvent(const std::string& id) = 0;
};

// Random RFC 4122 version 4 identifier
std::string generateUuid();

/// JsonRecordStore
/// Tasks, alarms and events in one JSON document on disk.
/// Every mutation rewrites the file (temp file + rename).
class JsonRecordStore : public TaskStore, public CalendarStore {
public:
    explicit JsonRecordStore(std::filesystem::path path);

    std::optional<TaskRecord> addTask(const std::string& text) override;
    std::vector<TaskRecord> listTasks() override;
    bool setTaskCompleted(const std::string& id, bool completed) override;
    bool deleteTask(const std::string& id) override;

    std::optional<AlarmRecord> addAlarm(const std::string& time, const std::string& label) override;
    std::vector<AlarmRecord> listAlarms() override;
    bool deleteAlarm(const std::string& id) override;

    std::optional<EventRecord> addEvent(const std::string& title,
                                        const std::string& start,
                                        const std::string& end,
                                        const std::string& category = "WORK",
                                        const std::string& description = "") override;
    std::vector<EventRecord> eventsOn(const std::string& date) override;
    bool deleteEvent(const std::string& id) override;

private:
    void loadLocked();
    bool saveLocked();

    std::filesystem::path path_;
    std::mutex mutex_;
    std::vector<TaskRecord> tasks_;
    std::vector<AlarmRecord> alarms_;
    std::vector<EventRecord> events_;
};
