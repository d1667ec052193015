#include "record_store.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
std::string generateUuid() {
    static thread_local std::mt19937_64 gen{ std::random_device{}() };
    std::uniform_int_distribution<std::uint64_t> dist;

    std::uint64_t hi = dist(gen);
    std::uint64_t lo = dist(gen);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // variant 10

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << "-"
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
        << std::setw(4) << (hi & 0xFFFF) << "-"
        << std::setw(4) << (lo >> 48) << "-"
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

static std::string nowTimestamp() {
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

template <typename Record>
static bool eraseById(std::vector<Record>& records, const std::string& id) {
    auto it = std::remove_if(records.begin(), records.end(),
                             [&id](const Record& r) { return r.id == id; });
    if (it == records.end()) return false;
    records.erase(it, records.end());
    return true;
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------
JsonRecordStore::JsonRecordStore(fs::path path) : path_(std::move(path)) {
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked();
}

void JsonRecordStore::loadLocked() {
    std::ifstream f(path_);
    if (!f) {
        LOG_DEBUG("Store", "No " + path_.string() + " yet, starting empty");
        return;
    }

    try {
        nlohmann::json doc;
        f >> doc;
        tasks_  = doc.value("tasks",  nlohmann::json::array()).get<std::vector<TaskRecord>>();
        alarms_ = doc.value("alarms", nlohmann::json::array()).get<std::vector<AlarmRecord>>();
        events_ = doc.value("events", nlohmann::json::array()).get<std::vector<EventRecord>>();
        LOG_PHASE("Records loaded", true);
    } catch (const std::exception& e) {
        LOG_ERROR("Store", "Failed to parse " + path_.string() + ": " + e.what());
        LOG_PHASE("Records load", false);
        tasks_.clear();
        alarms_.clear();
        events_.clear();
    }
}

bool JsonRecordStore::saveLocked() {
    nlohmann::json doc = {
        {"tasks", tasks_},
        {"alarms", alarms_},
        {"events", events_}
    };

    try {
        if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

        fs::path tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                LOG_ERROR("Store", "Cannot write " + tmp.string());
                return false;
            }
            out << doc.dump(2);
        }
        fs::rename(tmp, path_);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Store", "Failed to save " + path_.string() + ": " + e.what());
        return false;
    }
}

// ------------------------------------------------------------
// Tasks
// ------------------------------------------------------------
std::optional<TaskRecord> JsonRecordStore::addTask(const std::string& text) {
    TaskRecord task{ generateUuid(), text, false, nowTimestamp() };

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(task);
    if (!saveLocked()) {
        tasks_.pop_back();
        return std::nullopt;
    }
    return task;
}

std::vector<TaskRecord> JsonRecordStore::listTasks() {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_;
}

bool JsonRecordStore::setTaskCompleted(const std::string& id, bool completed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&id](const TaskRecord& t) { return t.id == id; });
    if (it == tasks_.end()) return false;
    it->completed = completed;
    return saveLocked();
}

bool JsonRecordStore::deleteTask(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return eraseById(tasks_, id) && saveLocked();
}

// ------------------------------------------------------------
// Alarms
// ------------------------------------------------------------
std::optional<AlarmRecord> JsonRecordStore::addAlarm(const std::string& time,
                                                     const std::string& label) {
    AlarmRecord alarm{ generateUuid(), time, label, true };

    std::lock_guard<std::mutex> lock(mutex_);
    alarms_.push_back(alarm);
    if (!saveLocked()) {
        alarms_.pop_back();
        return std::nullopt;
    }
    return alarm;
}

std::vector<AlarmRecord> JsonRecordStore::listAlarms() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = alarms_;
    std::stable_sort(out.begin(), out.end(),
                     [](const AlarmRecord& a, const AlarmRecord& b) { return a.time < b.time; });
    return out;
}

bool JsonRecordStore::deleteAlarm(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return eraseById(alarms_, id) && saveLocked();
}

// ------------------------------------------------------------
// Events
// ------------------------------------------------------------
std::optional<EventRecord> JsonRecordStore::addEvent(const std::string& title,
                                                     const std::string& start,
                                                     const std::string& end,
                                                     const std::string& category,
                                                     const std::string& description) {
    EventRecord ev{ generateUuid(), title, start, end, category, description };

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(ev);
    if (!saveLocked()) {
        events_.pop_back();
        return std::nullopt;
    }
    return ev;
}

std::vector<EventRecord> JsonRecordStore::eventsOn(const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventRecord> out;
    for (const auto& ev : events_) {
        if (ev.start_time.rfind(date, 0) == 0) out.push_back(ev);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const EventRecord& a, const EventRecord& b) { return a.start_time < b.start_time; });
    return out;
}

bool JsonRecordStore::deleteEvent(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return eraseById(events_, id) && saveLocked();
}
