#include <gtest/gtest.h>

#include "store/record_store.hpp"

#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;

class RecordStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("lia_store_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        path = dir / "records.json";
    }
    void TearDown() override { fs::remove_all(dir); }

    fs::path dir;
    fs::path path;
};

TEST(Uuid, VersionFourFormat) {
    static const std::regex pattern(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(std::regex_match(generateUuid(), pattern));
    }
    EXPECT_NE(generateUuid(), generateUuid());
}

TEST_F(RecordStoreTest, TasksPersistAcrossInstances) {
    std::string id;
    {
        JsonRecordStore store(path);
        auto task = store.addTask("Buy milk");
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->text, "Buy milk");
        EXPECT_FALSE(task->completed);
        id = task->id;
    }

    JsonRecordStore reopened(path);
    auto tasks = reopened.listTasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].id, id);
}

TEST_F(RecordStoreTest, CompleteAndDeleteTask) {
    JsonRecordStore store(path);
    auto task = store.addTask("Call mom");
    ASSERT_TRUE(task.has_value());

    EXPECT_TRUE(store.setTaskCompleted(task->id, true));
    EXPECT_TRUE(store.listTasks()[0].completed);
    EXPECT_FALSE(store.setTaskCompleted("missing", true));

    EXPECT_TRUE(store.deleteTask(task->id));
    EXPECT_FALSE(store.deleteTask(task->id));
    EXPECT_TRUE(store.listTasks().empty());
}

TEST_F(RecordStoreTest, AlarmsSortedByTime) {
    JsonRecordStore store(path);
    store.addAlarm("09:30", "Late");
    auto early = store.addAlarm("06:00", "Early");
    ASSERT_TRUE(early.has_value());

    auto alarms = store.listAlarms();
    ASSERT_EQ(alarms.size(), 2u);
    EXPECT_EQ(alarms[0].label, "Early");
    EXPECT_TRUE(alarms[0].enabled);

    EXPECT_TRUE(store.deleteAlarm(early->id));
    EXPECT_EQ(store.listAlarms().size(), 1u);
}

TEST_F(RecordStoreTest, EventsFilteredByDay) {
    JsonRecordStore store(path);
    store.addEvent("Lunch", "2030-05-01 12:00:00", "2030-05-01 13:00:00");
    store.addEvent("Standup", "2030-05-01 09:00:00", "2030-05-01 09:15:00");
    store.addEvent("Other day", "2030-05-02 09:00:00", "2030-05-02 10:00:00", "HOME", "notes");

    auto day = store.eventsOn("2030-05-01");
    ASSERT_EQ(day.size(), 2u);
    EXPECT_EQ(day[0].title, "Standup");
    EXPECT_EQ(day[1].title, "Lunch");
    EXPECT_EQ(day[0].category, "WORK");

    auto other = store.eventsOn("2030-05-02");
    ASSERT_EQ(other.size(), 1u);
    EXPECT_EQ(other[0].category, "HOME");
    EXPECT_TRUE(store.deleteEvent(other[0].id));
    EXPECT_TRUE(store.eventsOn("2030-05-02").empty());
}

TEST_F(RecordStoreTest, CorruptFileStartsEmpty) {
    std::ofstream(path) << "{ not json";
    JsonRecordStore store(path);
    EXPECT_TRUE(store.listTasks().empty());

    // Next write replaces the broken file
    ASSERT_TRUE(store.addTask("Fresh start").has_value());
    JsonRecordStore reopened(path);
    EXPECT_EQ(reopened.listTasks().size(), 1u);
}

TEST_F(RecordStoreTest, FileIsPlainJson) {
    {
        JsonRecordStore store(path);
        store.addTask("Inspect me");
    }
    std::ifstream in(path);
    nlohmann::json doc;
    in >> doc;
    ASSERT_TRUE(doc.contains("tasks"));
    EXPECT_EQ(doc["tasks"][0]["text"], "Inspect me");
    EXPECT_TRUE(doc["alarms"].is_array());
    EXPECT_TRUE(doc["events"].is_array());
}
