#include <gtest/gtest.h>

#include "settings.hpp"
#include "todoist.hpp"

TEST(Todoist, ConfiguredFollowsSettings) {
    Settings settings;
    Todoist todoist(settings);
    EXPECT_FALSE(todoist.IsConfigured());
    settings.SetTodoistToken("token");
    EXPECT_TRUE(todoist.IsConfigured());
}

TEST(Todoist, FetchWithoutTokenThrows) {
    Settings settings;
    Todoist todoist(settings);
    EXPECT_THROW(todoist.FetchTasks(), TaskSourceError);
}

TEST(Todoist, ParsesRestPayload) {
    Settings settings;
    Todoist todoist(settings);

    const nlohmann::json payload = nlohmann::json::parse(R"([
        {"id": "2995104339", "content": "Buy milk", "description": "2 liters",
         "is_completed": false, "created_at": "2024-01-02T10:00:00"},
        {"id": 77, "content": "Numeric id", "description": null, "is_completed": true,
         "created_at": "not a date"},
        "junk"
    ])");

    std::vector<RemoteTask> tasks = todoist.ParseTasks(payload);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].id, "2995104339");
    EXPECT_EQ(tasks[0].title, "Buy milk");
    EXPECT_EQ(tasks[0].description, "2 liters");
    EXPECT_FALSE(tasks[0].completed);
    EXPECT_EQ(tasks[0].created_at, "2024-01-02T10:00:00");

    EXPECT_EQ(tasks[1].id, "77");
    EXPECT_EQ(tasks[1].description, "");
    EXPECT_TRUE(tasks[1].completed);
    EXPECT_EQ(tasks[1].created_at.size(), 19u);
}

TEST(Todoist, NonArrayPayloadThrows) {
    Settings settings;
    Todoist todoist(settings);
    EXPECT_THROW(todoist.ParseTasks(nlohmann::json::object()), TaskSourceError);
}
