#include <gtest/gtest.h>

#include <ctime>

#include "common.hpp"
#include "summary.hpp"
#include "weather.hpp"

TEST(Timestamps, LocalTimestampPassesThrough) {
    EXPECT_EQ(NormalizeTimestamp("2024-01-02T10:00:00", "x"), "2024-01-02T10:00:00");
    EXPECT_EQ(NormalizeTimestamp("2024-01-02T10:00:00.123456", "x"), "2024-01-02T10:00:00");
    EXPECT_EQ(NormalizeTimestamp("2024-01-02", "x"), "2024-01-02T00:00:00");
}

TEST(Timestamps, UtcIsConvertedToLocal) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = 2;
    tm.tm_hour = 10;
    const std::time_t utc = timegm(&tm);
    const std::string expected = FormatLocalTime(utc, "%Y-%m-%dT%H:%M:%S");

    EXPECT_EQ(NormalizeTimestamp("2024-01-02T10:00:00Z", "x"), expected);
    EXPECT_EQ(NormalizeTimestamp("2024-01-02T10:00:00.5Z", "x"), expected);
    EXPECT_EQ(NormalizeTimestamp("2024-01-02T12:00:00+02:00", "x"), expected);
}

TEST(Timestamps, OffsetWithoutColonKeepsMinutes) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = 2;
    tm.tm_hour = 10;
    const std::string expected = FormatLocalTime(timegm(&tm), "%Y-%m-%dT%H:%M:%S");

    EXPECT_EQ(NormalizeTimestamp("2024-01-02T15:30:00+0530", "x"), expected);
    EXPECT_EQ(NormalizeTimestamp("2024-01-02T15:30:00+05:30", "x"), expected);
    EXPECT_EQ(NormalizeTimestamp("2024-01-02T04:30:00-0530", "x"), expected);
}

TEST(Timestamps, OutOfRangeDayRollsOver) {
    EXPECT_EQ(NormalizeTimestamp("2024-02-31T08:00:00", "x"), "2024-03-02T08:00:00");
    EXPECT_EQ(NormalizeTimestamp("2023-04-31", "x"), "2023-05-01T00:00:00");
}

TEST(Timestamps, GarbageFallsBack) {
    EXPECT_EQ(NormalizeTimestamp("", "fallback"), "fallback");
    EXPECT_EQ(NormalizeTimestamp("yesterday", "fallback"), "fallback");
    EXPECT_EQ(NormalizeTimestamp("2024-13-01T00:00:00", "fallback"), "fallback");
}

TEST(TaskStatusNames, RoundTrip) {
    TaskStatus status = TASK_PENDING;
    EXPECT_TRUE(ParseTaskStatus("completed", status));
    EXPECT_EQ(status, TASK_COMPLETED);
    EXPECT_STREQ(TaskStatusName(status), "completed");
    EXPECT_FALSE(ParseTaskStatus("done", status));
}

TEST(SummaryText, ListsCompletedTasks) {
    TodaySummary summary;
    summary.date = "2024-05-01";
    summary.created_today = 2;
    summary.pending_count = 4;
    Task task;
    task.title = "Ship release";
    summary.completed_tasks.push_back(task);
    summary.completed_today = 1;

    const std::string text = FormatSummary(summary);
    EXPECT_NE(text.find("2024-05-01"), std::string::npos);
    EXPECT_NE(text.find("Completed: 1"), std::string::npos);
    EXPECT_NE(text.find("Created: 2"), std::string::npos);
    EXPECT_NE(text.find("Pending: 4"), std::string::npos);
    EXPECT_NE(text.find("1. Ship release"), std::string::npos);
}

TEST(SummaryText, NothingCompleted) {
    TodaySummary summary;
    summary.date = "2024-05-01";
    EXPECT_NE(FormatSummary(summary).find("No tasks were completed today."), std::string::npos);
}

TEST(WeatherReport, FormatsWttrPayload) {
    Weather weather;
    const nlohmann::json payload = nlohmann::json::parse(R"({
        "current_condition": [{"temp_C": "21", "FeelsLikeC": "20", "humidity": "55",
                               "windspeedKmph": "9", "weatherDesc": [{"value": "Sunny"}]}]
    })");
    const std::string text = weather.FormatReport("Paris", payload);
    EXPECT_NE(text.find("Weather in Paris"), std::string::npos);
    EXPECT_NE(text.find("21°C"), std::string::npos);
    EXPECT_NE(text.find("Sunny"), std::string::npos);

    EXPECT_THROW(weather.FormatReport("Paris", nlohmann::json::object()), std::runtime_error);
    EXPECT_NE(weather.DemoReport("Paris", "offline").find("Demo weather"), std::string::npos);
}
