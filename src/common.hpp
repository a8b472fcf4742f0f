#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

#ifndef TASKAGENT_VERSION
#define TASKAGENT_VERSION "0.0.0"
#endif

enum TaskStatus { TASK_PENDING = 1, TASK_COMPLETED = 2 };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

struct Task {
    int64_t id = 0;
    std::string title;
    std::string description;
    std::string created_at;
    std::optional<std::string> completed_at;
    TaskStatus status = TASK_PENDING;
};

// One task as reported by the external provider.
struct RemoteTask {
    std::string id;
    std::string title;
    std::string description;
    bool completed = false;
    std::string created_at;
};

struct DailySummary {
    int64_t id = 0;
    std::string date;
    std::string summary;
    int tasks_completed = 0;
    std::string created_at;
};

struct SyncResult {
    int imported = 0;
    int updated = 0;
    int deleted = 0;
    bool skipped = false;

    int Total() const {
        return imported + updated + deleted;
    }
};

struct DetectResult {
    std::vector<RemoteTask> net_new;
    int imported = 0;
    bool skipped = false;
};

const char *TaskStatusName(TaskStatus status);
bool ParseTaskStatus(const std::string &name, TaskStatus &out);

// Local wall-clock helpers. Timestamps are "YYYY-MM-DDTHH:MM:SS", dates "YYYY-MM-DD".
std::string FormatLocalTime(std::time_t t, const char *fmt);
std::string NowTimestamp();
std::string TodayDate();

// Converts an ISO-8601 timestamp (optionally with fraction and Z/offset) to a local
// timestamp. Returns fallback when raw cannot be parsed.
std::string NormalizeTimestamp(const std::string &raw, const std::string &fallback);
