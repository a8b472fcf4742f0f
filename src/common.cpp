#include "common.hpp"

#include <cstdio>

// ─────────────────────────────────────
const char *TaskStatusName(TaskStatus status) {
    return status == TASK_COMPLETED ? "completed" : "pending";
}

// ─────────────────────────────────────
bool ParseTaskStatus(const std::string &name, TaskStatus &out) {
    if (name == "pending") {
        out = TASK_PENDING;
        return true;
    }
    if (name == "completed") {
        out = TASK_COMPLETED;
        return true;
    }
    return false;
}

// ─────────────────────────────────────
std::string FormatLocalTime(std::time_t t, const char *fmt) {
    std::tm local{};
    localtime_r(&t, &local);
    char buf[64];
    const size_t len = std::strftime(buf, sizeof(buf), fmt, &local);
    return std::string(buf, len);
}

// ─────────────────────────────────────
std::string NowTimestamp() {
    return FormatLocalTime(std::time(nullptr), "%Y-%m-%dT%H:%M:%S");
}

// ─────────────────────────────────────
std::string TodayDate() {
    return FormatLocalTime(std::time(nullptr), "%Y-%m-%d");
}

// ─────────────────────────────────────
std::string NormalizeTimestamp(const std::string &raw, const std::string &fallback) {
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;

    if (raw.size() < 10 || std::sscanf(raw.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3) {
        return fallback;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return fallback;
    }

    std::string rest;
    if (raw.size() >= 19 && (raw[10] == 'T' || raw[10] == ' ')) {
        if (std::sscanf(raw.c_str() + 11, "%2d:%2d:%2d", &hour, &minute, &second) != 3) {
            return fallback;
        }
        rest = raw.substr(19);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    // Skip fractional seconds, then look for a zone designator.
    size_t pos = 0;
    if (!rest.empty() && rest[0] == '.') {
        pos = 1;
        while (pos < rest.size() && rest[pos] >= '0' && rest[pos] <= '9') {
            pos++;
        }
    }

    if (pos >= rest.size()) {
        // No zone: already local time. timegm/gmtime_r only carry overflowing
        // fields forward (Feb 31 becomes Mar 2), no zone is applied.
        std::tm norm{};
        const std::time_t flat = timegm(&tm);
        if (!gmtime_r(&flat, &norm)) {
            return fallback;
        }
        char buf[32];
        const size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &norm);
        return std::string(buf, len);
    }

    long offset = 0;
    const char sign = rest[pos];
    if (sign == '+' || sign == '-') {
        int offHours = 0, offMinutes = 0;
        const bool colon = rest.size() > pos + 3 && rest[pos + 3] == ':';
        if (std::sscanf(rest.c_str() + pos + 1, colon ? "%2d:%2d" : "%2d%2d", &offHours,
                        &offMinutes) < 1) {
            return fallback;
        }
        offset = (offHours * 3600L + offMinutes * 60L) * (sign == '-' ? -1 : 1);
    } else if (sign != 'Z' && sign != 'z') {
        return fallback;
    }

    const std::time_t utc = timegm(&tm) - offset;
    return FormatLocalTime(utc, "%Y-%m-%dT%H:%M:%S");
}
