#pragma once

#include <string>
#include <vector>

#include "common.hpp"
#include "sqlite.hpp"

struct TodaySummary {
    std::string date;
    int created_today = 0;
    int completed_today = 0;
    int pending_count = 0;
    std::vector<Task> completed_tasks;
};

TodaySummary BuildSummary(SQLite &db, const std::string &date);
std::string FormatSummary(const TodaySummary &summary);
