#include "summary.hpp"

#include <spdlog/fmt/fmt.h>

// ─────────────────────────────────────
TodaySummary BuildSummary(SQLite &db, const std::string &date) {
    TodaySummary summary;
    summary.date = date;
    summary.created_today = db.CountCreatedOn(date);
    summary.completed_tasks = db.SelectCompletedOn(date);
    summary.completed_today = static_cast<int>(summary.completed_tasks.size());
    summary.pending_count = db.CountPending();
    return summary;
}

// ─────────────────────────────────────
std::string FormatSummary(const TodaySummary &summary) {
    std::string text = fmt::format("Summary for {}\n\n", summary.date);
    text += fmt::format("Completed: {}\n", summary.completed_today);
    text += fmt::format("Created: {}\n", summary.created_today);
    text += fmt::format("Pending: {}\n\n", summary.pending_count);

    if (summary.completed_tasks.empty()) {
        text += "No tasks were completed today.\n";
        return text;
    }

    text += "Completed tasks:\n";
    int i = 1;
    for (const Task &task : summary.completed_tasks) {
        text += fmt::format("{}. {}\n", i++, task.title);
    }
    return text;
}
