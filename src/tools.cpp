#include "tools.hpp"

#include <chrono>
#include <ctime>

#include <spdlog/spdlog.h>

#include "calculator.hpp"
#include "summary.hpp"

namespace {
nlohmann::json Schema(const nlohmann::json &properties, const nlohmann::json &required) {
    return {{"type", "object"}, {"properties", properties}, {"required", required}};
}

ToolResult Ok(const std::string &text) {
    return ToolResult{text, false};
}

ToolResult Error(const std::string &text) {
    return ToolResult{text, true};
}
} // namespace

// ─────────────────────────────────────
nlohmann::json ToolResult::ToJson() const {
    return {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", isError},
    };
}

// ─────────────────────────────────────
ToolBox::ToolBox(SQLite &db, Reconciler &reconciler, Weather &weather)
    : m_Db(db), m_Reconciler(reconciler), m_Weather(weather) {}

// ─────────────────────────────────────
nlohmann::json ToolBox::ListTools() const {
    const nlohmann::json none = nlohmann::json::object();
    const nlohmann::json noneRequired = nlohmann::json::array();

    nlohmann::json tools = nlohmann::json::array();
    tools.push_back({{"name", "get_weather"},
                     {"description", "Get the current weather for a city"},
                     {"inputSchema", Schema({{"city", {{"type", "string"}, {"description", "City name"}}}},
                                            nlohmann::json::array({"city"}))}});
    tools.push_back(
        {{"name", "add_task"},
         {"description", "Add a new task to the list"},
         {"inputSchema",
          Schema({{"title", {{"type", "string"}, {"description", "Task title"}}},
                  {"description", {{"type", "string"}, {"description", "Task description (optional)"}}}},
                 nlohmann::json::array({"title"}))}});
    tools.push_back(
        {{"name", "list_tasks"},
         {"description", "List tasks"},
         {"inputSchema",
          Schema({{"status",
                   {{"type", "string"},
                    {"description", "Filter by status: pending or completed"},
                    {"enum", nlohmann::json::array({"pending", "completed"})}}}},
                 noneRequired)}});
    tools.push_back({{"name", "complete_task"},
                     {"description", "Mark a task as completed"},
                     {"inputSchema",
                      Schema({{"task_id", {{"type", "integer"}, {"description", "Task id"}}}},
                             nlohmann::json::array({"task_id"}))}});
    tools.push_back({{"name", "get_summary"},
                     {"description", "Get today's task summary"},
                     {"inputSchema", Schema(none, noneRequired)}});
    tools.push_back({{"name", "sync_todoist"},
                     {"description", "Synchronize tasks with Todoist now"},
                     {"inputSchema", Schema(none, noneRequired)}});
    tools.push_back(
        {{"name", "get_time"},
         {"description", "Get the current time"},
         {"inputSchema",
          Schema({{"timezone",
                   {{"type", "string"}, {"description", "IANA time zone, local time when omitted"}}}},
                 noneRequired)}});
    tools.push_back(
        {{"name", "calculate"},
         {"description", "Evaluate an arithmetic expression"},
         {"inputSchema",
          Schema({{"expression", {{"type", "string"}, {"description", "For example (2 + 3) * 4"}}}},
                 nlohmann::json::array({"expression"}))}});
    return tools;
}

// ─────────────────────────────────────
ToolResult ToolBox::Call(const std::string &name, const nlohmann::json &args) {
    const nlohmann::json safeArgs = args.is_object() ? args : nlohmann::json::object();
    spdlog::debug("Tool call {} {}", name, safeArgs.dump());

    try {
        if (name == "add_task") {
            return AddTask(safeArgs);
        }
        if (name == "list_tasks") {
            return ListTasks(safeArgs);
        }
        if (name == "complete_task") {
            return CompleteTask(safeArgs);
        }
        if (name == "get_summary") {
            return GetSummary();
        }
        if (name == "sync_todoist") {
            return SyncTodoist();
        }
        if (name == "get_time") {
            return GetTime(safeArgs);
        }
        if (name == "get_weather") {
            return GetWeather(safeArgs);
        }
        if (name == "calculate") {
            return Calculate(safeArgs);
        }
    } catch (const std::exception &e) {
        spdlog::error("Tool {} failed: {}", name, e.what());
        return Error("Error: " + std::string(e.what()));
    }

    spdlog::warn("Unknown tool requested: {}", name);
    return Error("Unknown tool: " + name);
}

// ─────────────────────────────────────
ToolResult ToolBox::AddTask(const nlohmann::json &args) {
    const std::string title = m_JsonParse.GetString(args, "title", "");
    if (title.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error("Error: task title cannot be empty");
    }
    const std::string description = m_JsonParse.GetString(args, "description", "");

    const int64_t id = m_Db.CreateTask(title, description);
    spdlog::info("Task #{} added: {}", id, title);
    return Ok(fmt::format("Task #{} added: {}", id, title));
}

// ─────────────────────────────────────
ToolResult ToolBox::ListTasks(const nlohmann::json &args) {
    std::optional<TaskStatus> filter;
    const std::string statusName = m_JsonParse.GetString(args, "status", "");
    if (!statusName.empty()) {
        TaskStatus status;
        if (!ParseTaskStatus(statusName, status)) {
            return Error("Error: status must be 'pending' or 'completed'");
        }
        filter = status;
    }

    const std::vector<Task> tasks = m_Db.ListTasks(filter);
    if (tasks.empty()) {
        if (filter == TASK_PENDING) {
            return Ok("No pending tasks");
        }
        if (filter == TASK_COMPLETED) {
            return Ok("No completed tasks");
        }
        return Ok("No tasks");
    }

    std::string text = fmt::format("Tasks ({}):\n\n", tasks.size());
    for (const Task &task : tasks) {
        text += fmt::format("[{}] #{}: {}\n", task.status == TASK_COMPLETED ? "x" : " ", task.id,
                            task.title);
        if (!task.description.empty()) {
            text += fmt::format("   {}\n", task.description);
        }
        text += fmt::format("   Created: {}\n", task.created_at.substr(0, 10));
        if (task.completed_at) {
            text += fmt::format("   Completed: {}\n", task.completed_at->substr(0, 10));
        }
        text += "\n";
    }
    return Ok(text);
}

// ─────────────────────────────────────
ToolResult ToolBox::CompleteTask(const nlohmann::json &args) {
    const int64_t id = m_JsonParse.GetInt64(args, "task_id", 0);
    if (id <= 0) {
        return Error("Error: a valid task_id is required");
    }
    if (!m_Db.CompleteTask(id)) {
        return Error(fmt::format("Error: task #{} not found", id));
    }
    spdlog::info("Task #{} completed", id);
    return Ok(fmt::format("Task #{} marked as completed", id));
}

// ─────────────────────────────────────
ToolResult ToolBox::GetSummary() {
    return Ok(FormatSummary(BuildSummary(m_Db, TodayDate())));
}

// ─────────────────────────────────────
ToolResult ToolBox::SyncTodoist() {
    if (!m_Reconciler.IsConfigured()) {
        return Ok("Todoist is not configured.\n\n"
                  "Set the TODOIST_API_TOKEN environment variable or POST a token to "
                  "/set_todoist_token.\n"
                  "Get a token at https://todoist.com/app/settings/integrations");
    }

    const SyncResult result = m_Reconciler.ReconcileFull();
    if (result.skipped) {
        return Ok("Sync skipped: Todoist could not be reached. The next scheduled sync will "
                  "retry.");
    }
    if (result.Total() == 0) {
        return Ok("Sync finished. No changes found.");
    }
    return Ok(fmt::format("Sync finished.\n\nImported: {}\nUpdated: {}\nDeleted: {}",
                          result.imported, result.updated, result.deleted));
}

// ─────────────────────────────────────
ToolResult ToolBox::GetTime(const nlohmann::json &args) {
    const std::string zone = m_JsonParse.GetString(args, "timezone", "");
    if (zone.empty()) {
        return Ok("Current time: " + FormatLocalTime(std::time(nullptr), "%Y-%m-%d %H:%M:%S"));
    }

    const std::chrono::time_zone *tz = nullptr;
    try {
        tz = std::chrono::locate_zone(zone);
    } catch (const std::runtime_error &) {
        return Error("Error: unknown time zone '" + zone + "'");
    }

    const auto local = tz->to_local(std::chrono::system_clock::now());
    const std::time_t t = std::chrono::duration_cast<std::chrono::seconds>(local.time_since_epoch()).count();
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    const size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return Ok(fmt::format("Current time ({}): {}", zone, std::string(buf, len)));
}

// ─────────────────────────────────────
ToolResult ToolBox::GetWeather(const nlohmann::json &args) {
    const std::string city = m_JsonParse.GetString(args, "city", "Moscow");
    return Ok(m_Weather.Describe(city.empty() ? "Moscow" : city));
}

// ─────────────────────────────────────
ToolResult ToolBox::Calculate(const nlohmann::json &args) {
    const std::string expression = m_JsonParse.GetString(args, "expression", "");
    if (SanitizeExpression(expression).find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error("Error: expression is empty");
    }
    try {
        return Ok(expression + " = " + FormatNumber(::Calculate(expression)));
    } catch (const std::runtime_error &e) {
        return Error(std::string("Calculation error: ") + e.what());
    }
}
