#include "sqlite.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "external_tag.hpp"

namespace {
constexpr const char *kTaskColumns =
    "SELECT id, title, description, created_at, completed_at, status FROM tasks ";

std::string ColumnText(sqlite3_stmt *stmt, int col) {
    const char *txt = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
    return txt ? txt : "";
}
} // namespace

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open database: {}", m_DbPath);
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw std::runtime_error("unable to open database: " + m_DbPath);
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA wal_autocheckpoint=1000");
    ExecIgnoringErrors("PRAGMA journal_size_limit=10485760");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    Init();
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS tasks ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "title TEXT NOT NULL,"
                       "description TEXT NOT NULL DEFAULT '',"
                       "created_at TEXT NOT NULL,"
                       "completed_at TEXT,"
                       "status TEXT NOT NULL DEFAULT 'pending'"
                       ")");

    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status)");

    // Append-only, one row per daily firing.
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS daily_summaries ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "date TEXT NOT NULL,"
                       "summary TEXT NOT NULL,"
                       "tasks_completed INTEGER NOT NULL DEFAULT 0,"
                       "created_at TEXT NOT NULL"
                       ")");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
SQLite::Stmt SQLite::Prepare(const char *sql, const char *where) {
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in {}: {}", where, sqlite3_errmsg(m_Db));
        throw std::runtime_error(std::string("db prepare failed: ") + sqlite3_errmsg(m_Db));
    }
    return Stmt(stmt);
}

// ─────────────────────────────────────
void SQLite::StepDone(sqlite3_stmt *stmt, const char *where) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        spdlog::error("{} failed: {}", where, sqlite3_errmsg(m_Db));
        throw std::runtime_error(std::string("db write failed: ") + sqlite3_errmsg(m_Db));
    }
}

// ─────────────────────────────────────
int SQLite::QueryCount(const char *sql, const std::string &arg, const char *where) {
    Stmt stmt = Prepare(sql, where);
    if (!arg.empty()) {
        sqlite3_bind_text(stmt.get(), 1, arg.c_str(), -1, SQLITE_TRANSIENT);
    }
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        spdlog::error("{} failed: {}", where, sqlite3_errmsg(m_Db));
        throw std::runtime_error(std::string("db read failed: ") + sqlite3_errmsg(m_Db));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

// ─────────────────────────────────────
std::vector<Task> SQLite::CollectTasks(sqlite3_stmt *stmt) {
    std::vector<Task> tasks;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Task task;
        task.id = sqlite3_column_int64(stmt, 0);
        task.title = ColumnText(stmt, 1);
        task.description = ColumnText(stmt, 2);
        task.created_at = ColumnText(stmt, 3);
        if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
            task.completed_at = ColumnText(stmt, 4);
        }
        TaskStatus status = TASK_PENDING;
        if (!ParseTaskStatus(ColumnText(stmt, 5), status)) {
            spdlog::warn("Task {} has unknown status '{}', treating as pending", task.id,
                         ColumnText(stmt, 5));
        }
        task.status = status;
        tasks.push_back(std::move(task));
    }
    if (rc != SQLITE_DONE) {
        spdlog::error("db step failed: {}", sqlite3_errmsg(m_Db));
        throw std::runtime_error(std::string("db read failed: ") + sqlite3_errmsg(m_Db));
    }
    return tasks;
}

// ─────────────────────────────────────
int64_t SQLite::InsertTaskLocked(const std::string &title, const std::string &description,
                                 const std::string &createdAt, TaskStatus status) {
    Stmt stmt = Prepare("INSERT INTO tasks (title, description, created_at, completed_at, status) "
                        "VALUES (?, ?, ?, ?, ?)",
                        "InsertTask");

    sqlite3_bind_text(stmt.get(), 1, title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, createdAt.c_str(), -1, SQLITE_TRANSIENT);
    if (status == TASK_COMPLETED) {
        const std::string now = NowTimestamp();
        sqlite3_bind_text(stmt.get(), 4, now.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt.get(), 4);
    }
    sqlite3_bind_text(stmt.get(), 5, TaskStatusName(status), -1, SQLITE_STATIC);

    StepDone(stmt.get(), "InsertTask");
    const int64_t id = sqlite3_last_insert_rowid(m_Db);
    spdlog::debug("Inserted task {} '{}' ({})", id, title, TaskStatusName(status));
    return id;
}

// ─────────────────────────────────────
int64_t SQLite::CreateTask(const std::string &title, const std::string &description) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return InsertTaskLocked(title, description, NowTimestamp(), TASK_PENDING);
}

// ─────────────────────────────────────
int64_t SQLite::InsertTask(const std::string &title, const std::string &description,
                           const std::string &createdAt, TaskStatus status) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return InsertTaskLocked(title, description, createdAt.empty() ? NowTimestamp() : createdAt,
                            status);
}

// ─────────────────────────────────────
std::vector<Task> SQLite::ListTasks(std::optional<TaskStatus> filter) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    std::string sql = kTaskColumns;
    if (filter) {
        sql += "WHERE status = ? ";
    }
    sql += "ORDER BY created_at DESC, id DESC";

    Stmt stmt = Prepare(sql.c_str(), "ListTasks");
    if (filter) {
        sqlite3_bind_text(stmt.get(), 1, TaskStatusName(*filter), -1, SQLITE_STATIC);
    }
    return CollectTasks(stmt.get());
}

// ─────────────────────────────────────
std::optional<Task> SQLite::FindTask(int64_t id) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    const std::string sql = std::string(kTaskColumns) + "WHERE id = ?";
    Stmt stmt = Prepare(sql.c_str(), "FindTask");
    sqlite3_bind_int64(stmt.get(), 1, id);

    std::vector<Task> tasks = CollectTasks(stmt.get());
    if (tasks.empty()) {
        return std::nullopt;
    }
    return tasks.front();
}

// ─────────────────────────────────────
bool SQLite::CompleteTask(int64_t id) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    // Completing twice re-stamps completed_at.
    Stmt stmt = Prepare("UPDATE tasks SET status = 'completed', completed_at = ? WHERE id = ?",
                        "CompleteTask");
    const std::string now = NowTimestamp();
    sqlite3_bind_text(stmt.get(), 1, now.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, id);
    StepDone(stmt.get(), "CompleteTask");

    return sqlite3_changes(m_Db) > 0;
}

// ─────────────────────────────────────
bool SQLite::SetTaskStatus(int64_t id, TaskStatus status) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    Stmt stmt = Prepare("UPDATE tasks SET status = ?, completed_at = ? WHERE id = ?",
                        "SetTaskStatus");
    sqlite3_bind_text(stmt.get(), 1, TaskStatusName(status), -1, SQLITE_STATIC);
    if (status == TASK_COMPLETED) {
        const std::string now = NowTimestamp();
        sqlite3_bind_text(stmt.get(), 2, now.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt.get(), 2);
    }
    sqlite3_bind_int64(stmt.get(), 3, id);
    StepDone(stmt.get(), "SetTaskStatus");

    return sqlite3_changes(m_Db) > 0;
}

// ─────────────────────────────────────
bool SQLite::DeleteTask(int64_t id) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    Stmt stmt = Prepare("DELETE FROM tasks WHERE id = ?", "DeleteTask");
    sqlite3_bind_int64(stmt.get(), 1, id);
    StepDone(stmt.get(), "DeleteTask");

    return sqlite3_changes(m_Db) > 0;
}

// ─────────────────────────────────────
std::optional<Task> SQLite::FindByExternalTag(const std::string &externalId) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    const std::string sql =
        std::string(kTaskColumns) + "WHERE instr(description, ?) > 0 ORDER BY id ASC";
    Stmt stmt = Prepare(sql.c_str(), "FindByExternalTag");
    const std::string tag = FormatExternalTag(externalId);
    sqlite3_bind_text(stmt.get(), 1, tag.c_str(), -1, SQLITE_TRANSIENT);

    // instr() also matches a tag that is not the first one in the description.
    for (Task &task : CollectTasks(stmt.get())) {
        std::optional<std::string> parsed = ParseExternalTag(task.description);
        if (parsed && *parsed == externalId) {
            return task;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::vector<Task> SQLite::ListTaggedTasks() {
    std::lock_guard<std::mutex> lock(m_Mutex);

    const std::string sql =
        std::string(kTaskColumns) + "WHERE instr(description, ?) > 0 ORDER BY id ASC";
    Stmt stmt = Prepare(sql.c_str(), "ListTaggedTasks");
    sqlite3_bind_text(stmt.get(), 1, kExternalTagPrefix, -1, SQLITE_STATIC);

    std::vector<Task> tagged;
    for (Task &task : CollectTasks(stmt.get())) {
        if (ParseExternalTag(task.description)) {
            tagged.push_back(std::move(task));
        }
    }
    return tagged;
}

// ─────────────────────────────────────
int SQLite::CountCreatedOn(const std::string &date) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return QueryCount("SELECT COUNT(*) FROM tasks WHERE date(created_at) = ?", date,
                      "CountCreatedOn");
}

// ─────────────────────────────────────
int SQLite::CountPending() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return QueryCount("SELECT COUNT(*) FROM tasks WHERE status = 'pending'", "", "CountPending");
}

// ─────────────────────────────────────
std::vector<Task> SQLite::SelectCompletedOn(const std::string &date) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    const std::string sql = std::string(kTaskColumns) +
                            "WHERE status = 'completed' AND date(completed_at) = ? "
                            "ORDER BY completed_at ASC, id ASC";
    Stmt stmt = Prepare(sql.c_str(), "SelectCompletedOn");
    sqlite3_bind_text(stmt.get(), 1, date.c_str(), -1, SQLITE_TRANSIENT);
    return CollectTasks(stmt.get());
}

// ─────────────────────────────────────
int64_t SQLite::InsertDailySummary(const std::string &date, const std::string &summary,
                                   int tasksCompleted) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    Stmt stmt = Prepare("INSERT INTO daily_summaries (date, summary, tasks_completed, created_at) "
                        "VALUES (?, ?, ?, ?)",
                        "InsertDailySummary");
    const std::string now = NowTimestamp();
    sqlite3_bind_text(stmt.get(), 1, date.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, summary.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 3, tasksCompleted);
    sqlite3_bind_text(stmt.get(), 4, now.c_str(), -1, SQLITE_TRANSIENT);
    StepDone(stmt.get(), "InsertDailySummary");

    return sqlite3_last_insert_rowid(m_Db);
}

// ─────────────────────────────────────
std::vector<DailySummary> SQLite::FetchDailySummaries(int limit) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    if (limit <= 0) {
        limit = 30;
    }

    Stmt stmt = Prepare("SELECT id, date, summary, tasks_completed, created_at "
                        "FROM daily_summaries ORDER BY id DESC LIMIT ?",
                        "FetchDailySummaries");
    sqlite3_bind_int(stmt.get(), 1, limit);

    std::vector<DailySummary> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        DailySummary row;
        row.id = sqlite3_column_int64(stmt.get(), 0);
        row.date = ColumnText(stmt.get(), 1);
        row.summary = ColumnText(stmt.get(), 2);
        row.tasks_completed = sqlite3_column_int(stmt.get(), 3);
        row.created_at = ColumnText(stmt.get(), 4);
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        spdlog::error("FetchDailySummaries failed: {}", sqlite3_errmsg(m_Db));
        throw std::runtime_error(std::string("db read failed: ") + sqlite3_errmsg(m_Db));
    }

    spdlog::debug("Fetched {} daily summaries", rows.size());
    return rows;
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::error("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}
