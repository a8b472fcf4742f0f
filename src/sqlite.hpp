#pragma once

#include <sqlite3.h>

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"

// Durable task store. Every public call takes m_Mutex, so each call is atomic
// with respect to every other one. Storage failures throw std::runtime_error.
class SQLite {
  public:
    explicit SQLite(const std::string &db_path);
    ~SQLite();

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    // Tasks
    int64_t CreateTask(const std::string &title, const std::string &description);
    int64_t InsertTask(const std::string &title, const std::string &description,
                       const std::string &createdAt, TaskStatus status);
    std::vector<Task> ListTasks(std::optional<TaskStatus> filter = std::nullopt);
    std::optional<Task> FindTask(int64_t id);
    bool CompleteTask(int64_t id);
    bool SetTaskStatus(int64_t id, TaskStatus status);
    bool DeleteTask(int64_t id);

    // External reference tags
    std::optional<Task> FindByExternalTag(const std::string &externalId);
    std::vector<Task> ListTaggedTasks();

    // Summary
    int CountCreatedOn(const std::string &date);
    int CountPending();
    std::vector<Task> SelectCompletedOn(const std::string &date);
    int64_t InsertDailySummary(const std::string &date, const std::string &summary,
                               int tasksCompleted);
    std::vector<DailySummary> FetchDailySummaries(int limit = 30);

  private:
    struct StmtDeleter {
        void operator()(sqlite3_stmt *stmt) const {
            sqlite3_finalize(stmt);
        }
    };
    using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

    void Init();
    void ExecIgnoringErrors(const std::string &sql);
    Stmt Prepare(const char *sql, const char *where);
    void StepDone(sqlite3_stmt *stmt, const char *where);
    int QueryCount(const char *sql, const std::string &arg, const char *where);
    std::vector<Task> CollectTasks(sqlite3_stmt *stmt);
    int64_t InsertTaskLocked(const std::string &title, const std::string &description,
                             const std::string &createdAt, TaskStatus status);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;
    std::mutex m_Mutex;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 256; // 32 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
