#include "reconciler.hpp"

#include <spdlog/spdlog.h>

#include "external_tag.hpp"

// ─────────────────────────────────────
Reconciler::Reconciler(SQLite &db, TaskSource &source) : m_Db(db), m_Source(source) {}

// ─────────────────────────────────────
bool Reconciler::IsConfigured() const {
    return m_Source.IsConfigured();
}

// ─────────────────────────────────────
void Reconciler::ImportRemoteTask(const RemoteTask &remote) {
    const std::string description = BuildExternalDescription(remote.id, remote.description);
    const std::string title = remote.title.empty() ? FormatExternalTag(remote.id) : remote.title;
    const int64_t id = m_Db.InsertTask(title, description, remote.created_at,
                                       remote.completed ? TASK_COMPLETED : TASK_PENDING);
    spdlog::debug("Imported remote task {} as local task {}: {}", remote.id, id, title);
}

// ─────────────────────────────────────
SyncResult Reconciler::ReconcileFull() {
    std::lock_guard<std::mutex> gate(m_PassMutex);

    SyncResult result;
    if (!m_Source.IsConfigured()) {
        spdlog::debug("Reconcile skipped: remote source not configured");
        result.skipped = true;
        return result;
    }

    std::vector<RemoteTask> snapshot;
    try {
        snapshot = m_Source.FetchTasks();
    } catch (const TaskSourceError &e) {
        spdlog::warn("Reconcile skipped: {}", e.what());
        result.skipped = true;
        return result;
    }

    std::unordered_set<std::string> remoteIds;
    for (const RemoteTask &remote : snapshot) {
        if (!IsLinkableExternalId(remote.id)) {
            spdlog::warn("Ignoring remote task with unusable id '{}': '{}'", remote.id,
                         remote.title);
            continue;
        }
        if (!remoteIds.insert(remote.id).second) {
            continue;
        }

        std::optional<Task> local = m_Db.FindByExternalTag(remote.id);
        if (!local) {
            ImportRemoteTask(remote);
            result.imported++;
            continue;
        }

        const TaskStatus wanted = remote.completed ? TASK_COMPLETED : TASK_PENDING;
        if (local->status != wanted) {
            if (m_Db.SetTaskStatus(local->id, wanted)) {
                spdlog::debug("Local task {} is now {} (remote {})", local->id,
                             TaskStatusName(wanted), remote.id);
                result.updated++;
            }
        }
    }

    // Tasks whose tag does not parse never show up here, so they are never deleted.
    for (const Task &task : m_Db.ListTaggedTasks()) {
        std::optional<std::string> externalId = ParseExternalTag(task.description);
        if (!externalId || remoteIds.count(*externalId) > 0) {
            continue;
        }
        if (m_Db.DeleteTask(task.id)) {
            spdlog::debug("Deleted local task {}: remote {} is gone", task.id, *externalId);
            result.deleted++;
        }
    }

    spdlog::info("Reconcile done: imported {}, updated {}, deleted {}", result.imported,
                 result.updated, result.deleted);
    return result;
}

// ─────────────────────────────────────
DetectResult Reconciler::DetectAndImportNew(const std::unordered_set<std::string> &known) {
    std::lock_guard<std::mutex> gate(m_PassMutex);

    DetectResult result;
    if (!m_Source.IsConfigured()) {
        spdlog::debug("New-task detection skipped: remote source not configured");
        result.skipped = true;
        return result;
    }

    std::vector<RemoteTask> snapshot;
    try {
        snapshot = m_Source.FetchTasks();
    } catch (const TaskSourceError &e) {
        spdlog::warn("New-task detection skipped: {}", e.what());
        result.skipped = true;
        return result;
    }

    std::unordered_set<std::string> seen;
    for (const RemoteTask &remote : snapshot) {
        if (!IsLinkableExternalId(remote.id)) {
            spdlog::warn("Ignoring remote task with unusable id '{}': '{}'", remote.id,
                         remote.title);
            continue;
        }
        if (known.count(remote.id) > 0 || !seen.insert(remote.id).second) {
            continue;
        }

        result.net_new.push_back(remote);

        // A full pass may already have imported it.
        if (m_Db.FindByExternalTag(remote.id)) {
            spdlog::debug("Remote task {} already stored locally", remote.id);
            continue;
        }
        ImportRemoteTask(remote);
        result.imported++;
    }

    if (!result.net_new.empty()) {
        spdlog::info("Detected {} new remote task(s), imported {}", result.net_new.size(),
                     result.imported);
    }
    return result;
}
