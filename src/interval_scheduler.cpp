#include "interval_scheduler.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "external_tag.hpp"

// ─────────────────────────────────────
IntervalSyncScheduler::IntervalSyncScheduler(SQLite &db, Reconciler &reconciler,
                                             Notifier &notifier, int intervalMinutes,
                                             std::chrono::milliseconds minuteLength)
    : m_Db(db), m_Reconciler(reconciler), m_Notifier(notifier), m_MinuteLength(minuteLength),
      m_IntervalMinutes(intervalMinutes) {
    if (intervalMinutes < 1) {
        throw std::invalid_argument("sync interval must be at least 1 minute");
    }
    if (minuteLength <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("minute length must be positive");
    }
}

// ─────────────────────────────────────
IntervalSyncScheduler::~IntervalSyncScheduler() {
    Stop();
}

// ─────────────────────────────────────
void IntervalSyncScheduler::SeedKnownIds() {
    std::unordered_set<std::string> ids;
    for (const Task &task : m_Db.ListTaggedTasks()) {
        std::optional<std::string> externalId = ParseExternalTag(task.description);
        if (externalId) {
            ids.insert(*externalId);
        }
    }

    std::lock_guard<std::mutex> lock(m_KnownMutex);
    m_KnownIds = std::move(ids);
    spdlog::debug("Seeded {} known remote task id(s)", m_KnownIds.size());
}

// ─────────────────────────────────────
void IntervalSyncScheduler::Start() {
    if (m_Running.exchange(true)) {
        return;
    }
    try {
        SeedKnownIds();
    } catch (...) {
        m_Running = false;
        throw;
    }
    m_ShutdownRequested = false;
    spdlog::info("Interval sync every {} minute(s)", m_IntervalMinutes.load());
    m_Thread = std::thread([this] { Run(); });
}

// ─────────────────────────────────────
void IntervalSyncScheduler::Stop() {
    {
        std::lock_guard<std::mutex> lk(m_Mutex);
        m_ShutdownRequested = true;
    }
    m_Cv.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    if (m_Running.exchange(false)) {
        spdlog::debug("Interval sync scheduler stopped");
    }
}

// ─────────────────────────────────────
bool IntervalSyncScheduler::SetInterval(int minutes) {
    if (minutes < 1) {
        spdlog::warn("Rejected sync interval {}: must be at least 1 minute", minutes);
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(m_Mutex);
        m_IntervalMinutes = minutes;
        m_WakeupSeq.fetch_add(1, std::memory_order_relaxed);
    }
    m_Cv.notify_all();
    spdlog::info("Sync interval set to {} minute(s)", minutes);
    return true;
}

// ─────────────────────────────────────
size_t IntervalSyncScheduler::KnownCount() const {
    std::lock_guard<std::mutex> lock(m_KnownMutex);
    return m_KnownIds.size();
}

// ─────────────────────────────────────
bool IntervalSyncScheduler::IsKnown(const std::string &externalId) const {
    std::lock_guard<std::mutex> lock(m_KnownMutex);
    return m_KnownIds.count(externalId) > 0;
}

// ─────────────────────────────────────
DetectResult IntervalSyncScheduler::Fire() {
    std::unordered_set<std::string> known;
    {
        std::lock_guard<std::mutex> lock(m_KnownMutex);
        known = m_KnownIds;
    }

    DetectResult result = m_Reconciler.DetectAndImportNew(known);
    {
        std::lock_guard<std::mutex> lock(m_KnownMutex);
        for (const RemoteTask &remote : result.net_new) {
            m_KnownIds.insert(remote.id);
        }
    }

    for (const RemoteTask &remote : result.net_new) {
        m_Notifier.Notify("New task", remote.title,
                          {{"type", "new_task"}, {"task_id", remote.id}, {"title", remote.title}});
    }

    m_FiringCount++;
    return result;
}

// ─────────────────────────────────────
void IntervalSyncScheduler::Run() {
    while (true) {
        std::unique_lock<std::mutex> lk(m_Mutex);
        if (m_ShutdownRequested.load()) {
            break;
        }

        const auto seq = m_WakeupSeq.load(std::memory_order_relaxed);
        const auto deadline =
            std::chrono::steady_clock::now() + m_MinuteLength * m_IntervalMinutes.load();
        const bool woken = m_Cv.wait_until(lk, deadline, [&] {
            return m_ShutdownRequested.load() ||
                   m_WakeupSeq.load(std::memory_order_relaxed) != seq;
        });

        if (m_ShutdownRequested.load()) {
            break;
        }
        if (woken) {
            spdlog::debug("Interval changed, restarting wait with {} minute(s)",
                          m_IntervalMinutes.load());
            continue;
        }

        // The fetch runs unlocked: SetInterval never blocks on it.
        lk.unlock();
        try {
            Fire();
        } catch (const std::exception &e) {
            spdlog::error("Interval sync failed: {}", e.what());
        }
    }
}
