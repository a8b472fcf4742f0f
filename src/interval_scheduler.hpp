#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "notification.hpp"
#include "reconciler.hpp"
#include "sqlite.hpp"

// Every N minutes: import remote tasks not seen before and announce each one.
// The set of seen ids lives in memory and is rebuilt from the store's tags on
// Start(). minuteLength exists so tests can shrink a minute.
class IntervalSyncScheduler {
  public:
    IntervalSyncScheduler(SQLite &db, Reconciler &reconciler, Notifier &notifier,
                          int intervalMinutes,
                          std::chrono::milliseconds minuteLength = std::chrono::minutes(1));
    ~IntervalSyncScheduler();

    void Start();
    void Stop();
    bool IsRunning() const {
        return m_Running.load();
    }

    // Rejects minutes < 1. Otherwise the current wait restarts with the new value.
    bool SetInterval(int minutes);
    int GetInterval() const {
        return m_IntervalMinutes.load();
    }

    DetectResult Fire();
    int FiringCount() const {
        return m_FiringCount.load();
    }

    size_t KnownCount() const;
    bool IsKnown(const std::string &externalId) const;

  private:
    void Run();
    void SeedKnownIds();

    SQLite &m_Db;
    Reconciler &m_Reconciler;
    Notifier &m_Notifier;
    const std::chrono::milliseconds m_MinuteLength;
    std::atomic<int> m_IntervalMinutes;

    mutable std::mutex m_KnownMutex;
    std::unordered_set<std::string> m_KnownIds;

    // Scheduler: wait with wakeups on interval change or shutdown
    std::mutex m_Mutex;
    std::condition_variable m_Cv;
    std::atomic<std::uint64_t> m_WakeupSeq{0};
    std::atomic<bool> m_ShutdownRequested{false};
    std::atomic<bool> m_Running{false};
    std::atomic<int> m_FiringCount{0};
    std::thread m_Thread;
};
