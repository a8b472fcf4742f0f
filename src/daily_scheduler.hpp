#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "notification.hpp"
#include "reconciler.hpp"
#include "sqlite.hpp"
#include "summary.hpp"

// Once a day at hour:minute local time: full reconcile, then persist and announce
// the day's summary. The wait wakes at least every pollEvery so Stop() returns
// quickly and clock changes are picked up.
class DailySummaryScheduler {
  public:
    DailySummaryScheduler(SQLite &db, Reconciler &reconciler, Notifier &notifier, int hour,
                          int minute,
                          std::chrono::milliseconds pollEvery = std::chrono::minutes(1));
    ~DailySummaryScheduler();

    void Start();
    void Stop();
    bool IsRunning() const {
        return m_Running.load();
    }

    TodaySummary Fire();
    int FiringCount() const {
        return m_FiringCount.load();
    }

    // First local hour:minute strictly after now.
    static std::chrono::system_clock::time_point
    NextTarget(std::chrono::system_clock::time_point now, int hour, int minute);

  private:
    void Run();

    SQLite &m_Db;
    Reconciler &m_Reconciler;
    Notifier &m_Notifier;
    const int m_Hour;
    const int m_Minute;
    const std::chrono::milliseconds m_PollEvery;

    std::mutex m_Mutex;
    std::condition_variable m_Cv;
    std::atomic<bool> m_ShutdownRequested{false};
    std::atomic<bool> m_Running{false};
    std::atomic<int> m_FiringCount{0};
    std::thread m_Thread;
};
