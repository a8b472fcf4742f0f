#include "daily_scheduler.hpp"

#include <algorithm>
#include <ctime>
#include <stdexcept>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
DailySummaryScheduler::DailySummaryScheduler(SQLite &db, Reconciler &reconciler,
                                             Notifier &notifier, int hour, int minute,
                                             std::chrono::milliseconds pollEvery)
    : m_Db(db), m_Reconciler(reconciler), m_Notifier(notifier), m_Hour(hour), m_Minute(minute),
      m_PollEvery(pollEvery) {
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        throw std::invalid_argument("daily summary time must be HH:MM");
    }
    if (pollEvery <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("poll interval must be positive");
    }
}

// ─────────────────────────────────────
DailySummaryScheduler::~DailySummaryScheduler() {
    Stop();
}

// ─────────────────────────────────────
std::chrono::system_clock::time_point
DailySummaryScheduler::NextTarget(std::chrono::system_clock::time_point now, int hour,
                                  int minute) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);

    local.tm_hour = hour;
    local.tm_min = minute;
    local.tm_sec = 0;
    local.tm_isdst = -1;
    auto target = std::chrono::system_clock::from_time_t(std::mktime(&local));
    if (target <= now) {
        // mktime normalizes day 32 and friends.
        local.tm_mday += 1;
        local.tm_hour = hour;
        local.tm_min = minute;
        local.tm_sec = 0;
        local.tm_isdst = -1;
        target = std::chrono::system_clock::from_time_t(std::mktime(&local));
    }
    return target;
}

// ─────────────────────────────────────
void DailySummaryScheduler::Start() {
    if (m_Running.exchange(true)) {
        return;
    }
    m_ShutdownRequested = false;
    spdlog::info("Daily summary scheduled at {:02d}:{:02d}", m_Hour, m_Minute);
    m_Thread = std::thread([this] { Run(); });
}

// ─────────────────────────────────────
void DailySummaryScheduler::Stop() {
    {
        std::lock_guard<std::mutex> lk(m_Mutex);
        m_ShutdownRequested = true;
    }
    m_Cv.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    if (m_Running.exchange(false)) {
        spdlog::debug("Daily summary scheduler stopped");
    }
}

// ─────────────────────────────────────
TodaySummary DailySummaryScheduler::Fire() {
    const SyncResult sync = m_Reconciler.ReconcileFull();

    TodaySummary summary = BuildSummary(m_Db, TodayDate());
    const std::string text = FormatSummary(summary);
    m_Db.InsertDailySummary(summary.date, text, summary.completed_today);

    nlohmann::json data = {
        {"type", "daily_summary"},
        {"date", summary.date},
        {"summary", text},
        {"sync",
         {{"imported", sync.imported},
          {"updated", sync.updated},
          {"deleted", sync.deleted},
          {"skipped", sync.skipped}}},
    };
    m_Notifier.Notify("Daily task summary",
                      fmt::format("Completed: {}, Pending: {}", summary.completed_today,
                                  summary.pending_count),
                      data);

    m_FiringCount++;
    return summary;
}

// ─────────────────────────────────────
void DailySummaryScheduler::Run() {
    auto target = NextTarget(std::chrono::system_clock::now(), m_Hour, m_Minute);
    spdlog::info("Next daily summary at {}",
                 FormatLocalTime(std::chrono::system_clock::to_time_t(target), "%Y-%m-%d %H:%M"));
    const auto pollEvery =
        std::chrono::duration_cast<std::chrono::system_clock::duration>(m_PollEvery);

    while (!m_ShutdownRequested.load()) {
        const auto now = std::chrono::system_clock::now();
        if (now >= target) {
            try {
                Fire();
            } catch (const std::exception &e) {
                spdlog::error("Daily summary failed: {}", e.what());
            }
            target = NextTarget(std::chrono::system_clock::now(), m_Hour, m_Minute);
            spdlog::info("Next daily summary at {}",
                         FormatLocalTime(std::chrono::system_clock::to_time_t(target),
                                         "%Y-%m-%d %H:%M"));
            continue;
        }

        const auto deadline = std::min(target, now + pollEvery);
        std::unique_lock<std::mutex> lk(m_Mutex);
        m_Cv.wait_until(lk, deadline, [&] { return m_ShutdownRequested.load(); });
    }
}
