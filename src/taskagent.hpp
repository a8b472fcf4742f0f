#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

// parts
#include "daily_scheduler.hpp"
#include "interval_scheduler.hpp"
#include "notification.hpp"
#include "reconciler.hpp"
#include "secrets.hpp"
#include "server.hpp"
#include "settings.hpp"
#include "sqlite.hpp"
#include "todoist.hpp"
#include "tools.hpp"
#include "weather.hpp"

#include "common.hpp"

struct AgentOptions {
    std::string host = "0.0.0.0";
    int port = 3000;
    std::string dbPath; // empty: $XDG_DATA_HOME/taskagent/tasks.sqlite
    int dailyHour = 18;
    int dailyMinute = 0;
    int syncIntervalMinutes = 30;
    LogLevel logLevel = LOG_INFO;
};

class TaskAgent {
  public:
    explicit TaskAgent(const AgentOptions &options);
    ~TaskAgent();

    // Starts the schedulers and the HTTP server, then blocks until SIGINT or
    // SIGTERM. Both signals must already be blocked in every thread.
    int Run();

  private:
    std::filesystem::path GetDBPath();
    void LoadCredentials();
    void Shutdown();

    AgentOptions m_Options;

    // Parts
    std::unique_ptr<SQLite> m_SQLite;
    std::unique_ptr<TokenStore> m_Tokens;
    Settings m_Settings;
    std::unique_ptr<Todoist> m_Todoist;
    std::unique_ptr<Reconciler> m_Reconciler;
    std::unique_ptr<Notification> m_Notification;
    std::unique_ptr<Weather> m_Weather;
    std::unique_ptr<ToolBox> m_Tools;
    std::unique_ptr<DailySummaryScheduler> m_Daily;
    std::unique_ptr<IntervalSyncScheduler> m_Interval;

    // Server
    std::unique_ptr<Server> m_Server;
};
