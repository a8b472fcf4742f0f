#include "taskagent.hpp"

#include <csignal>
#include <cstdlib>
#include <optional>
#include <stdexcept>

// ─────────────────────────────────────
TaskAgent::TaskAgent(const AgentOptions &options) : m_Options(options) {
    if (m_Options.logLevel == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (m_Options.logLevel == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (m_Options.logLevel == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    const std::filesystem::path dbpath =
        m_Options.dbPath.empty() ? GetDBPath() : std::filesystem::path(m_Options.dbPath);
    spdlog::info("DataBase path: {}", dbpath.string());

    // SQlite
    m_SQLite = std::make_unique<SQLite>(dbpath.string());
    spdlog::info("SQLite database initialized");

    // Keyring
    m_Tokens = std::make_unique<KeyringTokenStore>();
    LoadCredentials();

    // Todoist
    m_Todoist = std::make_unique<Todoist>(m_Settings);
    m_Reconciler = std::make_unique<Reconciler>(*m_SQLite, *m_Todoist);

    // Notifications
    m_Notification = std::make_unique<Notification>();
    spdlog::info("Notification system initialized");

    // Tools
    m_Weather = std::make_unique<Weather>();
    m_Tools = std::make_unique<ToolBox>(*m_SQLite, *m_Reconciler, *m_Weather);

    // Schedulers
    m_Daily = std::make_unique<DailySummaryScheduler>(*m_SQLite, *m_Reconciler, *m_Notification,
                                                      m_Options.dailyHour, m_Options.dailyMinute);
    m_Interval = std::make_unique<IntervalSyncScheduler>(
        *m_SQLite, *m_Reconciler, *m_Notification, m_Options.syncIntervalMinutes);

    // Server
    m_Server = std::make_unique<Server>(*m_Tools, *m_Interval, m_Settings, *m_SQLite,
                                        m_Tokens.get());
}

// ─────────────────────────────────────
TaskAgent::~TaskAgent() {
    Shutdown();
}

// ─────────────────────────────────────
void TaskAgent::LoadCredentials() {
    const char *envToken = std::getenv("TODOIST_API_TOKEN");
    if (envToken && *envToken) {
        m_Settings.SetTodoistToken(envToken);
        spdlog::info("Todoist token loaded from environment");
    } else {
        std::optional<std::string> stored = m_Tokens->LoadToken();
        if (stored) {
            m_Settings.SetTodoistToken(*stored);
            spdlog::info("Todoist token loaded from secret store");
        } else {
            spdlog::warn("Todoist is not configured, remote sync is disabled");
        }
    }

    const char *projectId = std::getenv("TODOIST_PROJECT_ID");
    if (projectId && *projectId) {
        m_Settings.SetTodoistProjectId(projectId);
        spdlog::info("Todoist project filter: {}", projectId);
    }
}

// ─────────────────────────────────────
int TaskAgent::Run() {
    m_Daily->Start();
    m_Interval->Start();

    if (!m_Server->InitServer(m_Options.host, m_Options.port)) {
        Shutdown();
        return 1;
    }

    std::string toolNames;
    for (const auto &tool : m_Tools->ListTools()) {
        toolNames += (toolNames.empty() ? "" : ", ") + tool.value("name", std::string());
    }
    spdlog::info("Tools: {}", toolNames);

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);

    int sig = 0;
    if (sigwait(&signals, &sig) != 0) {
        spdlog::error("sigwait failed");
    } else {
        spdlog::info("Received signal {}, shutting down", sig);
    }

    Shutdown();
    return 0;
}

// ─────────────────────────────────────
void TaskAgent::Shutdown() {
    if (m_Server) {
        m_Server->Stop();
    }
    if (m_Interval) {
        m_Interval->Stop();
    }
    if (m_Daily) {
        m_Daily->Stop();
    }
}

// ─────────────────────────────────────
std::filesystem::path TaskAgent::GetDBPath() {
    const char *xdgDataHome = std::getenv("XDG_DATA_HOME");
    std::filesystem::path baseDir;
    if (xdgDataHome && *xdgDataHome) {
        baseDir = xdgDataHome;
    } else {
        const char *home = std::getenv("HOME");
        if (!home || !*home) {
            throw std::runtime_error("HOME environment variable not set");
        }
        baseDir = std::filesystem::path(home) / ".local" / "share";
    }

    std::filesystem::path dbPath = baseDir / "taskagent" / "tasks.sqlite";
    std::error_code ec;
    std::filesystem::create_directories(dbPath.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("unable to create " + dbPath.parent_path().string() + ": " +
                                 ec.message());
    }

    return dbPath;
}
