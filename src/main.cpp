#include <pthread.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

#include <spdlog/spdlog.h>

#include "taskagent.hpp"

namespace {

void PrintUsage(const char *argv0) {
    std::printf("Usage: %s [options]\n"
                "  --port N            HTTP port (default 3000)\n"
                "  --host H            bind address (default 0.0.0.0)\n"
                "  --db PATH           database file (default $XDG_DATA_HOME/taskagent/tasks.sqlite)\n"
                "  --daily-at HH:MM    daily summary time (default 18:00)\n"
                "  --sync-interval N   remote sync interval in minutes (default 30)\n"
                "  --log-level L       debug, info or off (default info)\n"
                "  --help              show this help\n",
                argv0);
}

bool ParseInt(const std::string &text, int &out) {
    if (text.empty() || text.size() > 9 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    out = std::stoi(text);
    return true;
}

bool ParseClock(const std::string &text, int &hour, int &minute) {
    const size_t colon = text.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    if (!ParseInt(text.substr(0, colon), hour) || !ParseInt(text.substr(colon + 1), minute)) {
        return false;
    }
    return hour <= 23 && minute <= 59;
}

} // namespace

// ─────────────────────────────────────
int main(int argc, char **argv) {
    AgentOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            std::fprintf(stderr, "Missing value for %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return 2;
        }

        const std::string value = argv[++i];
        bool ok = true;
        if (arg == "--port") {
            ok = ParseInt(value, options.port) && options.port > 0 && options.port < 65536;
        } else if (arg == "--host") {
            options.host = value;
        } else if (arg == "--db") {
            options.dbPath = value;
        } else if (arg == "--daily-at") {
            ok = ParseClock(value, options.dailyHour, options.dailyMinute);
        } else if (arg == "--sync-interval") {
            ok = ParseInt(value, options.syncIntervalMinutes) && options.syncIntervalMinutes >= 1;
        } else if (arg == "--log-level") {
            if (value == "debug") {
                options.logLevel = LOG_DEBUG;
            } else if (value == "info") {
                options.logLevel = LOG_INFO;
            } else if (value == "off") {
                options.logLevel = LOG_OFF;
            } else {
                ok = false;
            }
        } else {
            std::fprintf(stderr, "Unknown option %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return 2;
        }

        if (!ok) {
            std::fprintf(stderr, "Invalid value for %s: %s\n", arg.c_str(), value.c_str());
            return 2;
        }
    }

    // Signals are taken with sigwait in TaskAgent::Run, so every thread must block them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        TaskAgent agent(options);
        return agent.Run();
    } catch (const std::exception &e) {
        spdlog::critical("taskagent failed: {}", e.what());
        return 1;
    }
}
