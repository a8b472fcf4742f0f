#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>
#include <thread>

#include "interval_scheduler.hpp"
#include "secrets.hpp"
#include "settings.hpp"
#include "sqlite.hpp"
#include "tools.hpp"

// JSON-RPC tool endpoint plus the admin routes. The Handle* methods carry the
// logic and are what the routes call; they never throw.
class Server {
  public:
    // tokens may be null, then a new token only lives in memory.
    Server(ToolBox &tools, IntervalSyncScheduler &sync, Settings &settings, SQLite &db,
           TokenStore *tokens);
    ~Server();

    bool InitServer(const std::string &host, int port);
    void Stop();

    nlohmann::json HandleRpc(const nlohmann::json &request);
    std::string HandleRpcBody(const std::string &body);
    nlohmann::json HandleSetInterval(const std::string &body, int &status);
    nlohmann::json HandleSetToken(const std::string &body, int &status);
    nlohmann::json HandleSummaries(int limit);

  private:
    static nlohmann::json RpcError(const nlohmann::json &id, int code, const std::string &message);

    ToolBox &m_Tools;
    IntervalSyncScheduler &m_Sync;
    Settings &m_Settings;
    SQLite &m_Db;
    TokenStore *m_Tokens;

    httplib::Server m_Server;
    std::thread m_Thread;
};
