#include "server.hpp"

#include <spdlog/spdlog.h>

#include "common.hpp"

namespace {
constexpr const char *kProtocolVersion = "2024-11-05";
} // namespace

// ─────────────────────────────────────
Server::Server(ToolBox &tools, IntervalSyncScheduler &sync, Settings &settings, SQLite &db,
               TokenStore *tokens)
    : m_Tools(tools), m_Sync(sync), m_Settings(settings), m_Db(db), m_Tokens(tokens) {}

// ─────────────────────────────────────
Server::~Server() {
    Stop();
}

// ─────────────────────────────────────
nlohmann::json Server::RpcError(const nlohmann::json &id, int code, const std::string &message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

// ─────────────────────────────────────
nlohmann::json Server::HandleRpc(const nlohmann::json &request) {
    if (!request.is_object()) {
        return RpcError(nullptr, -32600, "Invalid Request");
    }

    const nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json(nullptr);
    if (!request.contains("method") || !request["method"].is_string()) {
        return RpcError(id, -32600, "Invalid Request");
    }

    const std::string method = request["method"].get<std::string>();
    const nlohmann::json params =
        request.contains("params") && request["params"].is_object() ? request["params"]
                                                                     : nlohmann::json::object();
    spdlog::debug("RPC {} {}", method, params.dump());

    nlohmann::json result;
    if (method == "initialize") {
        result = {
            {"protocolVersion", kProtocolVersion},
            {"capabilities",
             {{"tools", {{"listChanged", false}}},
              {"resources", {{"subscribe", false}, {"listChanged", false}}},
              {"prompts", {{"listChanged", false}}}}},
            {"serverInfo", {{"name", "taskagent"}, {"version", TASKAGENT_VERSION}}},
        };
    } else if (method == "notifications/initialized") {
        result = nlohmann::json::object();
    } else if (method == "tools/list") {
        result = {{"tools", m_Tools.ListTools()}};
    } else if (method == "tools/call") {
        const std::string name =
            params.contains("name") && params["name"].is_string() ? params["name"].get<std::string>()
                                                                  : "";
        const nlohmann::json args = params.contains("arguments") ? params["arguments"]
                                                                 : nlohmann::json::object();
        result = m_Tools.Call(name, args).ToJson();
    } else if (method == "resources/list") {
        result = {{"resources", nlohmann::json::array()}};
    } else if (method == "prompts/list") {
        result = {{"prompts", nlohmann::json::array()}};
    } else {
        spdlog::warn("RPC method not found: {}", method);
        return RpcError(id, -32601, "Method not found: " + method);
    }

    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

// ─────────────────────────────────────
std::string Server::HandleRpcBody(const std::string &body) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::warn("RPC parse error: {}", e.what());
        return RpcError(nullptr, -32700, "Parse error").dump();
    }
    return HandleRpc(request).dump();
}

// ─────────────────────────────────────
nlohmann::json Server::HandleSetInterval(const std::string &body, int &status) {
    const nlohmann::json invalid = {{"status", "error"}, {"message", "Invalid interval"}};

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &) {
        status = 400;
        return {{"status", "error"}, {"message", "Invalid JSON"}};
    }

    if (!j.is_object() || !j.contains("interval_minutes") ||
        !j["interval_minutes"].is_number_integer()) {
        status = 400;
        return invalid;
    }

    const int64_t minutes = j["interval_minutes"].get<int64_t>();
    if (minutes > 60 * 24 * 365 || !m_Sync.SetInterval(static_cast<int>(minutes))) {
        status = 400;
        return invalid;
    }

    status = 200;
    return {{"status", "success"}, {"interval_minutes", minutes}};
}

// ─────────────────────────────────────
nlohmann::json Server::HandleSetToken(const std::string &body, int &status) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &) {
        status = 400;
        return {{"status", "error"}, {"message", "Invalid JSON"}};
    }
    if (!j.is_object() || (j.contains("token") && !j["token"].is_string())) {
        status = 400;
        return {{"status", "error"}, {"message", "token must be a string"}};
    }

    const std::string token = j.value("token", "");
    m_Settings.SetTodoistToken(token);

    if (m_Tokens) {
        const bool persisted =
            token.empty() ? m_Tokens->ClearToken() : m_Tokens->SaveToken(token);
        if (!persisted) {
            spdlog::warn("Todoist token updated in memory only");
        }
    }

    if (token.empty()) {
        spdlog::info("Todoist token cleared");
    } else {
        spdlog::info("Todoist token updated: {}...", token.substr(0, 4));
    }

    status = 200;
    return {{"status", "success"}};
}

// ─────────────────────────────────────
nlohmann::json Server::HandleSummaries(int limit) {
    nlohmann::json rows = nlohmann::json::array();
    for (const DailySummary &s : m_Db.FetchDailySummaries(limit)) {
        rows.push_back({{"id", s.id},
                        {"date", s.date},
                        {"summary", s.summary},
                        {"tasks_completed", s.tasks_completed},
                        {"created_at", s.created_at}});
    }
    return rows;
}

// ─────────────────────────────────────
bool Server::InitServer(const std::string &host, int port) {
    m_Server.set_keep_alive_max_count(4);
    m_Server.set_keep_alive_timeout(1);
    m_Server.set_payload_max_length(64 * 1024); // 64 KB

    // The slowest tool waits on the remote provider.
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(20, 0);
    m_Server.set_idle_interval(1, 0);

    m_Server.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
    });

    // JSON-RPC
    {
        m_Server.Post("/mcp", [this](const httplib::Request &req, httplib::Response &res) {
            res.status = 200;
            res.set_content(HandleRpcBody(req.body), "application/json");
        });

        m_Server.Options("/mcp", [](const httplib::Request &, httplib::Response &res) {
            res.status = 200;
            res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
        });
    }

    // Admin
    {
        m_Server.Post("/set_interval", [this](const httplib::Request &req, httplib::Response &res) {
            int status = 500;
            nlohmann::json resp = HandleSetInterval(req.body, status);
            res.status = status;
            res.set_content(resp.dump(), "application/json");
        });

        m_Server.Post("/set_todoist_token",
                      [this](const httplib::Request &req, httplib::Response &res) {
                          int status = 500;
                          nlohmann::json resp = HandleSetToken(req.body, status);
                          res.status = status;
                          res.set_content(resp.dump(), "application/json");
                      });
    }

    // Summaries
    {
        m_Server.Get("/api/v1/summaries", [this](const httplib::Request &req,
                                                 httplib::Response &res) {
            try {
                int limit = 30;
                if (req.has_param("limit")) {
                    limit = std::stoi(req.get_param_value("limit"));
                }
                res.status = 200;
                res.set_content(HandleSummaries(limit).dump(), "application/json");
            } catch (const std::invalid_argument &) {
                res.status = 400;
                res.set_content(R"({"error":"limit must be a number"})", "application/json");
            } catch (const std::exception &e) {
                res.status = 500;
                res.set_content(nlohmann::json({{"error", e.what()}}).dump(), "application/json");
            }
        });
    }

    // Version
    {
        m_Server.Get("/api/v1/version", [](const httplib::Request &, httplib::Response &res) {
            nlohmann::json j = {{"version", TASKAGENT_VERSION}};
            res.status = 200;
            res.set_content(j.dump(), "application/json");
        });
    }

    if (!m_Server.bind_to_port(host, port)) {
        spdlog::error("Unable to bind HTTP server to {}:{}", host, port);
        return false;
    }
    m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
    m_Server.wait_until_ready();
    spdlog::info("Listening on http://{}:{}/mcp", host, port);
    return true;
}

// ─────────────────────────────────────
void Server::Stop() {
    if (m_Thread.joinable()) {
        m_Server.stop();
        m_Thread.join();
    }
}
