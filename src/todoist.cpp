#include "todoist.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "common.hpp"

namespace {
constexpr const char *kTodoistHost = "api.todoist.com";
constexpr const char *kTodoistTasksPath = "/rest/v2/tasks";
} // namespace

// ─────────────────────────────────────
Todoist::Todoist(Settings &settings) : m_Settings(settings) {}

// ─────────────────────────────────────
bool Todoist::IsConfigured() const {
    return m_Settings.HasTodoistToken();
}

// ─────────────────────────────────────
std::vector<RemoteTask> Todoist::FetchTasks() {
    const std::string token = m_Settings.GetTodoistToken();
    if (token.empty()) {
        throw TaskSourceError("missing todoist api token");
    }

    httplib::SSLClient client(kTodoistHost, 443);
    client.enable_server_certificate_verification(true);
    client.set_default_headers({
        {"Authorization", "Bearer " + token},
    });
    client.set_connection_timeout(3, 0);
    client.set_read_timeout(10, 0);
    client.set_write_timeout(10, 0);

    std::string path = kTodoistTasksPath;
    const std::string projectId = m_Settings.GetTodoistProjectId();
    if (!projectId.empty()) {
        path += "?project_id=" + httplib::encode_query_param(projectId);
    }

    auto res = client.Get(path.c_str());
    if (!res) {
        spdlog::error("Todoist request failed: {}", httplib::to_string(res.error()));
        throw TaskSourceError("todoist request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        spdlog::error("Todoist API returned HTTP {}", res->status);
        throw TaskSourceError("todoist request failed: " + std::to_string(res->status));
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error &e) {
        throw TaskSourceError(std::string("invalid todoist response: ") + e.what());
    }

    std::vector<RemoteTask> tasks = ParseTasks(payload);
    spdlog::debug("Fetched {} tasks from Todoist", tasks.size());
    return tasks;
}

// ─────────────────────────────────────
std::vector<RemoteTask> Todoist::ParseTasks(const nlohmann::json &payload) {
    if (!payload.is_array()) {
        throw TaskSourceError("todoist response is not an array");
    }

    const std::string now = NowTimestamp();
    std::vector<RemoteTask> tasks;
    tasks.reserve(payload.size());
    for (const auto &obj : payload) {
        if (!obj.is_object()) {
            continue;
        }
        RemoteTask task;
        task.id = m_JsonParse.GetId(obj, "id");
        task.title = m_JsonParse.GetString(obj, "content", "");
        task.description = m_JsonParse.GetString(obj, "description", "");
        task.completed = m_JsonParse.GetBool(obj, "is_completed", false);
        task.created_at = NormalizeTimestamp(m_JsonParse.GetString(obj, "created_at", ""), now);
        tasks.push_back(std::move(task));
    }
    return tasks;
}
