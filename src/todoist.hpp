#pragma once

#include <nlohmann/json.hpp>

#include "json.hpp"
#include "settings.hpp"
#include "task_source.hpp"

// Todoist REST v2 client. Reads the credential from Settings on every fetch, so a
// token changed at runtime is used by the next pass.
class Todoist : public TaskSource {
  public:
    explicit Todoist(Settings &settings);

    bool IsConfigured() const override;
    std::vector<RemoteTask> FetchTasks() override;

    std::vector<RemoteTask> ParseTasks(const nlohmann::json &payload);

  private:
    Settings &m_Settings;
    JsonParse m_JsonParse;
};
