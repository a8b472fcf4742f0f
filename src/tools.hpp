#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "json.hpp"
#include "reconciler.hpp"
#include "sqlite.hpp"
#include "weather.hpp"

struct ToolResult {
    std::string text;
    bool isError = false;

    nlohmann::json ToJson() const;
};

// The callable tools. Bad input and failures inside a tool come back as a result
// with isError set; Call() never throws.
class ToolBox {
  public:
    ToolBox(SQLite &db, Reconciler &reconciler, Weather &weather);

    nlohmann::json ListTools() const;
    ToolResult Call(const std::string &name, const nlohmann::json &args);

  private:
    ToolResult AddTask(const nlohmann::json &args);
    ToolResult ListTasks(const nlohmann::json &args);
    ToolResult CompleteTask(const nlohmann::json &args);
    ToolResult GetSummary();
    ToolResult SyncTodoist();
    ToolResult GetTime(const nlohmann::json &args);
    ToolResult GetWeather(const nlohmann::json &args);
    ToolResult Calculate(const nlohmann::json &args);

    SQLite &m_Db;
    Reconciler &m_Reconciler;
    Weather &m_Weather;
    JsonParse m_JsonParse;
};
