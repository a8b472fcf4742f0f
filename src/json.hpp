#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

class JsonParse {
  public:
    int64_t GetInt64(const nlohmann::json &j, const std::string &key, int64_t fallback);
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);

    // Ids arrive either as strings or as numbers depending on the API version.
    std::string GetId(const nlohmann::json &j, const std::string &key);
};
