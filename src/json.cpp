#include "json.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
int64_t JsonParse::GetInt64(const nlohmann::json &j, const std::string &key, int64_t fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    const auto &v = j.at(key);
    if (v.is_number_integer()) {
        return v.get<int64_t>();
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (std::floor(d) == d) {
            return static_cast<int64_t>(d);
        }
        spdlog::warn("JsonParse: Key '{}' is not integral ({}), using fallback {}", key, d,
                     fallback);
        return fallback;
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos &&
            s.size() < 19) {
            return std::stoll(s);
        }
    }
    spdlog::warn("JsonParse: Key '{}' is not an integer, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
bool JsonParse::GetBool(const nlohmann::json &j, const std::string &key, bool fallback) {
    if (!j.is_object() || !j.contains(key)) {
        return fallback;
    }
    if (j.at(key).is_boolean()) {
        return j.at(key).get<bool>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a boolean, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    if (j.at(key).is_null()) {
        return fallback;
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetId(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key)) {
        return "";
    }
    const auto &v = j.at(key);
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_number_unsigned()) {
        return std::to_string(v.get<uint64_t>());
    }
    if (v.is_number_integer()) {
        return std::to_string(v.get<int64_t>());
    }
    return "";
}
