#pragma once

#include <nlohmann/json.hpp>

#include <string>

// Current conditions from wttr.in. When the service cannot be reached the answer
// is a clearly marked demo reading rather than an error.
class Weather {
  public:
    std::string Describe(const std::string &city);

    // Formats a wttr.in "j1" payload. Throws when current_condition is missing.
    std::string FormatReport(const std::string &city, const nlohmann::json &payload);
    std::string DemoReport(const std::string &city, const std::string &reason);
};
