#include "weather.hpp"

#include <random>
#include <stdexcept>

#include <httplib.h>
#include <spdlog/spdlog.h>

// ─────────────────────────────────────
std::string Weather::Describe(const std::string &city) {
    httplib::SSLClient client("wttr.in", 443);
    client.enable_server_certificate_verification(true);
    client.set_default_headers({{"User-Agent", "Mozilla/5.0"}});
    client.set_connection_timeout(3, 0);
    client.set_read_timeout(15, 0);

    const std::string path = "/" + httplib::encode_query_param(city) + "?format=j1";
    auto res = client.Get(path.c_str());
    if (!res) {
        spdlog::error("Failed to get weather info, error code: {}", static_cast<int>(res.error()));
        return DemoReport(city, httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        spdlog::error("Weather API returned status {}", res->status);
        return DemoReport(city, "HTTP " + std::to_string(res->status));
    }

    try {
        return FormatReport(city, nlohmann::json::parse(res->body));
    } catch (const std::exception &e) {
        spdlog::error("Unexpected weather payload: {}", e.what());
        return DemoReport(city, e.what());
    }
}

// ─────────────────────────────────────
std::string Weather::FormatReport(const std::string &city, const nlohmann::json &payload) {
    if (!payload.contains("current_condition") || !payload["current_condition"].is_array() ||
        payload["current_condition"].empty()) {
        throw std::runtime_error("missing current_condition");
    }

    const auto &current = payload["current_condition"][0];
    std::string desc = "unknown";
    if (current.contains("weatherDesc") && current["weatherDesc"].is_array() &&
        !current["weatherDesc"].empty()) {
        desc = current["weatherDesc"][0].value("value", "unknown");
    }

    return fmt::format("Weather in {}:\n"
                       "Temperature: {}°C (feels like {}°C)\n"
                       "Conditions: {}\n"
                       "Humidity: {}%\n"
                       "Wind: {} km/h\n"
                       "Source: wttr.in",
                       city, current.value("temp_C", "?"), current.value("FeelsLikeC", "?"), desc,
                       current.value("humidity", "?"), current.value("windspeedKmph", "?"));
}

// ─────────────────────────────────────
std::string Weather::DemoReport(const std::string &city, const std::string &reason) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> temp(15, 25);
    std::uniform_int_distribution<int> humidity(40, 70);

    return fmt::format("Demo weather for {}:\n"
                       "Temperature: {}°C\n"
                       "Conditions: Partly cloudy\n"
                       "Humidity: {}%\n"
                       "Note: live API unavailable ({})",
                       city, temp(rng), humidity(rng), reason.substr(0, 50));
}
