#include "weather.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <vector>

std::string weatherCodeToText(int code) {
    switch (code) {
        case 0:
            return "Clear";
        case 1: case 2: case 3:
            return "Cloudy";
        case 45: case 48:
            return "Foggy";
        case 51: case 53: case 55: case 61: case 63: case 65:
            return "Rain";
        case 71: case 73: case 75: case 85: case 86:
            return "Snow";
        case 95: case 96: case 99:
            return "Storm";
        default:
            return "Unknown";
    }
}

WeatherSettings WeatherSettings::fromConfig(const nlohmann::json& cfg) {
    WeatherSettings s;
    const auto w = cfg.value("weather", nlohmann::json::object());
    s.latitude        = w.value("latitude", s.latitude);
    s.longitude       = w.value("longitude", s.longitude);
    s.temperatureUnit = w.value("temperature_unit", s.temperatureUnit);
    return s;
}

OpenMeteoWeather::OpenMeteoWeather(WeatherSettings settings)
    : settings_(std::move(settings)) {}

std::optional<WeatherReport> OpenMeteoWeather::parseResponse(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("current") || !j["current"].is_object()) {
        return std::nullopt;
    }

    const auto& cur = j["current"];
    WeatherReport r;
    r.temp      = cur.value("temperature_2m", 0.0);
    r.code      = cur.value("weather_code", 0);
    r.condition = weatherCodeToText(r.code);

    std::vector<double> temps;
    if (j.contains("hourly") && j["hourly"].contains("temperature_2m")) {
        for (const auto& t : j["hourly"]["temperature_2m"]) {
            if (t.is_number()) temps.push_back(t.get<double>());
        }
    }
    if (!temps.empty()) {
        auto [lo, hi] = std::minmax_element(temps.begin(), temps.end());
        r.low  = *lo;
        r.high = *hi;
    }
    return r;
}

std::optional<WeatherReport> OpenMeteoWeather::current() {
    auto resp = cpr::Get(
        cpr::Url{ "https://api.open-meteo.com/v1/forecast" },
        cpr::Parameters{
            {"latitude", std::to_string(settings_.latitude)},
            {"longitude", std::to_string(settings_.longitude)},
            {"current", "temperature_2m,weather_code,is_day"},
            {"hourly", "temperature_2m,weather_code"},
            {"temperature_unit", settings_.temperatureUnit},
            {"timezone", "auto"},
            {"forecast_days", "1"}
        },
        cpr::Timeout{ settings_.timeoutMs }
    );

    if (resp.status_code != 200) {
        LOG_ERROR("Weather", "Fetch failed: " + std::to_string(resp.status_code) +
                             (resp.error ? " " + resp.error.message : ""));
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("Weather", "Response is not JSON");
        return std::nullopt;
    }
    return parseResponse(j);
}
