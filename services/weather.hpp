#pragma once
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

struct WeatherReport {
    double temp = 0.0;
    int code = 0;               // WMO weather code
    std::string condition;      // "Clear", "Rain", ...
    double high = 0.0;          // max of today's hourly temperatures
    double low = 0.0;
};

class WeatherFetcher {
public:
    virtual ~WeatherFetcher() = default;
    virtual std::optional<WeatherReport> current() = 0;
};

// WMO code → short condition text
std::string weatherCodeToText(int code);

struct WeatherSettings {
    double latitude = 36.7538;
    double longitude = 3.0588;
    std::string temperatureUnit = "fahrenheit";
    int timeoutMs = 5000;

    static WeatherSettings fromConfig(const nlohmann::json& cfg);
};

/// WeatherFetcher over the Open-Meteo forecast API (no key required).
class OpenMeteoWeather : public WeatherFetcher {
public:
    explicit OpenMeteoWeather(WeatherSettings settings);

    // nullopt when the request fails
    std::optional<WeatherReport> current() override;

    static std::optional<WeatherReport> parseResponse(const nlohmann::json& j);

private:
    WeatherSettings settings_;
};
