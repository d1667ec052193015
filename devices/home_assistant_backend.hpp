#pragma once
#include "device_backend.hpp"

#include <string>
#include <nlohmann/json_fwd.hpp>

struct HomeAssistantSettings {
    std::string url;        // e.g. http://homeassistant.local:8123
    std::string token;      // long-lived access token
    int timeoutMs = 5000;

    static HomeAssistantSettings fromConfig(const nlohmann::json& cfg);
};

/// DeviceBackend over the Home Assistant REST API.
/// Lights and switches are exposed as devices; each call runs on
/// its own std::async task.
class HomeAssistantBackend : public DeviceBackend {
public:
    explicit HomeAssistantBackend(HomeAssistantSettings settings);

    std::future<std::vector<DeviceRecord>> discover() override;

    std::future<bool> turnOn(const std::string& id) override;
    std::future<bool> turnOff(const std::string& id) override;
    std::future<bool> setBrightness(const std::string& id, int percent) override;
    std::future<bool> setColor(const std::string& id, const Hsv& color) override;

    std::future<std::optional<bool>> queryState(const std::string& id) override;

    // Entity JSON from /api/states → DeviceRecord (nullopt for other domains)
    static std::optional<DeviceRecord> parseEntity(const nlohmann::json& entity);

private:
    bool callService(const std::string& domain,
                     const std::string& service,
                     const nlohmann::json& body) const;

    HomeAssistantSettings settings_;
};
