#include "home_assistant_backend.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static std::string entityDomain(const std::string& entityId) {
    auto dot = entityId.find('.');
    return dot == std::string::npos ? "" : entityId.substr(0, dot);
}

static bool hasMode(const nlohmann::json& modes, const char* mode) {
    return std::any_of(modes.begin(), modes.end(), [mode](const nlohmann::json& m) {
        return m.is_string() && m.get<std::string>() == mode;
    });
}

HomeAssistantSettings HomeAssistantSettings::fromConfig(const nlohmann::json& cfg) {
    HomeAssistantSettings s;
    const auto ha = cfg.value("home_assistant", nlohmann::json::object());
    s.url       = ha.value("url", "http://homeassistant.local:8123");
    s.token     = ha.value("token", "");
    s.timeoutMs = ha.value("timeout_ms", 5000);
    while (!s.url.empty() && s.url.back() == '/') s.url.pop_back();
    return s;
}

HomeAssistantBackend::HomeAssistantBackend(HomeAssistantSettings settings)
    : settings_(std::move(settings)) {}

// ------------------------------------------------------------
// Entity parsing
// ------------------------------------------------------------
std::optional<DeviceRecord> HomeAssistantBackend::parseEntity(const nlohmann::json& entity) {
    if (!entity.is_object() || !entity.contains("entity_id")) return std::nullopt;

    const std::string id = entity.value("entity_id", "");
    const std::string domain = entityDomain(id);
    if (domain != "light" && domain != "switch") return std::nullopt;

    const auto attrs = entity.value("attributes", nlohmann::json::object());

    DeviceRecord rec;
    rec.id          = id;
    rec.displayName = attrs.value("friendly_name", id);
    rec.isOn        = entity.value("state", "") == "on";

    if (domain == "light") {
        const auto modes = attrs.value("supported_color_modes", nlohmann::json::array());
        rec.capabilities.colorCapable = hasMode(modes, "hs") || hasMode(modes, "xy") ||
                                        hasMode(modes, "rgb") || hasMode(modes, "rgbw") ||
                                        hasMode(modes, "rgbww");
        rec.capabilities.dimmable = rec.capabilities.colorCapable ||
                                    hasMode(modes, "brightness") ||
                                    hasMode(modes, "color_temp") ||
                                    hasMode(modes, "white");
    }
    return rec;
}

// ------------------------------------------------------------
// HTTP plumbing
// ------------------------------------------------------------
bool HomeAssistantBackend::callService(const std::string& domain,
                                       const std::string& service,
                                       const nlohmann::json& body) const {
    auto resp = cpr::Post(
        cpr::Url{ settings_.url + "/api/services/" + domain + "/" + service },
        cpr::Header{ {"Authorization", "Bearer " + settings_.token},
                     {"Content-Type", "application/json"} },
        cpr::Body{ body.dump() },
        cpr::Timeout{ settings_.timeoutMs }
    );

    if (resp.status_code != 200) {
        LOG_ERROR("HomeAssistant", domain + "." + service + " failed (" +
                                   std::to_string(resp.status_code) + "): " +
                                   (resp.error ? resp.error.message : resp.text));
        return false;
    }
    LOG_TRACE("HomeAssistant", domain + "." + service + " " + body.dump());
    return true;
}

// ------------------------------------------------------------
// DeviceBackend
// ------------------------------------------------------------
std::future<std::vector<DeviceRecord>> HomeAssistantBackend::discover() {
    return std::async(std::launch::async, [this]() -> std::vector<DeviceRecord> {
        auto resp = cpr::Get(
            cpr::Url{ settings_.url + "/api/states" },
            cpr::Header{ {"Authorization", "Bearer " + settings_.token} },
            cpr::Timeout{ settings_.timeoutMs }
        );
        if (resp.status_code != 200) {
            throw std::runtime_error("discovery failed with status " +
                                     std::to_string(resp.status_code));
        }

        auto states = nlohmann::json::parse(resp.text, nullptr, false);
        if (states.is_discarded() || !states.is_array()) {
            throw std::runtime_error("discovery returned malformed JSON");
        }

        std::vector<DeviceRecord> devices;
        for (const auto& entity : states) {
            if (auto rec = parseEntity(entity)) devices.push_back(std::move(*rec));
        }
        LOG_DEBUG("HomeAssistant", "Discovered " + std::to_string(devices.size()) + " devices");
        return devices;
    });
}

std::future<bool> HomeAssistantBackend::turnOn(const std::string& id) {
    return std::async(std::launch::async, [this, id]() {
        return callService(entityDomain(id), "turn_on", {{"entity_id", id}});
    });
}

std::future<bool> HomeAssistantBackend::turnOff(const std::string& id) {
    return std::async(std::launch::async, [this, id]() {
        return callService(entityDomain(id), "turn_off", {{"entity_id", id}});
    });
}

std::future<bool> HomeAssistantBackend::setBrightness(const std::string& id, int percent) {
    return std::async(std::launch::async, [this, id, percent]() {
        if (entityDomain(id) != "light") return false;
        return callService("light", "turn_on", {
            {"entity_id", id},
            {"brightness_pct", std::clamp(percent, 0, 100)}
        });
    });
}

std::future<bool> HomeAssistantBackend::setColor(const std::string& id, const Hsv& color) {
    return std::async(std::launch::async, [this, id, color]() {
        if (entityDomain(id) != "light") return false;
        return callService("light", "turn_on", {
            {"entity_id", id},
            {"hs_color", { color.hue, color.saturation }},
            {"brightness_pct", std::clamp(color.value, 0, 100)}
        });
    });
}

std::future<std::optional<bool>> HomeAssistantBackend::queryState(const std::string& id) {
    return std::async(std::launch::async, [this, id]() -> std::optional<bool> {
        auto resp = cpr::Get(
            cpr::Url{ settings_.url + "/api/states/" + id },
            cpr::Header{ {"Authorization", "Bearer " + settings_.token} },
            cpr::Timeout{ settings_.timeoutMs }
        );
        if (resp.status_code != 200) return std::nullopt;

        auto j = nlohmann::json::parse(resp.text, nullptr, false);
        if (j.is_discarded() || !j.contains("state")) return std::nullopt;

        const std::string state = j.value("state", "");
        if (state == "on") return true;
        if (state == "off") return false;
        return std::nullopt;   // "unavailable" / "unknown"
    });
}
