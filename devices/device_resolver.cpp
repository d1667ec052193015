#include "device_resolver.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static std::string lowerTrim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    std::string out = s.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

static std::string joinNames(const std::vector<DeviceRecord>& devices) {
    std::string out;
    for (const auto& d : devices) {
        if (!out.empty()) out += ", ";
        out += d.displayName;
    }
    return out;
}

// Canonical palette → HSV
static const std::unordered_map<std::string, Hsv>& palette() {
    static const std::unordered_map<std::string, Hsv> colors = {
        {"red",          {0,   100, 100}},
        {"orange",       {30,  100, 100}},
        {"yellow",       {60,  100, 100}},
        {"green",        {120, 100, 100}},
        {"cyan",         {180, 100, 100}},
        {"blue",         {240, 100, 100}},
        {"purple",       {270, 100, 100}},
        {"pink",         {300, 100, 100}},
        {"white",        {0,   0,   100}},
        {"warm",         {30,  80,  100}},
        {"warm white",   {30,  80,  100}},
        {"cool white",   {0,   0,   100}},
        {"soft white",   {30,  60,  100}},
        {"daylight",     {0,   0,   100}},
        {"candle light", {30,  100, 50}},
        {"amber",        {30,  100, 100}},
        {"magenta",      {300, 100, 100}},
    };
    return colors;
}

// ------------------------------------------------------------
// Construction / cache
// ------------------------------------------------------------
DeviceResolver::DeviceResolver(DeviceBackend& backend)
    : backend_(backend),
      cache_(std::make_shared<const std::vector<DeviceRecord>>()) {}

DeviceResolver::Snapshot DeviceResolver::snapshot() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return cache_;
}

std::vector<DeviceRecord> DeviceResolver::cachedDevices() const {
    return *snapshot();
}

std::size_t DeviceResolver::rediscover() {
    std::lock_guard<std::mutex> sweep(discoveryMutex_);

    auto found = backend_.discover().get();   // throws on backend failure
    auto fresh = std::make_shared<const std::vector<DeviceRecord>>(std::move(found));
    const std::size_t count = fresh->size();

    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        cache_ = std::move(fresh);
    }
    LOG_DEBUG("Devices", "Cache replaced with " + std::to_string(count) + " devices");
    return count;
}

// Copy-on-write so readers holding the old snapshot are unaffected
void DeviceResolver::updateCachedState(const std::string& id, bool isOn) {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    auto it = std::find_if(cache_->begin(), cache_->end(),
                           [&id](const DeviceRecord& d) { return d.id == id; });
    if (it == cache_->end() || it->isOn == isOn) return;

    auto copy = std::make_shared<std::vector<DeviceRecord>>(*cache_);
    (*copy)[static_cast<std::size_t>(it - cache_->begin())].isOn = isOn;
    cache_ = std::move(copy);
}

// ------------------------------------------------------------
// Matching
// ------------------------------------------------------------
bool DeviceResolver::isAllPhrase(const std::string& phrase) {
    const std::string p = lowerTrim(phrase);
    return p == "all" || p == "lights" || p == "light" || p == "everything";
}

std::vector<DeviceRecord> DeviceResolver::matchByName(const std::vector<DeviceRecord>& devices,
                                                      const std::string& phrase) {
    const std::string wanted = lowerTrim(phrase);
    std::vector<DeviceRecord> out;
    for (const auto& d : devices) {
        const std::string name = lowerTrim(d.displayName);
        if (name.find(wanted) != std::string::npos || wanted.find(name) != std::string::npos) {
            out.push_back(d);
        }
    }
    return out;
}

std::optional<Hsv> DeviceResolver::lookupColor(const std::string& name) {
    const auto& colors = palette();
    auto it = colors.find(lowerTrim(name));
    if (it == colors.end()) return std::nullopt;
    return it->second;
}

ResolveOutcome DeviceResolver::resolveTargets(const std::string& phrase) {
    ResolveOutcome outcome;

    auto devices = snapshot();
    if (devices->empty()) {
        LOG_DEBUG("Devices", "No cached devices, discovering...");
        rediscover();
        devices = snapshot();
    }
    if (devices->empty()) {
        outcome.errorCode = "ERR_DEVICES_NONE_FOUND";
        return outcome;
    }

    if (isAllPhrase(phrase)) {
        outcome.devices = *devices;
        LOG_DEBUG("Devices", "'" + phrase + "' → all " + std::to_string(devices->size()) + " devices");
        return outcome;
    }

    outcome.devices = matchByName(*devices, phrase);
    if (outcome.devices.empty()) {
        LOG_DEBUG("Devices", "No match for '" + phrase + "', forcing rediscovery...");
        rediscover();
        outcome.devices = matchByName(*snapshot(), phrase);
    }

    if (outcome.devices.empty()) {
        outcome.errorCode = "ERR_DEVICE_NOT_FOUND";
    } else {
        LOG_DEBUG("Devices", "Matched " + std::to_string(outcome.devices.size()) +
                             " devices: " + joinNames(outcome.devices));
    }
    return outcome;
}

// ------------------------------------------------------------
// Control
// ------------------------------------------------------------
bool DeviceResolver::applyAction(const DeviceRecord& device,
                                 const LightCommand& command,
                                 std::string* description) {
    const std::string& name = device.displayName;
    bool success = false;
    std::string desc;
    std::optional<bool> newState;

    try {
        const bool wantsColor = command.action == "color" ||
                                (command.action == "on" && command.color && !command.color->empty());

        if (wantsColor) {
            const std::string colorName = command.color.value_or("");
            if (auto hsv = lookupColor(colorName)) {
                success = backend_.setColor(device.id, *hsv).get();
                if (success) {
                    success = backend_.turnOn(device.id).get();
                    newState = success ? std::optional<bool>(true) : std::nullopt;
                }
                desc = "Set color to " + colorName + " for " + name;
            } else {
                LOG_DEBUG("Devices", "Unknown color '" + colorName + "' for " + name);
            }
        }
        else if (command.action == "on") {
            success = backend_.turnOn(device.id).get();
            if (success) newState = true;
            desc = "Turned on " + name;
        }
        else if (command.action == "off") {
            success = backend_.turnOff(device.id).get();
            if (success) newState = false;
            desc = "Turned off " + name;
        }
        else if (command.action == "dim" && command.brightness) {
            const int pct = std::clamp(*command.brightness, 0, 100);
            success = backend_.setBrightness(device.id, pct).get();
            desc = "Set brightness to " + std::to_string(pct) + "% for " + name;
        }
        else if (command.action == "toggle") {
            // Cached state may be stale, ask the device
            auto live = backend_.queryState(device.id).get();
            if (live) {
                if (*live) {
                    success = backend_.turnOff(device.id).get();
                    if (success) newState = false;
                    desc = "Turned off " + name;
                } else {
                    success = backend_.turnOn(device.id).get();
                    if (success) newState = true;
                    desc = "Turned on " + name;
                }
            } else {
                LOG_DEBUG("Devices", "Could not read state of " + name + " for toggle");
            }
        }
        else {
            LOG_DEBUG("Devices", "Unsupported action '" + command.action + "' for " + name);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Devices", "Control of " + name + " failed: " + e.what());
        success = false;
    }

    if (success && newState) updateCachedState(device.id, *newState);
    if (description) *description = desc;
    return success;
}

BatchOutcome DeviceResolver::applyToAll(const std::vector<DeviceRecord>& devices,
                                        const LightCommand& command) {
    BatchOutcome outcome;

    // One task per device, all owned by this call
    std::vector<std::future<std::pair<bool, std::string>>> pending;
    pending.reserve(devices.size());
    for (const auto& device : devices) {
        outcome.targets.push_back(device.displayName);
        pending.push_back(std::async(std::launch::async, [this, device, &command]() {
            std::string desc;
            bool ok = applyAction(device, command, &desc);
            return std::make_pair(ok, desc);
        }));
    }

    for (auto& f : pending) {
        auto [ok, desc] = f.get();
        if (ok) outcome.successes.push_back(desc);
    }

    LOG_DEBUG("Devices", command.action + ": " + std::to_string(outcome.successes.size()) +
                         "/" + std::to_string(devices.size()) + " succeeded");
    return outcome;
}
