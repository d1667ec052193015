#pragma once
#include <future>
#include <optional>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Device model
// ------------------------------------------------------------
struct DeviceCapabilities {
    bool dimmable = false;
    bool colorCapable = false;
};

struct DeviceRecord {
    std::string id;
    std::string displayName;
    bool isOn = false;
    DeviceCapabilities capabilities;
};

// Hue 0-360, saturation/value 0-100
struct Hsv {
    int hue = 0;
    int saturation = 0;
    int value = 100;
};

// ------------------------------------------------------------
// DeviceBackend: asynchronous device-control protocol.
// Every call starts its own operation and hands back a future;
// callers own the futures and must drain them.
// ------------------------------------------------------------
class DeviceBackend {
public:
    virtual ~DeviceBackend() = default;

    virtual std::future<std::vector<DeviceRecord>> discover() = 0;

    virtual std::future<bool> turnOn(const std::string& id) = 0;
    virtual std::future<bool> turnOff(const std::string& id) = 0;
    virtual std::future<bool> setBrightness(const std::string& id, int percent) = 0;
    virtual std::future<bool> setColor(const std::string& id, const Hsv& color) = 0;

    // Live on/off state, nullopt if the device did not answer
    virtual std::future<std::optional<bool>> queryState(const std::string& id) = 0;
};
