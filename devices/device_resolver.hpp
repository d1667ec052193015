#pragma once
#include "device_backend.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// What to do with each matched device
struct LightCommand {
    std::string action;                 // on / off / dim / toggle / color
    std::optional<int> brightness;      // 0-100, used by dim
    std::optional<std::string> color;   // palette name, used by on / color
};

struct ResolveOutcome {
    std::vector<DeviceRecord> devices;  // resolved order
    std::string errorCode;              // empty when at least one device matched
};

struct BatchOutcome {
    std::vector<std::string> successes; // "Turned off Kitchen Light", ...
    std::vector<std::string> targets;   // every matched display name
};

/// DeviceResolver
/// Owns the device cache (an immutable snapshot swapped wholesale on
/// discovery), maps free-text phrases onto devices and drives the
/// asynchronous backend to completion for each call.
class DeviceResolver {
public:
    explicit DeviceResolver(DeviceBackend& backend);

    /// Empty cache → discover first. "all"/"lights"/"light"/"everything" →
    /// every device. Otherwise bidirectional substring match; zero matches
    /// forces exactly one rediscovery before giving up.
    ResolveOutcome resolveTargets(const std::string& phrase);

    /// Run one command against one device and wait for it.
    bool applyAction(const DeviceRecord& device,
                     const LightCommand& command,
                     std::string* description = nullptr);

    /// Start one sequence per device (in order), wait for all of them.
    BatchOutcome applyToAll(const std::vector<DeviceRecord>& devices,
                            const LightCommand& command);

    /// Full sweep, replaces the cache. Returns the new device count.
    std::size_t rediscover();

    /// Current snapshot, never triggers discovery.
    std::vector<DeviceRecord> cachedDevices() const;

    static bool isAllPhrase(const std::string& phrase);
    static std::vector<DeviceRecord> matchByName(const std::vector<DeviceRecord>& devices,
                                                 const std::string& phrase);
    static std::optional<Hsv> lookupColor(const std::string& name);

private:
    using Snapshot = std::shared_ptr<const std::vector<DeviceRecord>>;

    Snapshot snapshot() const;
    void updateCachedState(const std::string& id, bool isOn);

    DeviceBackend& backend_;

    mutable std::mutex cacheMutex_;     // guards the cache_ pointer only
    Snapshot cache_;
    std::mutex discoveryMutex_;         // one sweep at a time
};
