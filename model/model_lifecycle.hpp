#pragma once
#include "model_backend.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json_fwd.hpp>

enum class ResourceState {
    Unloaded,
    Loading,
    Loaded
};

const char* toString(ResourceState state);

struct LifecycleSettings {
    std::string resourceName;
    std::string keepAlive = "5m";                        // hint passed to the backend
    std::chrono::milliseconds idleTimeout{300000};       // unload after this much idle time
    std::chrono::milliseconds checkInterval{10000};      // watchdog wake period

    static LifecycleSettings fromConfig(const nlohmann::json& cfg);
};

struct ResourceStatus {
    ResourceState state = ResourceState::Unloaded;
    bool isLoaded = false;
    bool isRunning = false;                 // backend reports it resident
    std::optional<double> idleSeconds;      // empty when not loaded
};

/// ResourceLifecycleManager
/// Keeps one expensive model resident only while it is being used.
/// Unloaded → Loading → Loaded → Unloaded. Every transition, and every
/// read of the session by the idle watchdog, happens under one mutex.
class ResourceLifecycleManager {
public:
    ResourceLifecycleManager(ModelBackend& backend, LifecycleSettings settings);
    ~ResourceLifecycleManager();

    ResourceLifecycleManager(const ResourceLifecycleManager&) = delete;
    ResourceLifecycleManager& operator=(const ResourceLifecycleManager&) = delete;

    /// Load if needed. Adopts a copy the backend already runs instead of
    /// reloading. Returns false if the backend refused.
    bool ensureLoaded();

    /// Refresh the idle deadline, loading first if unloaded.
    void markUsed();

    /// No-op when already unloaded.
    void unload(const std::string& reason = "manual");

    ResourceStatus status();
    ResourceState state();
    const std::string& resourceName() const { return settings_.resourceName; }

private:
    using Clock = std::chrono::steady_clock;

    struct Session {
        ResourceState state = ResourceState::Unloaded;
        std::optional<Clock::time_point> lastUsed;
        bool monitoring = false;                // watchdog should keep running
        std::uint64_t watchdogGeneration = 0;   // identity of the active watchdog
    };

    // All *Locked members expect mutex_ held
    bool ensureLoadedLocked();
    void unloadLocked(const std::string& reason);
    void startWatchdogLocked();
    bool isRunningOnBackend();

    void watchdogLoop(std::uint64_t generation);
    void reapRetiredWatchdogs();

    ModelBackend& backend_;
    const LifecycleSettings settings_;

    std::mutex mutex_;
    std::condition_variable wake_;
    Session session_;
    bool shuttingDown_ = false;

    std::thread watchdog_;
    std::vector<std::thread> retired_;   // superseded watchdogs, exit on next wake
};
