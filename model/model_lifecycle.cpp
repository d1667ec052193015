#include "model_lifecycle.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

const char* toString(ResourceState state) {
    switch (state) {
        case ResourceState::Unloaded: return "unloaded";
        case ResourceState::Loading:  return "loading";
        case ResourceState::Loaded:   return "loaded";
    }
    return "unknown";
}

LifecycleSettings LifecycleSettings::fromConfig(const nlohmann::json& cfg) {
    LifecycleSettings s;
    s.resourceName  = cfg.value("responder_model", "qwen3:1.7b");
    s.keepAlive     = cfg.value("responder_keep_alive", "5m");
    s.idleTimeout   = std::chrono::seconds(cfg.value("responder_timeout_seconds", 300));
    s.checkInterval = std::chrono::milliseconds(cfg.value("watchdog_interval_ms", 10000));
    return s;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------
ResourceLifecycleManager::ResourceLifecycleManager(ModelBackend& backend,
                                                   LifecycleSettings settings)
    : backend_(backend), settings_(std::move(settings)) {}

ResourceLifecycleManager::~ResourceLifecycleManager() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shuttingDown_ = true;
        session_.monitoring = false;
        threads = std::move(retired_);
        if (watchdog_.joinable()) threads.push_back(std::move(watchdog_));
    }
    wake_.notify_all();
    for (auto& t : threads) t.join();
}

// Superseded watchdogs only need the mutex to notice they are stale
void ResourceLifecycleManager::reapRetiredWatchdogs() {
    std::vector<std::thread> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale.swap(retired_);
    }
    for (auto& t : stale) t.join();
}

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
bool ResourceLifecycleManager::ensureLoaded() {
    reapRetiredWatchdogs();
    std::lock_guard<std::mutex> lock(mutex_);
    return ensureLoadedLocked();
}

void ResourceLifecycleManager::markUsed() {
    reapRetiredWatchdogs();
    std::lock_guard<std::mutex> lock(mutex_);

    if (session_.state != ResourceState::Loaded) {
        ensureLoadedLocked();
        return;
    }
    // The watchdog measures idle time from lastUsed on every wake
    session_.lastUsed = Clock::now();
    wake_.notify_all();
}

void ResourceLifecycleManager::unload(const std::string& reason) {
    reapRetiredWatchdogs();
    std::lock_guard<std::mutex> lock(mutex_);
    unloadLocked(reason);
}

ResourceState ResourceLifecycleManager::state() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

ResourceStatus ResourceLifecycleManager::status() {
    std::lock_guard<std::mutex> lock(mutex_);

    ResourceStatus st;
    st.state     = session_.state;
    st.isLoaded  = session_.state == ResourceState::Loaded;
    st.isRunning = isRunningOnBackend();
    if (session_.lastUsed) {
        st.idleSeconds = std::chrono::duration<double>(Clock::now() - *session_.lastUsed).count();
    }
    return st;
}

// ------------------------------------------------------------
// Transitions (mutex_ held)
// ------------------------------------------------------------
bool ResourceLifecycleManager::isRunningOnBackend() {
    try {
        const auto running = backend_.listRunning();
        const std::string& name = settings_.resourceName;
        return std::any_of(running.begin(), running.end(), [&name](const std::string& m) {
            return m == name || m.find(name) != std::string::npos;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Lifecycle", std::string("listRunning failed: ") + e.what());
        return false;
    }
}

bool ResourceLifecycleManager::ensureLoadedLocked() {
    const std::string& name = settings_.resourceName;

    if (session_.state == ResourceState::Loaded) {
        session_.lastUsed = Clock::now();
        return true;
    }

    // Backend may still hold it from an earlier process
    if (isRunningOnBackend()) {
        LOG_DEBUG("Lifecycle", name + " already running on backend, adopting");
        session_.state = ResourceState::Loaded;
        session_.lastUsed = Clock::now();
        startWatchdogLocked();
        LOG_PHASE(name + " adopted", true);
        return true;
    }

    session_.state = ResourceState::Loading;
    LOG_DEBUG("Lifecycle", "Loading " + name + "...");

    bool ok = false;
    try {
        ok = backend_.load(name, settings_.keepAlive);
    } catch (const std::exception& e) {
        LOG_ERROR("Lifecycle", "Error loading " + name + ": " + e.what());
    }

    if (!ok) {
        session_.state = ResourceState::Unloaded;
        session_.lastUsed.reset();
        LOG_PHASE(name + " load", false);
        return false;
    }

    session_.state = ResourceState::Loaded;
    session_.lastUsed = Clock::now();
    startWatchdogLocked();
    LOG_PHASE(name + " load", true);
    return true;
}

void ResourceLifecycleManager::unloadLocked(const std::string& reason) {
    if (session_.state != ResourceState::Loaded) return;

    const std::string& name = settings_.resourceName;
    LOG_DEBUG("Lifecycle", "Unloading " + name + " (" + reason + ")...");

    // A failed request still leaves us unloaded: the keep-alive hint
    // bounds how long the backend keeps it resident.
    try {
        backend_.unload(name);
    } catch (const std::exception& e) {
        LOG_ERROR("Lifecycle", "Error unloading " + name + ": " + e.what());
    }

    session_.state = ResourceState::Unloaded;
    session_.lastUsed.reset();
    session_.monitoring = false;
    wake_.notify_all();
    LOG_PHASE(name + " unloaded (" + reason + ")", true);
}

void ResourceLifecycleManager::startWatchdogLocked() {
    session_.monitoring = true;
    const std::uint64_t generation = ++session_.watchdogGeneration;

    // The previous watchdog sees the generation change and exits on its own
    if (watchdog_.joinable()) retired_.push_back(std::move(watchdog_));
    wake_.notify_all();

    watchdog_ = std::thread(&ResourceLifecycleManager::watchdogLoop, this, generation);
}

// ------------------------------------------------------------
// Idle watchdog
// ------------------------------------------------------------
void ResourceLifecycleManager::watchdogLoop(std::uint64_t generation) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        wake_.wait_for(lock, settings_.checkInterval, [&] {
            return shuttingDown_ ||
                   !session_.monitoring ||
                   session_.watchdogGeneration != generation ||
                   session_.state != ResourceState::Loaded;
        });

        if (shuttingDown_ ||
            !session_.monitoring ||
            session_.watchdogGeneration != generation ||
            session_.state != ResourceState::Loaded) {
            break;
        }
        if (!session_.lastUsed) continue;

        const auto idle = Clock::now() - *session_.lastUsed;
        if (idle >= settings_.idleTimeout) {
            LOG_DEBUG("Lifecycle", "Idle timeout reached (" +
                      std::to_string(std::chrono::duration_cast<std::chrono::seconds>(idle).count()) +
                      "s), unloading " + settings_.resourceName);
            unloadLocked("timeout");
            break;
        }
    }
}
