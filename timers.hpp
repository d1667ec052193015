#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Countdown keyed by label. Remaining time is computed on demand,
// nothing is scheduled.
struct ActiveTimer {
    std::string label;
    int durationSeconds = 0;
    std::chrono::steady_clock::time_point start;

    int remainingSeconds(std::chrono::steady_clock::time_point now =
                             std::chrono::steady_clock::now()) const;
    bool isExpired(std::chrono::steady_clock::time_point now =
                       std::chrono::steady_clock::now()) const;
    std::string formatRemaining() const;
};

struct TimerStatus {
    std::string label;
    int remainingSeconds = 0;
    std::string remaining;   // "1h 5m 0s" style
};

/// TimerRegistry
/// One timer per label (re-setting a label replaces it).
/// Expired timers are dropped the next time the registry is listed.
class TimerRegistry {
public:
    /// Parse the phrase and start a timer. Empty if it parses to 0 seconds.
    std::optional<ActiveTimer> setTimer(const std::string& label, const std::string& phrase);
    std::optional<ActiveTimer> setTimer(const std::string& label, int seconds);

    /// Active timers ordered by label; purges expired entries.
    std::vector<TimerStatus> listActive();

    bool cancel(const std::string& label);

    static int parseDuration(const std::string& phrase);

private:
    std::mutex mutex_;
    std::map<std::string, ActiveTimer> timers_;
};
