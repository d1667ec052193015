#include "timers.hpp"
#include "time_parse.hpp"
#include "logger.hpp"

using Clock = std::chrono::steady_clock;

// ------------------------------------------------------------
// ActiveTimer
// ------------------------------------------------------------
int ActiveTimer::remainingSeconds(Clock::time_point now) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start).count();
    long long left = static_cast<long long>(durationSeconds) - elapsed;
    return left > 0 ? static_cast<int>(left) : 0;
}

bool ActiveTimer::isExpired(Clock::time_point now) const {
    return remainingSeconds(now) == 0;
}

std::string ActiveTimer::formatRemaining() const {
    return timeparse::formatRemaining(remainingSeconds());
}

// ------------------------------------------------------------
// TimerRegistry
// ------------------------------------------------------------
int TimerRegistry::parseDuration(const std::string& phrase) {
    return timeparse::parseDuration(phrase);
}

std::optional<ActiveTimer> TimerRegistry::setTimer(const std::string& label,
                                                   const std::string& phrase) {
    return setTimer(label, parseDuration(phrase));
}

std::optional<ActiveTimer> TimerRegistry::setTimer(const std::string& label, int seconds) {
    if (seconds <= 0) {
        LOG_DEBUG("Timer", "Rejected non-positive duration for '" + label + "'");
        return std::nullopt;
    }

    ActiveTimer timer{ label, seconds, Clock::now() };

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = timers_.insert_or_assign(label, timer);
    LOG_DEBUG("Timer", (inserted ? "Started '" : "Replaced '") + label + "' for " +
                       std::to_string(seconds) + "s");
    return it->second;
}

std::vector<TimerStatus> TimerRegistry::listActive() {
    std::vector<TimerStatus> out;
    const auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.begin();
    while (it != timers_.end()) {
        const int left = it->second.remainingSeconds(now);
        if (left == 0) {
            LOG_TRACE("Timer", "Purged expired '" + it->first + "'");
            it = timers_.erase(it);
            continue;
        }
        out.push_back({ it->first, left, timeparse::formatRemaining(left) });
        ++it;
    }
    return out;
}

bool TimerRegistry::cancel(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(label) > 0;
}
