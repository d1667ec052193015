#pragma once
#include <ctime>
#include <optional>
#include <string>

// ------------------------------------------------------------
// Free-text duration / time / date helpers (pure, no state)
// ------------------------------------------------------------
namespace timeparse {

    // "1 hour 30 minutes" → 5400, "45" → 2700 (bare number = minutes), "" → 0
    int parseDuration(const std::string& phrase);

    // Remaining time as "1h 5m 0s" / "5m 0s" / "42s"
    std::string formatRemaining(int seconds);

    // "7am" → "07:00", "7:30 pm" → "19:30", "14:30" → "14:30".
    // Text that does not look like a clock time comes back trimmed and lowercased.
    std::string normalizeTime(const std::string& text);

    // "today" / "" / "tomorrow" / "friday" / "next friday" / "2025-12-25" → YYYY-MM-DD.
    // Unrecognized text falls back to today.
    std::string parseDate(const std::string& text, const std::tm& today);
    std::string parseDate(const std::string& text);

    // "YYYY-MM-DD HH:MM:SS" shifted by minutes; nullopt if start does not parse
    std::optional<std::string> addMinutes(const std::string& dateTime, int minutes);

    // Local calendar date helpers
    std::tm localToday();
    std::string formatDate(const std::tm& day);
}
