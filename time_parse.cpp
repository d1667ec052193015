#include "time_parse.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>

namespace timeparse {

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

// Digit runs longer than 9 chars are clamped instead of overflowing stoll
static long long toCount(const std::string& digits) {
    if (digits.size() > 9) return 999999999LL;
    return std::stoll(digits);
}

// mktime normalizes out-of-range fields (day 32 → next month)
static std::tm normalized(std::tm day) {
    day.tm_isdst = -1;
    std::mktime(&day);
    return day;
}

static std::tm shiftDays(const std::tm& day, int days) {
    std::tm out = day;
    out.tm_hour = 12;   // stay clear of DST edges
    out.tm_min = 0;
    out.tm_sec = 0;
    out.tm_mday += days;
    return normalized(out);
}

// ------------------------------------------------------------
// Durations
// ------------------------------------------------------------
int parseDuration(const std::string& phrase) {
    const std::string text = lowerTrim(phrase);
    if (text.empty()) return 0;

    static const std::array<std::pair<std::regex, int>, 3> units = {{
        { std::regex(R"((\d+)\s*h(?:our)?s?)"),            3600 },
        { std::regex(R"((\d+)\s*m(?:in(?:ute)?s?)?)"),     60   },
        { std::regex(R"((\d+)\s*s(?:ec(?:ond)?s?)?)"),     1    },
    }};

    long long total = 0;
    for (const auto& [pattern, multiplier] : units) {
        for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
            total += toCount((*it)[1].str()) * multiplier;
        }
    }

    // No unit anywhere: first bare number counts as minutes
    if (total == 0) {
        static const std::regex number(R"(\d+)");
        std::smatch m;
        if (std::regex_search(text, m, number)) {
            total = toCount(m[0].str()) * 60;
        }
    }

    if (total > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(total);
}

std::string formatRemaining(int seconds) {
    if (seconds < 0) seconds = 0;
    int hours = seconds / 3600;
    int mins  = (seconds % 3600) / 60;
    int secs  = seconds % 60;

    std::ostringstream oss;
    if (hours) {
        oss << hours << "h " << mins << "m " << secs << "s";
    } else if (mins) {
        oss << mins << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }
    return oss.str();
}

// ------------------------------------------------------------
// Clock times
// ------------------------------------------------------------
std::string normalizeTime(const std::string& text) {
    const std::string t = lowerTrim(text);

    static const std::regex clock(R"(^(\d{1,2}):?(\d{2})?\s*(am|pm)?)");
    std::smatch m;
    if (!std::regex_search(t, m, clock)) return t;

    int hour   = std::stoi(m[1].str());
    int minute = m[2].matched ? std::stoi(m[2].str()) : 0;
    const std::string period = m[3].matched ? m[3].str() : "";

    if (period == "pm" && hour < 12) {
        hour += 12;
    } else if (period == "am" && hour == 12) {
        hour = 0;
    }

    if (hour > 23 || minute > 59) return t;

    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << hour << ":"
        << std::setw(2) << std::setfill('0') << minute;
    return oss.str();
}

// ------------------------------------------------------------
// Dates
// ------------------------------------------------------------
std::tm localToday() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    return tm;
}

std::string formatDate(const std::tm& day) {
    std::ostringstream oss;
    oss << std::put_time(&day, "%Y-%m-%d");
    return oss.str();
}

static std::optional<std::tm> parseIsoDate(const std::string& text) {
    static const std::regex iso(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch m;
    if (!std::regex_match(text, m, iso)) return std::nullopt;

    std::tm day{};
    day.tm_year = std::stoi(m[1].str()) - 1900;
    day.tm_mon  = std::stoi(m[2].str()) - 1;
    day.tm_mday = std::stoi(m[3].str());
    day.tm_hour = 12;

    // Reject dates mktime had to roll over (2025-02-30 etc.)
    std::tm check = normalized(day);
    if (check.tm_year != day.tm_year || check.tm_mon != day.tm_mon || check.tm_mday != day.tm_mday)
        return std::nullopt;
    return check;
}

std::string parseDate(const std::string& text, const std::tm& today) {
    const std::string d = lowerTrim(text);

    if (auto explicitDay = parseIsoDate(d)) {
        return formatDate(*explicitDay);
    }

    if (d.empty() || d == "today") return formatDate(today);
    if (d == "tomorrow") return formatDate(shiftDays(today, 1));

    static const std::array<const char*, 7> days = {
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
    };
    const int currentDay = (normalized(today).tm_wday + 6) % 7;   // Monday = 0

    for (int i = 0; i < static_cast<int>(days.size()); ++i) {
        if (d.find(days[i]) == std::string::npos) continue;

        int ahead = i - currentDay;
        if (ahead <= 0) ahead += 7;
        if (d.find("next") != std::string::npos) ahead += 7;
        return formatDate(shiftDays(today, ahead));
    }

    return formatDate(today);
}

std::string parseDate(const std::string& text) {
    return parseDate(text, localToday());
}

std::optional<std::string> addMinutes(const std::string& dateTime, int minutes) {
    std::tm start{};
    std::istringstream in(dateTime);
    in >> std::get_time(&start, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) return std::nullopt;

    start.tm_min += minutes;
    std::tm end = normalized(start);

    std::ostringstream out;
    out << std::put_time(&end, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace timeparse
