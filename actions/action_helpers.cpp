#include "action_helpers.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string joinStrings(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string truncateUtf8(const std::string& s, std::size_t maxBytes) {
    if (s.size() <= maxBytes) return s;

    std::size_t cut = maxBytes;
    // Step back over continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

// ------------------------------------------------------------
// Parameters
// ------------------------------------------------------------
std::optional<std::string> optionalString(const nlohmann::json& params, const std::string& key) {
    if (!params.is_object()) return std::nullopt;
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return std::nullopt;

    if (it->is_string())          return it->get<std::string>();
    if (it->is_number_integer())  return std::to_string(it->get<long long>());
    if (it->is_number_unsigned()) return std::to_string(it->get<unsigned long long>());
    if (it->is_boolean())         return it->get<bool>() ? "true" : "false";
    return it->dump();
}

std::string paramString(const nlohmann::json& params, const std::string& key,
                        const std::string& fallback) {
    return optionalString(params, key).value_or(fallback);
}

std::optional<int> optionalInt(const nlohmann::json& params, const std::string& key) {
    if (!params.is_object()) return std::nullopt;
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return std::nullopt;

    constexpr double lo = std::numeric_limits<int>::min();
    constexpr double hi = std::numeric_limits<int>::max();

    if (it->is_number()) {
        const double v = it->get<double>();
        if (!std::isfinite(v)) return std::nullopt;
        return static_cast<int>(std::clamp(std::trunc(v), lo, hi));
    }

    if (it->is_string()) {
        const std::string text = trim(it->get<std::string>());
        if (text.empty()) return std::nullopt;
        try {
            std::size_t used = 0;
            const double v = std::stod(text, &used);
            if (used != text.size() || !std::isfinite(v)) return std::nullopt;
            return static_cast<int>(std::clamp(std::trunc(v), lo, hi));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

int paramInt(const nlohmann::json& params, const std::string& key, int fallback) {
    return optionalInt(params, key).value_or(fallback);
}
