#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

// Trim whitespace from both ends
std::string trim(const std::string& s);

std::string toLower(std::string s);

// Join with a separator ("a, b, c")
std::string joinStrings(const std::vector<std::string>& parts, const std::string& sep);

// Cut to at most maxBytes without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& s, std::size_t maxBytes);

// ------------------------------------------------------------
// Parameter access. Values arrive loosely typed: numbers and
// strings are accepted interchangeably, null counts as absent.
// ------------------------------------------------------------
std::string paramString(const nlohmann::json& params, const std::string& key,
                        const std::string& fallback = "");
int paramInt(const nlohmann::json& params, const std::string& key, int fallback);

std::optional<std::string> optionalString(const nlohmann::json& params, const std::string& key);
std::optional<int> optionalInt(const nlohmann::json& params, const std::string& key);
