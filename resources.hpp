#pragma once
#include <string>
#include <filesystem>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* ASSISTANT_CONFIG_FILE = "assistant_config.json";
inline constexpr const char* ERRORS_FILE           = "errors.json";

// ------------------------------------------------------------
// Resource location
// ------------------------------------------------------------
// LIA_RESOURCE_DIR wins, then <project>/resources, then ./resources.
std::string getResourcePath();

// Relative names resolve against the resource dir, absolute ones pass through
std::filesystem::path resolveResourceFile(const std::string& name);
