#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// Centralized config + error catalog bootstrap for LIA
namespace bootstrap_config {

    // Load assistant_config.json and errors.json from the resource dir.
    // Returns the effective assistant config.
    nlohmann::json initAll(const std::filesystem::path& resourceDir);

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name);

    // Recursively fill missing or mistyped keys; returns true if anything changed
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultAssistant();
}
