#include "resources.hpp"
#include "logger.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
    if (const char* env = std::getenv("LIA_RESOURCE_DIR"); env && *env) {
        LOG_DEBUG("Resources", std::string("Using LIA_RESOURCE_DIR: ") + env);
        return env;
    }

    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    // Prefer project resources first
    if (fs::exists(projectPath)) {
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    // Nothing yet: bootstrap creates ./resources
    LOG_DEBUG("Resources", "No resources dir, will create: " + buildPath.string());
    return buildPath.string();
}

fs::path resolveResourceFile(const std::string& name) {
    fs::path p(name);
    if (p.is_absolute()) return p;
    return fs::path(getResourcePath()) / p;
}
