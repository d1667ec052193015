#pragma once
#include <string>
#include <vector>

// ------------------------------------------------------------
// ModelBackend: the model-serving process (blocking calls)
// ------------------------------------------------------------
class ModelBackend {
public:
    virtual ~ModelBackend() = default;

    // Load and keep resident for roughly keepAlive ("5m", "30s", ...)
    virtual bool load(const std::string& model, const std::string& keepAlive) = 0;
    virtual bool unload(const std::string& model) = 0;

    // Names of models currently resident
    virtual std::vector<std::string> listRunning() = 0;
};
