#include "ollama_backend.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

OllamaBackend::OllamaBackend(std::string baseUrl, int loadTimeoutMs)
    : baseUrl_(std::move(baseUrl)), loadTimeoutMs_(loadTimeoutMs) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

// =========================================================
// Load (warm up with a single predicted token)
// =========================================================
bool OllamaBackend::load(const std::string& model, const std::string& keepAlive) {
    LOG_DEBUG("Ollama", "load model=" + model + " keep_alive=" + keepAlive);

    auto resp = cpr::Post(
        cpr::Url{ baseUrl_ + "/api/generate" },
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{ nlohmann::json{
            {"model", model},
            {"prompt", "hi"},
            {"stream", false},
            {"keep_alive", keepAlive},
            {"options", {{"num_predict", 1}}}
        }.dump() },
        cpr::Timeout{ loadTimeoutMs_ }
    );

    if (resp.status_code != 200) {
        LOG_ERROR("Ollama", "Failed to load " + model + ": " +
                            std::to_string(resp.status_code) + " " +
                            (resp.error ? resp.error.message : resp.text));
        return false;
    }
    return true;
}

// =========================================================
// Unload (keep_alive 0 evicts immediately)
// =========================================================
bool OllamaBackend::unload(const std::string& model) {
    LOG_DEBUG("Ollama", "unload model=" + model);

    auto resp = cpr::Post(
        cpr::Url{ baseUrl_ + "/api/generate" },
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{ nlohmann::json{{"model", model}, {"keep_alive", 0}}.dump() },
        cpr::Timeout{ 10000 }
    );

    if (resp.status_code != 200) {
        throw std::runtime_error("unload of " + model + " returned " +
                                 std::to_string(resp.status_code));
    }
    return true;
}

// =========================================================
// Running models
// =========================================================
std::vector<std::string> OllamaBackend::listRunning() {
    std::vector<std::string> names;

    auto resp = cpr::Get(cpr::Url{ baseUrl_ + "/api/ps" }, cpr::Timeout{ 2000 });
    if (resp.status_code != 200) {
        LOG_DEBUG("Ollama", "/api/ps unavailable (" + std::to_string(resp.status_code) + ")");
        return names;
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded() || !j.contains("models") || !j["models"].is_array()) {
        return names;
    }

    for (const auto& m : j["models"]) {
        std::string name = m.value("name", m.value("model", ""));
        if (!name.empty()) names.push_back(std::move(name));
    }
    return names;
}
