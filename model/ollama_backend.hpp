#pragma once
#include "model_backend.hpp"

#include <string>

/// ModelBackend over the Ollama HTTP API.
/// load   → POST /api/generate with a one-token prompt and keep_alive
/// unload → POST /api/generate with keep_alive 0
/// list   → GET  /api/ps
class OllamaBackend : public ModelBackend {
public:
    explicit OllamaBackend(std::string baseUrl, int loadTimeoutMs = 120000);

    bool load(const std::string& model, const std::string& keepAlive) override;
    bool unload(const std::string& model) override;
    std::vector<std::string> listRunning() override;

private:
    std::string baseUrl_;
    int loadTimeoutMs_;
};
